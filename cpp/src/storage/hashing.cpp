#include "sqlcas/storage/hashing.hpp"

#include <cerrno>
#include <cstddef>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

#include <blake3.h>

namespace sqlcas::storage {
    using sqlcas::core::make_status;
    using sqlcas::core::StatusCode;
    using sqlcas::core::StatusDomain;

    sqlcas::core::Status hash_compute(BufferView data, sqlcas::core::Hash256* out) noexcept {
        if (out == nullptr){
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return sqlcas::core::ok_status();
    }

    sqlcas::core::Status hash_file(const char* path, std::size_t block_size, sqlcas::core::Hash256* out) noexcept {
        if (path == nullptr || out == nullptr || block_size == 0 ||
            block_size > sqlcas::core::kMaxHashBlockSize) {
            return make_status(StatusDomain::Storage, StatusCode::Invalid);
        }

        int fd = open(path, O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            const int err = errno;
            if (err == ENOENT) {
                return make_status(StatusDomain::Storage, StatusCode::NotFound, static_cast<sqlcas::core::u32>(err));
            }
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<sqlcas::core::u32>(err));
        }

        std::vector<u8> block(block_size);
        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        while (true) {
            ssize_t n = read(fd, block.data(), block.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                close(fd);
                return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<sqlcas::core::u32>(err));
            }
            if (n == 0) break;  // EOF
            blake3_hasher_update(&hasher, block.data(), static_cast<size_t>(n));
        }
        close(fd);

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return sqlcas::core::ok_status();
    }

    std::string hash_to_hex(const sqlcas::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(h.b.size() * 2);
        for (u8 b : h.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }
} // namespace sqlcas::storage
