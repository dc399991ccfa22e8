#pragma once

#include <cstddef>
#include <string>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/types.hpp"
#include "sqlcas/storage/buffer.hpp"

namespace sqlcas::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const sqlcas::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    sqlcas::core::Status hash_compute(BufferView data, sqlcas::core::Hash256* out) noexcept;

    // Streams `path` through BLAKE3 in `block_size` reads. Memory use is
    // bounded by block_size regardless of the file size.
    // Invalid for a zero block_size or one above kMaxHashBlockSize.
    // NotFound if the file does not exist, Io (errno in aux) on read failure.
    sqlcas::core::Status hash_file(const char* path,
        std::size_t block_size,
        sqlcas::core::Hash256* out) noexcept;

    [[nodiscard]] std::string hash_to_hex(const sqlcas::core::Hash256& h);

} // namespace sqlcas::storage
