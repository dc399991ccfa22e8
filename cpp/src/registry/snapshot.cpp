#include "sqlcas/registry/snapshot.hpp"

#include <cerrno>
#include <cstdio>
#include <string>

#include <nlohmann/json.hpp>

#include "sqlcas/core/types.hpp"

namespace sqlcas::registry {

using namespace sqlcas::core;
using json = nlohmann::json;

namespace {
    [[nodiscard]] bool is_hex_digest(const std::string& s) noexcept {
        if (s.size() != kDigestHexLen) return false;
        for (char c : s) {
            const bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
            if (!hex) return false;
        }
        return true;
    }
}

std::string snapshot_to_json(const RegistryMap& dbs) {
    json databases = json::object();
    for (const auto& [name, rec] : dbs) {
        json tables = json::object();
        for (const auto& [table, count] : rec.tables) {
            tables[table] = count;
        }
        databases[name] = {
            {"hash", rec.digest},
            {"file", rec.file_path},
            {"tables", std::move(tables)},
        };
    }

    json doc = {
        {"version", kSnapshotVersion},
        {"databases", std::move(databases)},
    };
    // registry_scan only admits UTF-8 names; replace keeps dump() from throwing
    // on a hand-built map.
    return doc.dump(4, ' ', false, json::error_handler_t::replace) + "\n";
}

Status snapshot_from_json(std::string_view text, RegistryMap* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    const json doc = json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return make_status(StatusDomain::Registry, StatusCode::Corrupt);
    }

    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_unsigned() || version->get<u32>() != kSnapshotVersion) {
        return make_status(StatusDomain::Registry, StatusCode::Corrupt);
    }

    auto databases = doc.find("databases");
    if (databases == doc.end() || !databases->is_object()) {
        return make_status(StatusDomain::Registry, StatusCode::Corrupt);
    }

    RegistryMap dbs;
    for (const auto& [name, entry] : databases->items()) {
        if (!entry.is_object()) {
            return make_status(StatusDomain::Registry, StatusCode::Corrupt);
        }
        auto hash = entry.find("hash");
        auto file = entry.find("file");
        auto tables = entry.find("tables");
        if (hash == entry.end() || !hash->is_string() ||
            file == entry.end() || !file->is_string() ||
            tables == entry.end() || !tables->is_object()) {
            return make_status(StatusDomain::Registry, StatusCode::Corrupt);
        }

        DatabaseRecord rec;
        rec.name = name;
        rec.digest = hash->get<std::string>();
        rec.file_path = file->get<std::string>();
        if (!is_hex_digest(rec.digest) || rec.file_path.empty()) {
            return make_status(StatusDomain::Registry, StatusCode::Corrupt);
        }
        for (const auto& [table, count] : tables->items()) {
            if (!count.is_number_integer()) {
                return make_status(StatusDomain::Registry, StatusCode::Corrupt);
            }
            rec.tables[table] = count.get<i64>();
        }
        dbs.emplace(name, std::move(rec));
    }

    *out = std::move(dbs);
    return ok_status();
}

Status snapshot_read(const char* path, RegistryMap* out) noexcept {
    if (!path || !out) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    FILE* f = std::fopen(path, "rb");
    if (!f) {
        const int err = errno;
        return make_status(StatusDomain::Registry,
                           err == ENOENT ? StatusCode::NotFound : StatusCode::Io,
                           static_cast<u32>(err));
    }

    std::string text;
    char buf[16 * 1024];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
        text.append(buf, n);
    }
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed) {
        return make_status(StatusDomain::Registry, StatusCode::Io);
    }

    return snapshot_from_json(text, out);
}

Status snapshot_write(const char* path, const RegistryMap& dbs) noexcept {
    if (!path || *path == '\0') {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    const std::string text = snapshot_to_json(dbs);
    const std::string tmp_path = std::string(path) + ".tmp";

    FILE* f = std::fopen(tmp_path.c_str(), "wb");
    if (!f) {
        return make_status(StatusDomain::Registry, StatusCode::Io, static_cast<u32>(errno));
    }

    const size_t written = std::fwrite(text.data(), 1, text.size(), f);
    const bool close_failed = std::fclose(f) != 0;
    if (written != text.size() || close_failed) {
        std::remove(tmp_path.c_str());
        return make_status(StatusDomain::Registry, StatusCode::Io);
    }

    if (std::rename(tmp_path.c_str(), path) != 0) {
        const int err = errno;
        std::remove(tmp_path.c_str());
        return make_status(StatusDomain::Registry, StatusCode::Io, static_cast<u32>(err));
    }
    return ok_status();
}

} // namespace sqlcas::registry
