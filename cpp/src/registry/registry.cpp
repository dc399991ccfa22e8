#include "sqlcas/registry/registry.hpp"

#include <algorithm>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "sqlcas/core/types.hpp"
#include "sqlcas/db/db.hpp"
#include "sqlcas/storage/hashing.hpp"

namespace sqlcas::registry {

using namespace sqlcas::core;
namespace fs = std::filesystem;

namespace {
    struct Candidate {
        std::string stem;
        std::string file_name;
    };

    // Names end up as JSON object keys in the snapshot; anything that would
    // not survive that unchanged is refused.
    [[nodiscard]] bool is_valid_utf8(std::string_view s) noexcept {
        size_t i = 0;
        while (i < s.size()) {
            const auto c = static_cast<unsigned char>(s[i]);
            size_t len = 0;
            u32 cp = 0;
            if (c < 0x80) {
                ++i;
                continue;
            } else if (c >= 0xC2 && c <= 0xDF) {
                len = 2;
                cp = c & 0x1F;
            } else if (c >= 0xE0 && c <= 0xEF) {
                len = 3;
                cp = c & 0x0F;
            } else if (c >= 0xF0 && c <= 0xF4) {
                len = 4;
                cp = c & 0x07;
            } else {
                return false;
            }
            if (s.size() - i < len) return false;
            for (size_t k = 1; k < len; ++k) {
                const auto cc = static_cast<unsigned char>(s[i + k]);
                if ((cc & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (cc & 0x3F);
            }
            if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
                (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                return false;
            }
            i += len;
        }
        return true;
    }

    [[nodiscard]] Status list_candidates(const fs::path& root, std::vector<Candidate>* out, BuildReport* report) {
        std::error_code ec;
        fs::directory_iterator it(root, ec);
        if (ec) {
            if (report) report->detail = "cannot read directory " + root.string() + ": " + ec.message();
            return make_status(StatusDomain::Registry,
                               ec == std::errc::no_such_file_or_directory ? StatusCode::NotFound : StatusCode::Io,
                               static_cast<u32>(ec.value()));
        }

        std::vector<fs::path> entries;
        for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_regular_file(type_ec)) {
                entries.push_back(it->path());
            }
        }
        if (ec) {
            if (report) report->detail = "cannot read directory " + root.string() + ": " + ec.message();
            return make_status(StatusDomain::Registry, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        std::sort(entries.begin(), entries.end());

        // Pattern order first, then file name order within a pattern.
        for (const char* ext : kDatabaseExtensions) {
            for (const fs::path& p : entries) {
                if (p.extension() == ext) {
                    out->push_back(Candidate{p.stem().string(), p.filename().string()});
                }
            }
        }
        return ok_status();
    }
}

Status registry_scan(const RegistryConfig& cfg, RegistryMap* out, BuildReport* report) noexcept {
    if (!out) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    const fs::path root = cfg.root.empty() ? fs::path(".") : fs::path(cfg.root);

    std::vector<Candidate> candidates;
    Status s = list_candidates(root, &candidates, report);
    if (!is_ok(s)) {
        return s;
    }

    RegistryMap dbs;
    for (const Candidate& c : candidates) {
        if (!is_valid_utf8(c.file_name)) {
            if (report) report->detail = "file name is not valid UTF-8: " + c.file_name;
            return make_status(StatusDomain::Registry, StatusCode::Invalid);
        }
        if (dbs.count(c.stem) != 0) {
            if (report) report->detail = "Multiple files with same stem " + c.stem;
            return make_status(StatusDomain::Registry, StatusCode::Conflict);
        }
        // Placeholder so a later duplicate is caught before any hashing work.
        dbs[c.stem].name = c.stem;
    }

    for (const Candidate& c : candidates) {
        const std::string path = (root / c.file_name).string();

        Hash256 digest{};
        s = sqlcas::storage::hash_file(path.c_str(), kHashBlockSize, &digest);
        if (!is_ok(s)) {
            if (report) report->detail = "cannot fingerprint " + path;
            return s;
        }

        sqlcas::db::TableCounts tables;
        s = sqlcas::db::db_introspect(path.c_str(), &tables);
        if (!is_ok(s)) {
            if (report) report->detail = "cannot introspect " + path;
            return s;
        }
        for (const auto& [table, count] : tables) {
            if (!is_valid_utf8(table)) {
                if (report) report->detail = "table name is not valid UTF-8 in " + path;
                return make_status(StatusDomain::Registry, StatusCode::Invalid);
            }
        }

        DatabaseRecord& rec = dbs[c.stem];
        rec.digest = sqlcas::storage::hash_to_hex(digest);
        rec.file_path = c.file_name;
        rec.tables = std::move(tables);
    }

    *out = std::move(dbs);
    return ok_status();
}

// ============================================================================
// Registry
// ============================================================================

Registry::Registry(RegistryConfig cfg)
    : cfg_(std::move(cfg)),
      current_(std::make_shared<const RegistryMap>()) {}

Status Registry::build(bool force, BuildReport* report) noexcept {
    std::lock_guard<std::mutex> build_lock(build_mutex_);

    BuildReport local;
    BuildReport& rep = report ? *report : local;
    rep = BuildReport{};

    if (!force && !cfg_.snapshot_path.empty()) {
        RegistryMap loaded;
        const Status s = snapshot_read(cfg_.snapshot_path.c_str(), &loaded);
        if (is_ok(s)) {
            rep.reused_snapshot = true;
            rep.database_count = static_cast<u32>(loaded.size());
            publish(std::move(loaded));
            return ok_status();
        }
        // Anything other than a usable snapshot means a fresh scan.
    }

    RegistryMap scanned;
    Status s = registry_scan(cfg_, &scanned, &rep);
    if (!is_ok(s)) {
        return s;
    }

    if (!cfg_.snapshot_path.empty()) {
        s = snapshot_write(cfg_.snapshot_path.c_str(), scanned);
        if (!is_ok(s)) {
            rep.detail = "cannot write snapshot " + cfg_.snapshot_path;
            return s;
        }
    }

    rep.database_count = static_cast<u32>(scanned.size());
    publish(std::move(scanned));
    return ok_status();
}

void Registry::publish(RegistryMap dbs) {
    auto next = std::make_shared<const RegistryMap>(std::move(dbs));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(next);
}

RegistrySnapshot Registry::snapshot() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

Status Registry::lookup(std::string_view name, DatabaseRecord* out) const noexcept {
    if (!out) {
        return make_status(StatusDomain::Registry, StatusCode::Invalid);
    }

    const RegistrySnapshot snap = snapshot();
    auto it = snap->find(std::string(name));
    if (it == snap->end()) {
        return make_status(StatusDomain::Registry, StatusCode::NotFound);
    }
    *out = it->second;
    return ok_status();
}

std::string Registry::path_for(const DatabaseRecord& rec) const {
    if (cfg_.root.empty()) {
        return rec.file_path;
    }
    return (fs::path(cfg_.root) / rec.file_path).string();
}

} // namespace sqlcas::registry
