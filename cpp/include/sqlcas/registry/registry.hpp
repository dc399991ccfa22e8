#pragma once

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/models.hpp"
#include "sqlcas/registry/snapshot.hpp"

namespace sqlcas::registry {

// Discovery patterns, in scan order.
inline constexpr std::array<const char*, 3> kDatabaseExtensions = {".db", ".sqlite", ".sqlite3"};

struct RegistryConfig {
    std::string root;           // directory scanned for database files
    std::string snapshot_path;  // persisted registry; empty disables persistence
};

struct BuildReport {
    bool reused_snapshot{false};
    u32 database_count{0};
    std::string detail;         // failing file or stem when build() fails
};

// Immutable view of one complete registry generation.
using RegistrySnapshot = std::shared_ptr<const RegistryMap>;

// Scans cfg.root, fingerprints and introspects every matching file.
// Conflict if two files share a stem, Invalid if a file or table name is not
// valid UTF-8; the first failing file aborts the scan.
sqlcas::core::Status registry_scan(const RegistryConfig& cfg, RegistryMap* out, BuildReport* report) noexcept;

// Process-wide map from logical database name to DatabaseRecord.
//
// build() publishes a new generation by swapping one pointer, so readers see
// either the previous complete mapping or the new one. A failed build leaves
// the previous generation in place. Builds are serialized.
class Registry {
public:
    explicit Registry(RegistryConfig cfg);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Without `force`, an existing snapshot file is trusted verbatim: files
    // that changed since it was written stay invisible until a forced build.
    // A missing, unreadable or corrupt snapshot falls back to a full scan.
    [[nodiscard]] sqlcas::core::Status build(bool force, BuildReport* report) noexcept;

    [[nodiscard]] sqlcas::core::Status lookup(std::string_view name, sqlcas::core::DatabaseRecord* out) const noexcept;

    [[nodiscard]] RegistrySnapshot snapshot() const noexcept;

    // Absolute or root-relative path of the record's file.
    [[nodiscard]] std::string path_for(const sqlcas::core::DatabaseRecord& rec) const;

    [[nodiscard]] const RegistryConfig& config() const noexcept { return cfg_; }

private:
    void publish(RegistryMap dbs);

    RegistryConfig cfg_;
    std::mutex build_mutex_;
    mutable std::mutex mutex_;  // guards current_
    RegistrySnapshot current_;
};

} // namespace sqlcas::registry
