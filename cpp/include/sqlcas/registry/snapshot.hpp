#pragma once

#include <map>
#include <string>
#include <string_view>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/models.hpp"

namespace sqlcas::registry {
    using u32 = sqlcas::core::u32;

    // Logical database name -> record.
    using RegistryMap = std::map<std::string, sqlcas::core::DatabaseRecord>;

    // Bumped whenever the persisted layout changes; files carrying any other
    // version are rejected as Corrupt.
    inline constexpr u32 kSnapshotVersion = 1;

    // {"version": 1, "databases": {"<name>": {"hash", "file", "tables"}}}
    [[nodiscard]] std::string snapshot_to_json(const RegistryMap& dbs);

    // Corrupt on malformed JSON, missing fields or a version mismatch.
    sqlcas::core::Status snapshot_from_json(std::string_view text, RegistryMap* out) noexcept;

    // NotFound if the file does not exist.
    sqlcas::core::Status snapshot_read(const char* path, RegistryMap* out) noexcept;

    // Writes `<path>.tmp` and renames it over `path`, so readers never see a
    // half-written snapshot.
    sqlcas::core::Status snapshot_write(const char* path, const RegistryMap& dbs) noexcept;

} // namespace sqlcas::registry
