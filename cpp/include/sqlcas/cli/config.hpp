#pragma once

#include <string>

#include "sqlcas/cli/options.hpp"
#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/types.hpp"

namespace sqlcas::cli {
    using u16 = sqlcas::core::u16;

    inline constexpr const char* kDefaultSnapshotName = "build-metadata.json";
    inline constexpr const char* kDefaultHost = "0.0.0.0";
    inline constexpr u16 kDefaultPort = 8006;

    struct AppConfig {
        std::string root{"."};
        std::string snapshot_path;  // defaults to <root>/build-metadata.json
        std::string host{kDefaultHost};
        u16 port{kDefaultPort};
        bool verbose{false};
        bool help{false};
    };

    // Same shape as std::getenv; injectable for tests.
    using EnvLookup = const char* (*)(const char*);

    // Defaults, then SQLCAS_ROOT / SQLCAS_SNAPSHOT / SQLCAS_HOST / SQLCAS_PORT,
    // then parsed options. Invalid (with `detail`) for an out-of-range or
    // non-numeric port.
    sqlcas::core::Status load_config(EnvLookup env,
        const ParsedOptions& opts,
        AppConfig* out,
        std::string* detail) noexcept;

} // namespace sqlcas::cli
