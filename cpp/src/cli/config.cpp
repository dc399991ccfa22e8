#include "sqlcas/cli/config.hpp"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <utility>

namespace sqlcas::cli {
    using sqlcas::core::Status;

    namespace {
        [[nodiscard]] bool port_in_range(i64 v, u16* out) noexcept {
            if (v < 0 || v > 65535) {
                return false;
            }
            *out = static_cast<u16>(v);
            return true;
        }

        [[nodiscard]] const char* env_value(EnvLookup env, const char* name) noexcept {
            if (env == nullptr) return nullptr;
            const char* v = env(name);
            return (v != nullptr && *v != '\0') ? v : nullptr;
        }
    } // namespace

    Status load_config(EnvLookup env,
        const ParsedOptions& opts,
        AppConfig* out,
        std::string* detail) noexcept {
        using sqlcas::core::make_status;
        using sqlcas::core::StatusCode;
        using sqlcas::core::StatusDomain;

        if (out == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        AppConfig cfg;

        if (const char* v = env_value(env, "SQLCAS_ROOT")) cfg.root = v;
        if (const char* v = env_value(env, "SQLCAS_SNAPSHOT")) cfg.snapshot_path = v;
        if (const char* v = env_value(env, "SQLCAS_HOST")) cfg.host = v;
        if (const char* v = env_value(env, "SQLCAS_PORT")) {
            const char* end = v + std::strlen(v);
            i64 port = -1;
            auto r = std::from_chars(v, end, port, 10);
            if (r.ec != std::errc() || r.ptr != end || !port_in_range(port, &cfg.port)) {
                if (detail) *detail = std::string("SQLCAS_PORT is not a valid port: ") + v;
                return make_status(StatusDomain::Cli, StatusCode::Invalid);
            }
        }

        for (u32 i = 0; i < opts.len; ++i) {
            const ParsedOption& o = opts.data[i];
            switch (o.id) {
                case OptionId::Root:
                    cfg.root = o.value.str;
                    break;
                case OptionId::Snapshot:
                    cfg.snapshot_path = o.value.str;
                    break;
                case OptionId::Host:
                    cfg.host = o.value.str;
                    break;
                case OptionId::Port:
                    if (!port_in_range(o.value.i64v, &cfg.port)) {
                        if (detail) *detail = "--port must be between 0 and 65535";
                        return make_status(StatusDomain::Cli, StatusCode::Invalid);
                    }
                    break;
                case OptionId::Verbose:
                    cfg.verbose = true;
                    break;
                case OptionId::Help:
                    cfg.help = true;
                    break;
                case OptionId::None:
                    break;
            }
        }

        if (cfg.root.empty()) {
            cfg.root = ".";
        }
        if (cfg.snapshot_path.empty()) {
            cfg.snapshot_path = (std::filesystem::path(cfg.root) / kDefaultSnapshotName).string();
        }

        *out = std::move(cfg);
        return sqlcas::core::ok_status();
    }
} // namespace sqlcas::cli
