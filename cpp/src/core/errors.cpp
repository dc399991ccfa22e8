#include "sqlcas/core/errors.hpp"

namespace sqlcas::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "ok";
            case StatusCode::Unknown: return "unknown";
            case StatusCode::Invalid: return "invalid";
            case StatusCode::NotFound: return "not found";
            case StatusCode::PermissionDenied: return "permission denied";
            case StatusCode::Conflict: return "conflict";
            case StatusCode::Busy: return "busy";
            case StatusCode::Corrupt: return "corrupt";
            case StatusCode::Io: return "i/o error";
            case StatusCode::Unsupported: return "unsupported";
            case StatusCode::Unavailable: return "unavailable";
        }
        return "?";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "core";
            case StatusDomain::Storage: return "storage";
            case StatusDomain::Db: return "db";
            case StatusDomain::Registry: return "registry";
            case StatusDomain::Address: return "address";
            case StatusDomain::Cli: return "cli";
            case StatusDomain::Bindings: return "bindings";
            case StatusDomain::Server: return "server";
        }
        return "?";
    }
} // namespace sqlcas::core
