#include "sqlcas/cli/commands.hpp"

#include <cstring>

namespace sqlcas::cli {
    sqlcas::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandId default_id,
        CommandInvocation* out,
        u32* consumed) noexcept {
        using sqlcas::core::make_status;
        using sqlcas::core::StatusCode;
        using sqlcas::core::StatusDomain;

        if (out == nullptr || consumed == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = args;

        if (args.argc > 0 && args.argv == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return make_status(StatusDomain::Cli, StatusCode::Invalid);
        }

        const char* cmd = args.argc > 0 ? args.argv[0] : nullptr;
        if (cmd == nullptr || cmd[0] == '-') {
            out->id = default_id;
            return sqlcas::core::ok_status();
        }

        for (u32 i = 0; i < spec_count; ++i) {
            const CommandSpec& s = specs[i];
            if (s.name != nullptr && std::strcmp(s.name, cmd) == 0) {
                out->id = s.id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return sqlcas::core::ok_status();
            }
        }
        return make_status(StatusDomain::Cli, StatusCode::Invalid);
    }
} // namespace sqlcas::cli
