#pragma once

#include <type_traits>

#include "sqlcas/cli/options.hpp"
#include "sqlcas/core/errors.hpp"

namespace sqlcas::cli {
    using u32 = sqlcas::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Build = 2,
        Serve = 3,
        List = 4,
        Resolve = 5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        const char* usage{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    inline constexpr CommandSpec kCommandSpecs[] = {
        {CommandId::Build, "build", "rescan the root directory and rewrite the snapshot"},
        {CommandId::Serve, "serve", "build (reusing the snapshot) and serve over HTTP"},
        {CommandId::List, "list", "print the registry"},
        {CommandId::Resolve, "resolve", "resolve <name[-hash]> [table]"},
        {CommandId::Help, "help", "show usage"},
    };
    inline constexpr u32 kCommandSpecCount = sizeof(kCommandSpecs) / sizeof(kCommandSpecs[0]);

    // Matches argv[0] against `specs`. With no arguments, or when argv[0] is
    // an option, the invocation is `default_id` and nothing is consumed.
    // An unknown command name is Invalid.
    sqlcas::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandId default_id,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace sqlcas::cli
