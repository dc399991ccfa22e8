#pragma once

#include <type_traits>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/types.hpp"

namespace sqlcas::cli {
    using u8 = sqlcas::core::u8;
    using u32 = sqlcas::core::u32;
    using i64 = sqlcas::core::i64;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
        I64 = 2,
    };

    enum class OptionId : u32 {
        None = 0,
        Root = 1,
        Snapshot = 2,
        Host = 3,
        Port = 4,
        Verbose = 5,
        Help = 6,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
        const char* help{nullptr};
    };

    union OptionValue {
        const char* str;
        i64 i64v;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-owned storage; parse_options fails with Invalid when it fills up.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // The options every command accepts.
    inline constexpr OptionSpec kOptionSpecs[] = {
        {OptionId::Root, OptionType::String, "root", 'r', "directory scanned for databases"},
        {OptionId::Snapshot, OptionType::String, "snapshot", 's', "persisted registry file"},
        {OptionId::Host, OptionType::String, "host", 'H', "address to listen on"},
        {OptionId::Port, OptionType::I64, "port", 'p', "port to listen on"},
        {OptionId::Verbose, OptionType::Flag, "verbose", 'v', "log every request"},
        {OptionId::Help, OptionType::Flag, "help", 'h', "show usage"},
    };
    inline constexpr u32 kOptionSpecCount = sizeof(kOptionSpecs) / sizeof(kOptionSpecs[0]);

    // Parses leading options ("--name value", "--name=value", "-n value",
    // "-nvalue", flags) until the first positional argument or "--".
    // `consumed` receives the number of argv entries used. Unknown options,
    // missing values and malformed integers are Invalid.
    sqlcas::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of `id`, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace sqlcas::cli
