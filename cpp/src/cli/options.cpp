#include "sqlcas/cli/options.hpp"

#include <charconv>
#include <cstring>

namespace sqlcas::cli {
    using sqlcas::core::Status;

    namespace {
        [[nodiscard]] Status invalid() noexcept {
            return sqlcas::core::make_status(sqlcas::core::StatusDomain::Cli, sqlcas::core::StatusCode::Invalid);
        }

        // Matches either the long name (`name_len` chars of `name`) or, when
        // `name_len` is 0, the short name `c`.
        [[nodiscard]] const OptionSpec* find_spec(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, size_t name_len, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (name_len > 0) {
                    if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                        std::strncmp(s.long_name, name, name_len) == 0) {
                        return &s;
                    }
                } else if (c != '\0' && s.short_name == c) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] bool parse_i64(const char* s, i64* out) noexcept {
            if (out == nullptr || s == nullptr || *s == '\0') {
                return false;
            }
            const char* end = s + std::strlen(s);
            i64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return sqlcas::core::ok_status();
        }

        // Converts `value` according to `spec` and records it.
        [[nodiscard]] Status store_value(const OptionSpec& spec, const char* value, ParsedOptions* out) noexcept {
            ParsedOption opt{};
            opt.id = spec.id;
            opt.type = spec.type;
            switch (spec.type) {
                case OptionType::Flag:
                    if (value != nullptr) return invalid();
                    opt.value.boolv = 1;
                    break;
                case OptionType::String:
                    opt.value.str = value;
                    break;
                case OptionType::I64:
                    if (!parse_i64(value, &opt.value.i64v)) return invalid();
                    break;
                default:
                    return invalid();
            }
            return push_option(out, opt);
        }
    } // namespace

    Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const size_t name_len = eq ? static_cast<size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_spec(specs, spec_count, name, name_len, '\0');
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_spec(specs, spec_count, nullptr, 0, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }
            ++i;

            const char* value = inline_value;
            if (spec->type != OptionType::Flag && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return invalid();
                }
                value = args.argv[i++];
            }

            const Status s = store_value(*spec, value, out);
            if (!sqlcas::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return sqlcas::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace sqlcas::cli
