#include "sqlcas/address/url.hpp"

namespace sqlcas::address {
    namespace {
        [[nodiscard]] bool is_unreserved(unsigned char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                   c == '_' || c == '.' || c == '-' || c == '~';
        }

        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    std::string percent_encode(std::string_view in, bool plus_for_space) {
        static const char hex[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(in.size());
        for (char ch : in) {
            const auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c)) {
                out.push_back(ch);
            } else if (c == ' ' && plus_for_space) {
                out.push_back('+');
            } else {
                out.push_back('%');
                out.push_back(hex[(c >> 4) & 0xF]);
                out.push_back(hex[c & 0xF]);
            }
        }
        return out;
    }

    std::string percent_decode(std::string_view in, bool plus_is_space) {
        std::string out;
        out.reserve(in.size());
        for (std::size_t i = 0; i < in.size(); ++i) {
            const char c = in[i];
            if (c == '+' && plus_is_space) {
                out.push_back(' ');
                continue;
            }
            if (c == '%' && i + 2 < in.size()) {
                const int hi = hex_value(in[i + 1]);
                const int lo = hex_value(in[i + 2]);
                if (hi >= 0 && lo >= 0) {
                    out.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            out.push_back(c);
        }
        return out;
    }

    std::vector<QueryParam> parse_query_string(std::string_view query) {
        std::vector<QueryParam> params;
        while (!query.empty()) {
            const std::size_t amp = query.find('&');
            const std::string_view pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
            if (pair.empty()) {
                continue;
            }
            const std::size_t eq = pair.find('=');
            QueryParam p;
            p.name = percent_decode(pair.substr(0, eq), true);
            if (eq != std::string_view::npos) {
                p.value = percent_decode(pair.substr(eq + 1), true);
            }
            params.push_back(std::move(p));
        }
        return params;
    }

    void split_target(std::string_view target, std::string_view* path, std::string_view* query) noexcept {
        const std::size_t q = target.find('?');
        if (path) *path = target.substr(0, q);
        if (query) *query = q == std::string_view::npos ? std::string_view{} : target.substr(q + 1);
    }
} // namespace sqlcas::address
