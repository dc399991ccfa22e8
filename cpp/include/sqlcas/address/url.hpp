#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sqlcas::address {
    // Percent-encodes everything outside A-Z a-z 0-9 _ . - ~ as %XX
    // (uppercase). With `plus_for_space`, a space becomes '+'.
    [[nodiscard]] std::string percent_encode(std::string_view in, bool plus_for_space);

    // Reverses percent_encode. Malformed escapes are kept literally.
    [[nodiscard]] std::string percent_decode(std::string_view in, bool plus_is_space);

    struct QueryParam {
        std::string name;
        std::string value;
    };

    // Splits "a=1&b=x+y" into decoded pairs; '+' decodes to space.
    [[nodiscard]] std::vector<QueryParam> parse_query_string(std::string_view query);

    // Splits a request target into path and query ("/a/b?x=1").
    void split_target(std::string_view target, std::string_view* path, std::string_view* query) noexcept;
} // namespace sqlcas::address
