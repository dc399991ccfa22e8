#pragma once

#include <string>
#include <string_view>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/models.hpp"
#include "sqlcas/registry/snapshot.hpp"

namespace sqlcas::address {

    struct Resolution {
        sqlcas::core::CanonicalAddress address;
        bool redirect{false};
        std::string redirect_target;  // "/<name>-<prefix>[/<table>]" when redirect
        std::string message;          // set on NotFound
    };

    // Maps a decoded database path segment ("name" or "name-prefix") to its
    // canonical address. A missing or stale prefix is not an error: the
    // result asks for a redirect and carries the target, with `table`
    // appended when one is given.
    sqlcas::core::Status resolve_address(const sqlcas::registry::RegistryMap& dbs,
        std::string_view db_segment,
        const std::string* table,
        Resolution* out) noexcept;

    // "/<name>-<prefix>" with the name percent-encoded.
    [[nodiscard]] std::string canonical_path(const sqlcas::core::CanonicalAddress& addr);

} // namespace sqlcas::address
