#include "sqlcas/address/resolver.hpp"

#include "sqlcas/address/url.hpp"

namespace sqlcas::address {

using namespace sqlcas::core;

std::string canonical_path(const CanonicalAddress& addr) {
    std::string out;
    out.reserve(addr.name.size() + addr.hash_prefix.size() + 2);
    out.push_back('/');
    out += percent_encode(addr.name, false);
    out.push_back('-');
    out += addr.hash_prefix;
    return out;
}

Status resolve_address(const sqlcas::registry::RegistryMap& dbs,
                       std::string_view db_segment,
                       const std::string* table,
                       Resolution* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Address, StatusCode::Invalid);
    }
    *out = Resolution{};

    std::string name(db_segment);
    std::string claimed;
    bool has_claim = false;

    const std::size_t dash = db_segment.rfind('-');
    if (dash != std::string_view::npos) {
        std::string candidate(db_segment.substr(0, dash));
        if (dbs.count(candidate) != 0) {
            name = std::move(candidate);
            claimed = std::string(db_segment.substr(dash + 1));
            has_claim = true;
        }
    }

    auto it = dbs.find(name);
    if (it == dbs.end()) {
        out->message = "Database not found: " + name;
        return make_status(StatusDomain::Address, StatusCode::NotFound);
    }

    out->address.name = name;
    out->address.hash_prefix = hash_prefix_of(it->second);

    if (!has_claim || claimed != out->address.hash_prefix) {
        out->redirect = true;
        out->redirect_target = canonical_path(out->address);
        if (table) {
            out->redirect_target.push_back('/');
            out->redirect_target += percent_encode(*table, false);
        }
    }
    return ok_status();
}

} // namespace sqlcas::address
