#include "sqlcas/address/compound_key.hpp"

#include <algorithm>
#include <charconv>
#include <utility>

#include "sqlcas/address/url.hpp"

namespace sqlcas::address {

using namespace sqlcas::core;

Status primary_key_columns(const sqlcas::db::Connection& conn,
                           std::string_view table,
                           std::vector<std::string>* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Address, StatusCode::Invalid);
    }
    out->clear();

    std::vector<sqlcas::db::ColumnInfo> columns;
    Status s = sqlcas::db::db_table_columns(conn, table, &columns);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<sqlcas::db::ColumnInfo> pks;
    for (auto& col : columns) {
        if (col.pk > 0) {
            pks.push_back(std::move(col));
        }
    }
    std::sort(pks.begin(), pks.end(), [](const sqlcas::db::ColumnInfo& a, const sqlcas::db::ColumnInfo& b) {
        return a.pk < b.pk;
    });

    if (pks.empty()) {
        out->emplace_back(kRowidColumn);
        return ok_status();
    }
    for (auto& col : pks) {
        out->push_back(std::move(col.name));
    }
    return ok_status();
}

std::string value_to_key_text(const Value& v) {
    switch (v.type) {
        case ValueType::Integer:
            return std::to_string(v.i64v);
        case ValueType::Real: {
            char buf[64];
            auto r = std::to_chars(buf, buf + sizeof(buf), v.f64v);
            return std::string(buf, r.ptr);
        }
        case ValueType::Text:
        case ValueType::Blob:
            return v.bytes;
        case ValueType::Null:
            break;
    }
    return std::string();
}

std::string compound_key_encode(const CompoundKey& key) {
    std::string out;
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (i > 0) out.push_back(',');
        out += percent_encode(key[i], true);
    }
    return out;
}

Status compound_key_encode_row(const RowSet& rows,
                               std::size_t row,
                               const std::vector<std::string>& pk_columns,
                               std::string* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Address, StatusCode::Invalid);
    }
    if (row >= rows.rows.size()) {
        return make_status(StatusDomain::Address, StatusCode::Invalid);
    }

    CompoundKey key;
    key.reserve(pk_columns.size());
    for (const std::string& pk : pk_columns) {
        auto it = std::find(rows.columns.begin(), rows.columns.end(), pk);
        if (it == rows.columns.end()) {
            return make_status(StatusDomain::Address, StatusCode::NotFound);
        }
        const auto col = static_cast<std::size_t>(it - rows.columns.begin());
        key.push_back(value_to_key_text(rows.rows[row].at(col)));
    }

    *out = compound_key_encode(key);
    return ok_status();
}

CompoundKey compound_key_decode(std::string_view segment) {
    CompoundKey key;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = segment.find(',', start);
        key.push_back(percent_decode(segment.substr(start, comma - start), true));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return key;
}

} // namespace sqlcas::address
