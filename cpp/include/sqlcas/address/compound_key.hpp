#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/models.hpp"
#include "sqlcas/db/db.hpp"

namespace sqlcas::address {

    // Pseudo-column used to address rows of tables without a declared
    // primary key.
    inline constexpr const char* kRowidColumn = "rowid";

    // Primary-key columns of `table` sorted by their position in the primary
    // key, not by their position in the table. A table without a declared
    // primary key yields {"rowid"}. NotFound if the table does not exist.
    sqlcas::core::Status primary_key_columns(const sqlcas::db::Connection& conn,
        std::string_view table,
        std::vector<std::string>* out) noexcept;

    // Text form of a key value as it appears in a path segment, before
    // percent-encoding.
    [[nodiscard]] std::string value_to_key_text(const sqlcas::core::Value& v);

    // Percent-encodes each value (space as '+') and joins them with ','.
    [[nodiscard]] std::string compound_key_encode(const sqlcas::core::CompoundKey& key);

    // Path segment for row `row` of `rows`, taking the values of
    // `pk_columns` in that order. NotFound if a key column is not in the
    // row set, Invalid if `row` is out of range.
    sqlcas::core::Status compound_key_encode_row(const sqlcas::core::RowSet& rows,
        std::size_t row,
        const std::vector<std::string>& pk_columns,
        std::string* out) noexcept;

    // Splits on ',' and decodes each part. A comma inside a key value cannot
    // be represented: "a%2Cb" decodes to one value "a,b", but a literal ','
    // always separates values.
    [[nodiscard]] sqlcas::core::CompoundKey compound_key_decode(std::string_view segment);

} // namespace sqlcas::address
