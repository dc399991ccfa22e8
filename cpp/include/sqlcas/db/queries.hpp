#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/models.hpp"
#include "sqlcas/db/db.hpp"

namespace sqlcas::db {
    using u32 = sqlcas::core::u32;

    // limit == 0 means no limit.
    struct QueryLimit {
        u32 limit{0};
    };

    // A failed query. `message` is the SQLite error text, passed through
    // unchanged for the caller to render.
    struct QueryError {
        sqlcas::core::Status status{};
        std::string message;
    };

    // Runs exactly one read-only statement. Positional parameters are bound
    // as text. Trailing statements and statements that would write are
    // refused with Invalid before anything runs.
    sqlcas::core::Status query_execute(const Connection& conn,
        std::string_view sql,
        const std::vector<std::string>& params,
        QueryLimit limit,
        sqlcas::core::RowSet* out,
        QueryError* err) noexcept;

    // SELECT * FROM "table" LIMIT n. With `with_rowid` the rowid is selected
    // as the first column. NotFound if the table does not exist.
    sqlcas::core::Status query_table(const Connection& conn,
        std::string_view table,
        QueryLimit limit,
        bool with_rowid,
        sqlcas::core::RowSet* out,
        QueryError* err) noexcept;

    // Rows whose primary key equals `key`. `pk_columns` must be in primary-key
    // ordinal order and have the same arity as `key` (Invalid otherwise).
    // NotFound when no row matches.
    sqlcas::core::Status query_row(const Connection& conn,
        std::string_view table,
        const std::vector<std::string>& pk_columns,
        const sqlcas::core::CompoundKey& key,
        sqlcas::core::RowSet* out,
        QueryError* err) noexcept;

} // namespace sqlcas::db
