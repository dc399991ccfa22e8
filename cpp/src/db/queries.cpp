#include "sqlcas/db/queries.hpp"

#include <sqlite3.h>
#include <cctype>
#include <string>
#include <utility>

#include "detail.hpp"

namespace sqlcas::db {

using namespace sqlcas::core;

namespace {
    [[nodiscard]] bool only_whitespace(const char* s) noexcept {
        if (!s) return true;
        for (; *s; ++s) {
            if (*s == ';') continue;
            if (!std::isspace(static_cast<unsigned char>(*s))) return false;
        }
        return true;
    }

    Status fail(QueryError* err, StatusCode code, std::string message, u32 aux = 0) {
        const Status s = make_status(StatusDomain::Db, code, aux);
        if (err) {
            err->status = s;
            err->message = std::move(message);
        }
        return s;
    }

    Value read_value(sqlite3_stmt* stmt, int col) {
        Value v;
        switch (sqlite3_column_type(stmt, col)) {
            case SQLITE_INTEGER:
                v.type = ValueType::Integer;
                v.i64v = sqlite3_column_int64(stmt, col);
                break;
            case SQLITE_FLOAT:
                v.type = ValueType::Real;
                v.f64v = sqlite3_column_double(stmt, col);
                break;
            case SQLITE_TEXT: {
                v.type = ValueType::Text;
                const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
                const int n = sqlite3_column_bytes(stmt, col);
                if (p) v.bytes.assign(p, static_cast<size_t>(n));
                break;
            }
            case SQLITE_BLOB: {
                v.type = ValueType::Blob;
                const auto* p = static_cast<const char*>(sqlite3_column_blob(stmt, col));
                const int n = sqlite3_column_bytes(stmt, col);
                if (p) v.bytes.assign(p, static_cast<size_t>(n));
                break;
            }
            default:
                v.type = ValueType::Null;
                break;
        }
        return v;
    }
}

Status query_execute(const Connection& conn,
                     std::string_view sql,
                     const std::vector<std::string>& params,
                     QueryLimit limit,
                     RowSet* out,
                     QueryError* err) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (!conn.is_open()) {
        return fail(err, StatusCode::Unavailable, "database connection is not open");
    }
    out->columns.clear();
    out->rows.clear();

    detail::ConnectionLock lock(conn.raw());

    sqlite3_stmt* stmt = nullptr;
    const char* tail = nullptr;
    int rc = sqlite3_prepare_v2(conn.raw(), sql.data(), static_cast<int>(sql.size()), &stmt, &tail);
    if (rc != SQLITE_OK) {
        std::string msg = sqlite3_errmsg(conn.raw());
        if (stmt) sqlite3_finalize(stmt);
        return fail(err, StatusCode::Invalid, std::move(msg), static_cast<u32>(rc));
    }
    if (!stmt) {
        return fail(err, StatusCode::Invalid, "empty statement");
    }

    const std::string rest(tail ? tail : "", tail ? static_cast<size_t>(sql.data() + sql.size() - tail) : 0);
    if (!only_whitespace(rest.c_str())) {
        sqlite3_finalize(stmt);
        return fail(err, StatusCode::Invalid, "only a single statement is allowed");
    }
    if (!sqlite3_stmt_readonly(stmt)) {
        sqlite3_finalize(stmt);
        return fail(err, StatusCode::Invalid, "statement is not read-only");
    }

    const int param_count = sqlite3_bind_parameter_count(stmt);
    if (static_cast<size_t>(param_count) != params.size()) {
        sqlite3_finalize(stmt);
        return fail(err, StatusCode::Invalid,
                    "expected " + std::to_string(param_count) + " parameters, got " + std::to_string(params.size()));
    }
    for (int i = 0; i < param_count; ++i) {
        const std::string& p = params[static_cast<size_t>(i)];
        sqlite3_bind_text(stmt, i + 1, p.data(), static_cast<int>(p.size()), SQLITE_TRANSIENT);
    }

    const int ncols = sqlite3_column_count(stmt);
    out->columns.reserve(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        const char* name = sqlite3_column_name(stmt, c);
        out->columns.emplace_back(name ? name : "");
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<Value> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            row.push_back(read_value(stmt, c));
        }
        out->rows.push_back(std::move(row));
        if (limit.limit > 0 && out->rows.size() >= limit.limit) {
            rc = SQLITE_DONE;
            break;
        }
    }

    if (rc != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(conn.raw());
        sqlite3_finalize(stmt);
        out->rows.clear();
        return fail(err, StatusCode::Invalid, std::move(msg), static_cast<u32>(rc));
    }

    sqlite3_finalize(stmt);
    return ok_status();
}

Status query_table(const Connection& conn,
                   std::string_view table,
                   QueryLimit limit,
                   bool with_rowid,
                   RowSet* out,
                   QueryError* err) noexcept {
    bool exists = false;
    Status s = db_table_exists(conn, table, &exists);
    if (!is_ok(s)) {
        return fail(err, s.code, "could not inspect table: " + std::string(table), s.aux);
    }
    if (!exists) {
        return fail(err, StatusCode::NotFound, "Table not found: " + std::string(table));
    }

    std::string sql = with_rowid ? "SELECT rowid, * FROM " : "SELECT * FROM ";
    sql += quote_identifier(table);
    if (limit.limit > 0) {
        sql += " LIMIT " + std::to_string(limit.limit);
    }
    return query_execute(conn, sql, {}, QueryLimit{}, out, err);
}

Status query_row(const Connection& conn,
                 std::string_view table,
                 const std::vector<std::string>& pk_columns,
                 const CompoundKey& key,
                 RowSet* out,
                 QueryError* err) noexcept {
    if (pk_columns.empty() || pk_columns.size() != key.size()) {
        return fail(err, StatusCode::Invalid,
                    "expected " + std::to_string(pk_columns.size()) + " key values, got " +
                        std::to_string(key.size()));
    }

    const bool by_rowid = pk_columns.size() == 1 && pk_columns[0] == "rowid";
    std::string sql = by_rowid ? "SELECT rowid, * FROM " : "SELECT * FROM ";
    sql += quote_identifier(table);
    sql += " WHERE ";
    for (size_t i = 0; i < pk_columns.size(); ++i) {
        if (i > 0) sql += " AND ";
        sql += by_rowid ? std::string("rowid") : quote_identifier(pk_columns[i]);
        sql += " = ?";
    }

    Status s = query_execute(conn, sql, key, QueryLimit{}, out, err);
    if (!is_ok(s)) {
        return s;
    }
    if (out->rows.empty()) {
        std::string values;
        for (size_t i = 0; i < key.size(); ++i) {
            if (i > 0) values += ", ";
            values += "'" + key[i] + "'";
        }
        return fail(err, StatusCode::NotFound, "Record not found: [" + values + "]");
    }
    return ok_status();
}

} // namespace sqlcas::db
