#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/types.hpp"
#include "sqlcas/db/schema.hpp"

struct sqlite3;

namespace sqlcas::db {

    // An open read-only, immutable-mode SQLite connection. The file is never
    // created and never written; the connection assumes the file does not
    // change while it is open.
    class Connection {
    public:
        Connection() noexcept = default;
        ~Connection() noexcept;

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&& other) noexcept;
        Connection& operator=(Connection&& other) noexcept;

        [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }
        [[nodiscard]] sqlite3* raw() const noexcept { return db_; }
        [[nodiscard]] const std::string& path() const noexcept { return path_; }

        void close() noexcept;

    private:
        friend sqlcas::core::Status db_open_readonly(const char* path, Connection* out) noexcept;

        sqlite3* db_{nullptr};
        std::string path_;
    };

    // Opens `path` with SQLITE_OPEN_READONLY and `immutable=1`.
    // NotFound if the file is missing, Unavailable if SQLite refuses it.
    sqlcas::core::Status db_open_readonly(const char* path, Connection* out) noexcept;

    // `file:` URI for path with `?immutable=1`.
    [[nodiscard]] std::string db_immutable_uri(std::string_view path);

    // "name" with embedded quotes doubled.
    [[nodiscard]] std::string quote_identifier(std::string_view name);

    // ========================================================================
    // Introspection
    // ========================================================================

    // User tables (sqlite_* internals excluded), in schema order.
    sqlcas::core::Status db_list_tables(const Connection& conn, std::vector<std::string>* out) noexcept;

    sqlcas::core::Status db_count_rows(const Connection& conn, std::string_view table, i64* out) noexcept;

    sqlcas::core::Status db_table_exists(const Connection& conn, std::string_view table, bool* exists) noexcept;

    // NotFound if the table has no columns (does not exist).
    sqlcas::core::Status db_table_columns(const Connection& conn,
        std::string_view table,
        std::vector<ColumnInfo>* out) noexcept;

    // Opens `path` on a short-lived connection, lists every user table with
    // its exact row count, and closes it again. Any failure aborts the whole
    // introspection; `out` is left empty.
    sqlcas::core::Status db_introspect(const char* path, TableCounts* out) noexcept;

} // namespace sqlcas::db
