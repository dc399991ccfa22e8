#include "sqlcas/db/db.hpp"
#include <sqlite3.h>
#include <cerrno>
#include <string>
#include <utility>
#include <sys/stat.h>

#include "detail.hpp"

namespace sqlcas::db {

using namespace sqlcas::core;

namespace {
    [[nodiscard]] Status prepare(sqlite3* db, const std::string& sql, sqlite3_stmt** stmt) noexcept {
        const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, stmt, nullptr);
        if (rc != SQLITE_OK || *stmt == nullptr) {
            if (*stmt) {
                sqlite3_finalize(*stmt);
                *stmt = nullptr;
            }
            return make_status(StatusDomain::Db, StatusCode::Invalid, static_cast<u32>(rc));
        }
        return ok_status();
    }

    [[nodiscard]] bool is_uri_reserved(char c) noexcept {
        return c == '%' || c == '?' || c == '#';
    }

    // Connections are shared across requests; statements that would change
    // per-connection state are refused at prepare time.
    int shared_connection_authorizer(void*, int action, const char*, const char*, const char*, const char*) {
        switch (action) {
            case SQLITE_ATTACH:
            case SQLITE_DETACH:
            case SQLITE_TRANSACTION:
            case SQLITE_SAVEPOINT:
                return SQLITE_DENY;
            default:
                return SQLITE_OK;
        }
    }
}

// ============================================================================
// Connection
// ============================================================================

Connection::~Connection() noexcept {
    close();
}

Connection::Connection(Connection&& other) noexcept
    : db_(std::exchange(other.db_, nullptr)),
      path_(std::move(other.path_)) {}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        db_ = std::exchange(other.db_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

void Connection::close() noexcept {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

std::string db_immutable_uri(std::string_view path) {
    static const char hex[] = "0123456789ABCDEF";
    std::string uri = "file:";
    for (char c : path) {
        if (is_uri_reserved(c)) {
            uri.push_back('%');
            uri.push_back(hex[(static_cast<unsigned char>(c) >> 4) & 0xF]);
            uri.push_back(hex[static_cast<unsigned char>(c) & 0xF]);
        } else {
            uri.push_back(c);
        }
    }
    uri += "?immutable=1";
    return uri;
}

std::string quote_identifier(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    for (char c : name) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

Status db_open_readonly(const char* path, Connection* out) noexcept {
    if (!path || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    // SQLITE_OPEN_READONLY never creates, but a missing file should read as
    // NotFound rather than as a generic open failure.
    struct stat st{};
    if (stat(path, &st) != 0) {
        const int err = errno;
        return make_status(StatusDomain::Db, err == ENOENT ? StatusCode::NotFound : StatusCode::Io,
                           static_cast<u32>(err));
    }
    if (!S_ISREG(st.st_mode)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const std::string uri = db_immutable_uri(path);
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(uri.c_str(), &db,
                                   SQLITE_OPEN_READONLY | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        if (db) sqlite3_close_v2(db);
        return make_status(StatusDomain::Db, StatusCode::Unavailable, static_cast<u32>(rc));
    }

    sqlite3_limit(db, SQLITE_LIMIT_ATTACHED, 0);
    const int auth_rc = sqlite3_set_authorizer(db, shared_connection_authorizer, nullptr);
    if (auth_rc != SQLITE_OK) {
        sqlite3_close_v2(db);
        return make_status(StatusDomain::Db, StatusCode::Unavailable, static_cast<u32>(auth_rc));
    }

    out->close();
    out->db_ = db;
    out->path_ = path;
    return ok_status();
}

// ============================================================================
// Introspection
// ============================================================================

Status db_list_tables(const Connection& conn, std::vector<std::string>* out) noexcept {
    if (!conn.is_open() || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();

    detail::ConnectionLock lock(conn.raw());

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(conn.raw(),
                       "SELECT name FROM sqlite_master WHERE type = 'table' "
                       "AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\'",
                       &stmt);
    if (!is_ok(s)) {
        // A file that is not a database fails here (SQLITE_NOTADB).
        return make_status(StatusDomain::Db, StatusCode::Corrupt, s.aux);
    }

    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        out->emplace_back(name ? name : "");
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        out->clear();
        return make_status(StatusDomain::Db, StatusCode::Corrupt, static_cast<u32>(rc));
    }
    return ok_status();
}

Status db_count_rows(const Connection& conn, std::string_view table, i64* out) noexcept {
    if (!conn.is_open() || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    detail::ConnectionLock lock(conn.raw());

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(conn.raw(), "SELECT count(*) FROM " + quote_identifier(table), &stmt);
    if (!is_ok(s)) {
        return s;
    }

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        *out = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }
    return ok_status();
}

Status db_table_exists(const Connection& conn, std::string_view table, bool* exists) noexcept {
    if (!conn.is_open() || !exists) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *exists = false;

    detail::ConnectionLock lock(conn.raw());

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(conn.raw(), "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ? LIMIT 1", &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_text(stmt, 1, table.data(), static_cast<int>(table.size()), SQLITE_TRANSIENT);

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_ROW) {
        *exists = true;
        return ok_status();
    }
    if (rc != SQLITE_DONE) {
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }
    return ok_status();
}

Status db_table_columns(const Connection& conn, std::string_view table, std::vector<ColumnInfo>* out) noexcept {
    if (!conn.is_open() || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();

    detail::ConnectionLock lock(conn.raw());

    sqlite3_stmt* stmt = nullptr;
    Status s = prepare(conn.raw(), "PRAGMA table_info(" + quote_identifier(table) + ")", &stmt);
    if (!is_ok(s)) {
        return s;
    }

    // cid | name | type | notnull | dflt_value | pk
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ColumnInfo col;
        col.cid = static_cast<u32>(sqlite3_column_int(stmt, 0));
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        col.name = name ? name : "";
        col.type = type ? type : "";
        col.notnull = sqlite3_column_int(stmt, 3) != 0;
        col.pk = static_cast<u32>(sqlite3_column_int(stmt, 5));
        out->push_back(std::move(col));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        out->clear();
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }
    if (out->empty()) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    return ok_status();
}

Status db_introspect(const char* path, TableCounts* out) noexcept {
    if (!path || !out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    out->clear();

    Connection conn;
    Status s = db_open_readonly(path, &conn);
    if (!is_ok(s)) {
        return s;
    }

    std::vector<std::string> tables;
    s = db_list_tables(conn, &tables);
    if (!is_ok(s)) {
        return s;
    }

    TableCounts counts;
    for (const std::string& table : tables) {
        i64 n = 0;
        s = db_count_rows(conn, table, &n);
        if (!is_ok(s)) {
            return s;
        }
        counts[table] = n;
    }

    *out = std::move(counts);
    return ok_status();
}

} // namespace sqlcas::db
