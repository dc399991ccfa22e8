#include "sqlcas/bindings/http.hpp"

#include <cctype>
#include <exception>
#include <utility>

#include <nlohmann/json.hpp>

#include "sqlcas/address/compound_key.hpp"
#include "sqlcas/address/resolver.hpp"
#include "sqlcas/address/url.hpp"
#include "sqlcas/db/queries.hpp"

namespace sqlcas::bindings::http {

using namespace sqlcas::core;
using nlohmann::json;

namespace {
    constexpr std::string_view kJsonSuffix = ".json";
    constexpr const char* kJsonContentType = "application/json; charset=utf-8";

    // Database and table segments are decoded here. The row segment stays
    // raw because the compound key codec does its own decoding per value.
    struct Route {
        std::vector<std::string> segments;
        bool as_json{false};
    };

    void set_json(HttpResponse* out, u16 status, const json& body) {
        out->status = status;
        out->content_type = kJsonContentType;
        // Text columns are not guaranteed to be UTF-8.
        out->body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    Status fail(HttpResponse* out, Status s, const std::string& message) {
        set_json(out, http_status_for(s), json{{"ok", false}, {"error", message}});
        return s;
    }

    std::string hex_of(const std::string& bytes) {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes.size() * 2);
        for (unsigned char c : bytes) {
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0f]);
        }
        return out;
    }

    json value_to_json(const Value& v) {
        switch (v.type) {
            case ValueType::Integer: return v.i64v;
            case ValueType::Real:    return v.f64v;
            case ValueType::Text:    return v.bytes;
            case ValueType::Blob:    return hex_of(v.bytes);
            case ValueType::Null:    break;
        }
        return nullptr;
    }

    json rows_to_json(const RowSet& rs) {
        json rows = json::array();
        for (const auto& row : rs.rows) {
            json r = json::array();
            for (const auto& v : row) {
                r.push_back(value_to_json(v));
            }
            rows.push_back(std::move(r));
        }
        return rows;
    }

    bool method_is(const std::string& method, const char* expected) {
        return method == expected;
    }

    Route parse_route(std::string_view path) {
        Route route;
        if (!path.empty() && path.front() == '/') {
            path.remove_prefix(1);
        }
        if (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        if (path.size() >= kJsonSuffix.size() &&
            path.substr(path.size() - kJsonSuffix.size()) == kJsonSuffix) {
            route.as_json = true;
            path.remove_suffix(kJsonSuffix.size());
        }
        if (path.empty()) {
            return route;
        }

        std::size_t start = 0;
        while (true) {
            const std::size_t slash = path.find('/', start);
            const std::string_view raw = path.substr(start, slash - start);
            if (route.segments.size() < 2) {
                route.segments.push_back(sqlcas::address::percent_decode(raw, false));
            } else {
                route.segments.emplace_back(raw);
            }
            if (slash == std::string_view::npos) {
                break;
            }
            start = slash + 1;
        }
        return route;
    }

    std::string query_param(std::string_view query, const char* name, const char* fallback) {
        for (auto& p : sqlcas::address::parse_query_string(query)) {
            if (p.name == name) {
                return std::move(p.value);
            }
        }
        return fallback;
    }

    void add_resolved_headers(HttpResponse* out, bool as_json) {
        out->headers.push_back({"Cache-Control", kImmutableCacheControl});
        if (as_json) {
            out->headers.push_back({"Access-Control-Allow-Origin", "*"});
        }
    }

    Status handle_index(ServiceContext& ctx, const Route& route, HttpResponse* out) {
        sqlcas::registry::BuildReport report;
        Status s = ctx.registry.build(true, &report);
        if (!is_ok(s)) {
            return fail(out, s, report.detail.empty() ? "registry build failed" : report.detail);
        }

        json dbs = json::array();
        const sqlcas::registry::RegistrySnapshot snap = ctx.registry.snapshot();
        for (const auto& [name, rec] : *snap) {
            const CanonicalAddress addr{name, hash_prefix_of(rec)};
            json tables = json::object();
            for (const auto& [table, count] : rec.tables) {
                tables[table] = count;
            }
            dbs.push_back(json{
                {"name", name},
                {"hash", rec.digest},
                {"hash_prefix", addr.hash_prefix},
                {"path", sqlcas::address::canonical_path(addr)},
                {"file", rec.file_path},
                {"tables", std::move(tables)},
            });
        }

        set_json(out, 200, json{{"ok", true}, {"databases", std::move(dbs)}});
        if (route.as_json) {
            out->headers.push_back({"Access-Control-Allow-Origin", "*"});
        }
        return ok_status();
    }

    Status open_database(ServiceContext& ctx, const CanonicalAddress& addr,
                         sqlcas::registry::ConnectionHandle* conn, HttpResponse* out) {
        Status s = ctx.connections.get(addr.name, conn);
        if (!is_ok(s)) {
            if (s.code == StatusCode::NotFound) {
                return fail(out, s, "Database not found: " + addr.name);
            }
            return fail(out, s, std::string("cannot open database ") + addr.name + ": " + status_code_name(s.code));
        }
        return ok_status();
    }

    Status handle_database(ServiceContext& ctx, const CanonicalAddress& addr, std::string_view query,
                           bool as_json, HttpResponse* out) {
        sqlcas::registry::ConnectionHandle conn;
        Status s = open_database(ctx, addr, &conn, out);
        if (!is_ok(s)) return s;

        const std::string sql = query_param(query, "sql", kDefaultDatabaseSql);
        RowSet rs;
        sqlcas::db::QueryError err;
        s = sqlcas::db::query_execute(*conn, sql, {}, sqlcas::db::QueryLimit{}, &rs, &err);
        if (!is_ok(s)) {
            return fail(out, s, err.message);
        }

        set_json(out, 200, json{
            {"ok", true},
            {"database", addr.name},
            {"database_hash", addr.hash_prefix},
            {"query", sql},
            {"columns", rs.columns},
            {"rows", rows_to_json(rs)},
        });
        add_resolved_headers(out, as_json);
        return ok_status();
    }

    Status handle_table(ServiceContext& ctx, const CanonicalAddress& addr, const std::string& table,
                        bool as_json, HttpResponse* out) {
        sqlcas::registry::ConnectionHandle conn;
        Status s = open_database(ctx, addr, &conn, out);
        if (!is_ok(s)) return s;

        std::vector<std::string> pks;
        s = sqlcas::address::primary_key_columns(*conn, table, &pks);
        if (!is_ok(s)) {
            if (s.code == StatusCode::NotFound) {
                return fail(out, s, "Table not found: " + table);
            }
            return fail(out, s, "cannot read schema of " + table);
        }
        const bool by_rowid = pks.size() == 1 && pks[0] == sqlcas::address::kRowidColumn;

        RowSet rs;
        sqlcas::db::QueryError err;
        s = sqlcas::db::query_table(*conn, table, sqlcas::db::QueryLimit{kTableViewRowLimit}, by_rowid, &rs, &err);
        if (!is_ok(s)) {
            return fail(out, s, err.message);
        }

        const std::string table_path =
            sqlcas::address::canonical_path(addr) + "/" + sqlcas::address::percent_encode(table, false) + "/";
        json row_paths = json::array();
        for (std::size_t i = 0; i < rs.rows.size(); ++i) {
            std::string key;
            s = sqlcas::address::compound_key_encode_row(rs, i, pks, &key);
            if (!is_ok(s)) {
                return fail(out, s, "cannot build row path for " + table);
            }
            row_paths.push_back(table_path + key);
        }

        set_json(out, 200, json{
            {"ok", true},
            {"database", addr.name},
            {"database_hash", addr.hash_prefix},
            {"table", table},
            {"primary_keys", pks},
            {"columns", rs.columns},
            {"rows", rows_to_json(rs)},
            {"row_paths", std::move(row_paths)},
        });
        add_resolved_headers(out, as_json);
        return ok_status();
    }

    Status handle_row(ServiceContext& ctx, const CanonicalAddress& addr, const std::string& table,
                      const std::string& pk_segment, bool as_json, HttpResponse* out) {
        sqlcas::registry::ConnectionHandle conn;
        Status s = open_database(ctx, addr, &conn, out);
        if (!is_ok(s)) return s;

        std::vector<std::string> pks;
        s = sqlcas::address::primary_key_columns(*conn, table, &pks);
        if (!is_ok(s)) {
            if (s.code == StatusCode::NotFound) {
                return fail(out, s, "Table not found: " + table);
            }
            return fail(out, s, "cannot read schema of " + table);
        }

        const CompoundKey key = sqlcas::address::compound_key_decode(pk_segment);
        RowSet rs;
        sqlcas::db::QueryError err;
        s = sqlcas::db::query_row(*conn, table, pks, key, &rs, &err);
        if (!is_ok(s)) {
            return fail(out, s, err.message);
        }

        set_json(out, 200, json{
            {"ok", true},
            {"database", addr.name},
            {"database_hash", addr.hash_prefix},
            {"table", table},
            {"primary_keys", pks},
            {"columns", rs.columns},
            {"rows", rows_to_json(rs)},
        });
        add_resolved_headers(out, as_json);
        return ok_status();
    }

    Status route_request(ServiceContext& ctx, const HttpRequest& req, HttpResponse* out) {
        std::string_view path;
        std::string_view query;
        sqlcas::address::split_target(req.target, &path, &query);

        if (path == "/favicon.ico") {
            out->status = 200;
            return ok_status();
        }

        const Route route = parse_route(path);
        if (route.segments.empty()) {
            return handle_index(ctx, route, out);
        }
        if (route.segments.size() > 3) {
            return fail(out, make_status(StatusDomain::Bindings, StatusCode::NotFound), "Not found");
        }

        const std::string* table = route.segments.size() >= 2 ? &route.segments[1] : nullptr;
        sqlcas::address::Resolution res;
        Status s = sqlcas::address::resolve_address(*ctx.registry.snapshot(), route.segments[0], table, &res);
        if (!is_ok(s)) {
            return fail(out, s, res.message);
        }

        if (res.redirect) {
            out->status = 302;
            out->headers.push_back({"Location", res.redirect_target});
            out->headers.push_back({"Link", "<" + res.redirect_target + ">; rel=preload"});
            out->headers.push_back({"Cache-Control", kImmutableCacheControl});
            return ok_status();
        }

        switch (route.segments.size()) {
            case 1:
                return handle_database(ctx, res.address, query, route.as_json, out);
            case 2:
                return handle_table(ctx, res.address, route.segments[1], route.as_json, out);
            default:
                return handle_row(ctx, res.address, route.segments[1], route.segments[2], route.as_json, out);
        }
    }
}

u16 http_status_for(Status s) noexcept {
    switch (s.code) {
        case StatusCode::Ok:       return 200;
        case StatusCode::NotFound: return 404;
        case StatusCode::Invalid:  return 400;
        default:                   return 500;
    }
}

const std::string* find_header(const HttpResponse& resp, std::string_view name) noexcept {
    for (const auto& h : resp.headers) {
        if (h.name.size() != name.size()) continue;
        bool same = true;
        for (std::size_t i = 0; i < name.size() && same; ++i) {
            same = std::tolower(static_cast<unsigned char>(h.name[i])) ==
                   std::tolower(static_cast<unsigned char>(name[i]));
        }
        if (same) return &h.value;
    }
    return nullptr;
}

Status handle_http_request(ServiceContext& ctx, const HttpRequest& req, HttpResponse* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    *out = HttpResponse{};

    if (!method_is(req.method, "GET") && !method_is(req.method, "HEAD")) {
        const Status s = make_status(StatusDomain::Bindings, StatusCode::Unsupported);
        set_json(out, 405, json{{"ok", false}, {"error", "Method not allowed"}});
        out->headers.push_back({"Allow", "GET, HEAD"});
        return s;
    }

    // JSON construction and string building may throw.
    try {
        return route_request(ctx, req, out);
    } catch (const std::exception&) {
        *out = HttpResponse{};
        out->status = 500;
        out->content_type = kJsonContentType;
        out->body = std::string("{\"ok\":false,\"error\":\"internal error\"}");
        return make_status(StatusDomain::Bindings, StatusCode::Unknown);
    }
}

} // namespace sqlcas::bindings::http
