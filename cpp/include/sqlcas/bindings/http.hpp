#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sqlcas/core/errors.hpp"
#include "sqlcas/core/types.hpp"
#include "sqlcas/registry/connection_cache.hpp"
#include "sqlcas/registry/registry.hpp"

namespace sqlcas::bindings::http {
    using u16 = sqlcas::core::u16;

    // One year; resolved responses never change for a given address.
    inline constexpr const char* kImmutableCacheControl = "max-age=31536000";
    inline constexpr const char* kDefaultDatabaseSql = "select * from sqlite_master";

    // Process-scoped services shared by every request.
    struct ServiceContext {
        sqlcas::registry::Registry& registry;
        sqlcas::registry::ConnectionCache& connections;
    };

    struct HttpHeader {
        std::string name;
        std::string value;
    };

    struct HttpRequest {
        std::string method;
        std::string target;  // path plus optional "?query", still encoded
    };

    struct HttpResponse {
        u16 status{200};
        std::vector<HttpHeader> headers;
        std::string content_type;
        std::string body;
    };

    // Routes one request. `out` is always filled in, including for failures,
    // which get a {"ok": false, "error": ...} body; the returned status is the
    // failure that produced it, or Ok.
    //
    //   GET /                        rebuild registry, list databases
    //   GET /favicon.ico             empty
    //   GET /<db>[?sql=...]          run a query
    //   GET /<db>/<table>            first rows of a table
    //   GET /<db>/<table>/<pk>       one row by primary key
    //
    // Any of the last three may end in ".json".
    sqlcas::core::Status handle_http_request(ServiceContext& ctx, const HttpRequest& req, HttpResponse* out) noexcept;

    // NotFound -> 404, Invalid -> 400, everything else -> 500.
    [[nodiscard]] u16 http_status_for(sqlcas::core::Status s) noexcept;

    // nullptr when absent. Names compare case-insensitively.
    [[nodiscard]] const std::string* find_header(const HttpResponse& resp, std::string_view name) noexcept;

} // namespace sqlcas::bindings::http
