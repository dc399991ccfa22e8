#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "sqlcas/bindings/http.hpp"
#include "test_support.hpp"

using namespace sqlcas::bindings::http;
using namespace sqlcas::core;
using nlohmann::json;

class HttpBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        sqlcas::testing::make_database(dir_.file("fixtures.db"), sqlcas::testing::kFixtureSchema);
        ASSERT_TRUE(is_ok(registry_.build(true, nullptr)));
        prefix_ = hash_prefix_of(registry_.snapshot()->at("fixtures"));
        base_ = "/fixtures-" + prefix_;
    }

    HttpResponse get(const std::string& target, const char* method = "GET") {
        HttpResponse resp;
        (void)handle_http_request(ctx_, HttpRequest{method, target}, &resp);
        return resp;
    }

    static json body_of(const HttpResponse& resp) {
        return json::parse(resp.body);
    }

    sqlcas::testing::TempDir dir_;
    sqlcas::registry::Registry registry_{sqlcas::registry::RegistryConfig{dir_.path(), dir_.file("build-metadata.json")}};
    sqlcas::registry::ConnectionCache cache_{registry_};
    ServiceContext ctx_{registry_, cache_};
    std::string prefix_;
    std::string base_;
};

TEST_F(HttpBridgeTest, BareNameRedirectsWithPreload) {
    const HttpResponse resp = get("/fixtures");
    EXPECT_EQ(resp.status, 302);
    ASSERT_NE(find_header(resp, "Location"), nullptr);
    EXPECT_EQ(*find_header(resp, "location"), base_);
    ASSERT_NE(find_header(resp, "Link"), nullptr);
    EXPECT_EQ(*find_header(resp, "Link"), "<" + base_ + ">; rel=preload");
    ASSERT_NE(find_header(resp, "Cache-Control"), nullptr);
    EXPECT_EQ(*find_header(resp, "Cache-Control"), "max-age=31536000");
}

TEST_F(HttpBridgeTest, StaleTableAddressRedirectsToCanonicalTable) {
    const HttpResponse resp = get("/fixtures-deadbee/notes");
    EXPECT_EQ(resp.status, 302);
    EXPECT_EQ(*find_header(resp, "Location"), base_ + "/notes");
}

TEST_F(HttpBridgeTest, DatabaseViewRunsDefaultQuery) {
    const HttpResponse resp = get(base_);
    ASSERT_EQ(resp.status, 200) << resp.body;
    EXPECT_EQ(*find_header(resp, "Cache-Control"), "max-age=31536000");
    EXPECT_EQ(find_header(resp, "Access-Control-Allow-Origin"), nullptr);

    const json body = body_of(resp);
    EXPECT_EQ(body["ok"], true);
    EXPECT_EQ(body["database"], "fixtures");
    EXPECT_EQ(body["database_hash"], prefix_);
    EXPECT_EQ(body["query"], kDefaultDatabaseSql);
    // Two tables plus the automatic index behind the compound primary key.
    EXPECT_EQ(body["rows"].size(), 3u);
}

TEST_F(HttpBridgeTest, DatabaseViewCustomSql) {
    const HttpResponse resp = get(base_ + ".json?sql=select+count(*)+as+n+from+notes");
    ASSERT_EQ(resp.status, 200) << resp.body;
    ASSERT_NE(find_header(resp, "Access-Control-Allow-Origin"), nullptr);
    EXPECT_EQ(*find_header(resp, "Access-Control-Allow-Origin"), "*");

    const json body = body_of(resp);
    EXPECT_EQ(body["columns"], json::array({"n"}));
    EXPECT_EQ(body["rows"][0][0], 2);
}

TEST_F(HttpBridgeTest, BadSqlIsBadRequest) {
    const HttpResponse resp = get(base_ + "?sql=selec+nonsense");
    EXPECT_EQ(resp.status, 400);
    const json body = body_of(resp);
    EXPECT_EQ(body["ok"], false);
    EXPECT_NE(body["error"].get<std::string>().find("syntax error"), std::string::npos);
    EXPECT_EQ(find_header(resp, "Cache-Control"), nullptr);
}

TEST_F(HttpBridgeTest, WriteStatementRefused) {
    EXPECT_EQ(get(base_ + "?sql=delete+from+notes").status, 400);
}

TEST_F(HttpBridgeTest, AttachRefusedAndNotCached) {
    const std::string other = dir_.file("outside.sqlite3.bak");
    sqlcas::testing::make_database(other, "CREATE TABLE s (v TEXT); INSERT INTO s VALUES ('hidden');");

    const HttpResponse attach = get(base_ + "?sql=ATTACH+'" + other + "'+AS+x");
    EXPECT_EQ(attach.status, 400);
    EXPECT_EQ(find_header(attach, "Cache-Control"), nullptr);

    const HttpResponse later = get(base_ + "?sql=select+*+from+x.s");
    EXPECT_EQ(later.status, 400);
    EXPECT_EQ(later.body.find("hidden"), std::string::npos);
}

TEST_F(HttpBridgeTest, TableViewCarriesRowPaths) {
    const HttpResponse resp = get(base_ + "/compound_pk.json");
    ASSERT_EQ(resp.status, 200) << resp.body;
    const json body = body_of(resp);
    EXPECT_EQ(body["table"], "compound_pk");
    EXPECT_EQ(body["primary_keys"], json::array({"region", "seq"}));
    ASSERT_EQ(body["rows"].size(), 3u);
    ASSERT_EQ(body["row_paths"].size(), 3u);
    EXPECT_EQ(body["row_paths"][0], base_ + "/compound_pk/us+east,1");
}

TEST_F(HttpBridgeTest, TableWithoutPrimaryKeyAddressedByRowid) {
    const HttpResponse resp = get(base_ + "/notes");
    ASSERT_EQ(resp.status, 200) << resp.body;
    const json body = body_of(resp);
    EXPECT_EQ(body["columns"][0], "rowid");
    EXPECT_EQ(body["row_paths"][1], base_ + "/notes/2");
}

TEST_F(HttpBridgeTest, RowPathFromTableViewResolves) {
    const json table = body_of(get(base_ + "/compound_pk"));
    const std::string row_path = table["row_paths"][2].get<std::string>();

    const HttpResponse resp = get(row_path);
    ASSERT_EQ(resp.status, 200) << resp.body;
    const json body = body_of(resp);
    ASSERT_EQ(body["rows"].size(), 1u);
    EXPECT_EQ(body["rows"][0], table["rows"][2]);
}

TEST_F(HttpBridgeTest, RowViewEncodedKey) {
    const HttpResponse resp = get(base_ + "/compound_pk/eu%2Fwest,1.json");
    ASSERT_EQ(resp.status, 200) << resp.body;
    EXPECT_EQ(body_of(resp)["rows"][0][2], "third");
}

TEST_F(HttpBridgeTest, RowViewEscapedCommaIsPartOfValue) {
    const HttpResponse resp = get(base_ + "/compound_pk/a%2Cb,1");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(body_of(resp)["error"], "Record not found: ['a,b', '1']");
}

TEST_F(HttpBridgeTest, MissingRowIsNotFound) {
    const HttpResponse resp = get(base_ + "/compound_pk/nowhere,9");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(body_of(resp)["error"], "Record not found: ['nowhere', '9']");
}

TEST_F(HttpBridgeTest, MissingTableIsNotFound) {
    const HttpResponse resp = get(base_ + "/nope");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(body_of(resp)["error"], "Table not found: nope");
}

TEST_F(HttpBridgeTest, UnknownDatabaseIsNotFound) {
    const HttpResponse resp = get("/unknown-name");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(body_of(resp)["error"], "Database not found: unknown-name");
}

TEST_F(HttpBridgeTest, IndexRebuildsRegistry) {
    sqlcas::testing::make_database(dir_.file("late.db"), "CREATE TABLE t (x);");
    const HttpResponse resp = get("/");
    ASSERT_EQ(resp.status, 200) << resp.body;
    const json body = body_of(resp);
    ASSERT_EQ(body["databases"].size(), 2u);
    EXPECT_EQ(body["databases"][0]["name"], "fixtures");
    EXPECT_EQ(body["databases"][0]["path"], base_);
    EXPECT_EQ(body["databases"][0]["tables"]["compound_pk"], 3);
    EXPECT_EQ(body["databases"][1]["name"], "late");
}

TEST_F(HttpBridgeTest, Favicon) {
    const HttpResponse resp = get("/favicon.ico");
    EXPECT_EQ(resp.status, 200);
    EXPECT_TRUE(resp.body.empty());
}

TEST_F(HttpBridgeTest, OnlyGetAndHead) {
    const HttpResponse post = get(base_, "POST");
    EXPECT_EQ(post.status, 405);
    ASSERT_NE(find_header(post, "Allow"), nullptr);
    EXPECT_EQ(get(base_, "HEAD").status, 200);
}

TEST_F(HttpBridgeTest, TooManySegments) {
    EXPECT_EQ(get(base_ + "/a/b/c").status, 404);
}

TEST(HttpStatusMapping, Codes) {
    EXPECT_EQ(http_status_for(ok_status()), 200);
    EXPECT_EQ(http_status_for(make_status(StatusDomain::Db, StatusCode::NotFound)), 404);
    EXPECT_EQ(http_status_for(make_status(StatusDomain::Db, StatusCode::Invalid)), 400);
    EXPECT_EQ(http_status_for(make_status(StatusDomain::Db, StatusCode::Io)), 500);
    EXPECT_EQ(http_status_for(make_status(StatusDomain::Registry, StatusCode::Conflict)), 500);
}
