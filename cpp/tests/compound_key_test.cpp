#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sqlcas/address/compound_key.hpp"
#include "sqlcas/db/queries.hpp"
#include "test_support.hpp"

using namespace sqlcas::address;
using namespace sqlcas::core;

TEST(CompoundKey, EncodeJoinsWithCommas) {
    EXPECT_EQ(compound_key_encode({"us east", "2"}), "us+east,2");
    EXPECT_EQ(compound_key_encode({"a,b"}), "a%2Cb");
    EXPECT_EQ(compound_key_encode({"eu/west"}), "eu%2Fwest");
}

TEST(CompoundKey, DecodeSplitsAndUnescapes) {
    EXPECT_EQ(compound_key_decode("us+east,2"), (CompoundKey{"us east", "2"}));
    EXPECT_EQ(compound_key_decode("eu%2Fwest"), (CompoundKey{"eu/west"}));
    EXPECT_EQ(compound_key_decode(""), (CompoundKey{""}));
    EXPECT_EQ(compound_key_decode("a,,b"), (CompoundKey{"a", "", "b"}));
}

TEST(CompoundKey, EscapedCommaStaysInOneValue) {
    EXPECT_EQ(compound_key_decode("a%2Cb,c"), (CompoundKey{"a,b", "c"}));
}

TEST(CompoundKey, DecodeReversesEncode) {
    const std::vector<CompoundKey> samples = {
        {"1"},
        {"us east", "42"},
        {"caf\xc3\xa9", "x+y", "100%"},
        {"", "~tilde_"},
    };
    for (const auto& key : samples) {
        EXPECT_EQ(compound_key_decode(compound_key_encode(key)), key);
    }
}

TEST(CompoundKey, ValueText) {
    Value v;
    EXPECT_EQ(value_to_key_text(v), "");
    v.type = ValueType::Integer;
    v.i64v = -17;
    EXPECT_EQ(value_to_key_text(v), "-17");
    v.type = ValueType::Real;
    v.f64v = 0.1;
    EXPECT_EQ(value_to_key_text(v), "0.1");
    v.type = ValueType::Text;
    v.bytes = "text";
    EXPECT_EQ(value_to_key_text(v), "text");
}

class CompoundKeyDbTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::string path = dir_.file("fixture.db");
        sqlcas::testing::make_database(path, sqlcas::testing::kFixtureSchema);
        ASSERT_TRUE(is_ok(sqlcas::db::db_open_readonly(path.c_str(), &conn_)));
    }

    sqlcas::testing::TempDir dir_;
    sqlcas::db::Connection conn_;
};

TEST_F(CompoundKeyDbTest, PrimaryKeyColumnsFollowKeyOrder) {
    std::vector<std::string> pks;
    ASSERT_TRUE(is_ok(primary_key_columns(conn_, "compound_pk", &pks)));
    EXPECT_EQ(pks, (std::vector<std::string>{"region", "seq"}));
}

TEST_F(CompoundKeyDbTest, TableWithoutPrimaryKeyUsesRowid) {
    std::vector<std::string> pks;
    ASSERT_TRUE(is_ok(primary_key_columns(conn_, "notes", &pks)));
    EXPECT_EQ(pks, (std::vector<std::string>{"rowid"}));
}

TEST_F(CompoundKeyDbTest, MissingTableIsNotFound) {
    std::vector<std::string> pks;
    EXPECT_EQ(primary_key_columns(conn_, "nope", &pks).code, StatusCode::NotFound);
}

TEST_F(CompoundKeyDbTest, EncodeRowThenLookUp) {
    std::vector<std::string> pks;
    ASSERT_TRUE(is_ok(primary_key_columns(conn_, "compound_pk", &pks)));

    RowSet rs;
    sqlcas::db::QueryError err;
    ASSERT_TRUE(is_ok(sqlcas::db::query_execute(conn_, "select * from compound_pk where name = 'second'", {},
                                                sqlcas::db::QueryLimit{}, &rs, &err)));
    std::string segment;
    ASSERT_TRUE(is_ok(compound_key_encode_row(rs, 0, pks, &segment)));
    EXPECT_EQ(segment, "us+east,2");

    RowSet found;
    ASSERT_TRUE(is_ok(sqlcas::db::query_row(conn_, "compound_pk", pks, compound_key_decode(segment), &found, &err)));
    ASSERT_EQ(found.rows.size(), 1u);
    EXPECT_EQ(found.rows[0][2].bytes, "second");
}

TEST_F(CompoundKeyDbTest, EncodeRowNeedsKeyColumns) {
    RowSet rs;
    sqlcas::db::QueryError err;
    ASSERT_TRUE(is_ok(sqlcas::db::query_execute(conn_, "select name from compound_pk", {},
                                                sqlcas::db::QueryLimit{}, &rs, &err)));
    std::string segment;
    EXPECT_EQ(compound_key_encode_row(rs, 0, {"region", "seq"}, &segment).code, StatusCode::NotFound);
    EXPECT_EQ(compound_key_encode_row(rs, 99, {"name"}, &segment).code, StatusCode::Invalid);
}
