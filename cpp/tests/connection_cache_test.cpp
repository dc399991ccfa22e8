#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "sqlcas/registry/connection_cache.hpp"
#include "test_support.hpp"

using namespace sqlcas::registry;
using namespace sqlcas::core;

class ConnectionCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        sqlcas::testing::make_database(dir_.file("fixtures.db"), sqlcas::testing::kFixtureSchema);
        sqlcas::testing::make_database(dir_.file("other.db"), "CREATE TABLE t (x);");
        ASSERT_TRUE(is_ok(registry_.build(true, nullptr)));
    }

    sqlcas::testing::TempDir dir_;
    Registry registry_{RegistryConfig{dir_.path(), ""}};
};

TEST_F(ConnectionCacheTest, OpensOncePerName) {
    ConnectionCache cache(registry_);
    ConnectionHandle a;
    ConnectionHandle b;
    ASSERT_TRUE(is_ok(cache.get("fixtures", &a)));
    ASSERT_TRUE(is_ok(cache.get("fixtures", &b)));
    EXPECT_EQ(a, b);
    EXPECT_TRUE(a->is_open());
    EXPECT_EQ(cache.open_count(), 1u);
    EXPECT_EQ(cache.size(), 1u);

    ASSERT_TRUE(is_ok(cache.get("other", &b)));
    EXPECT_NE(a, b);
    EXPECT_EQ(cache.open_count(), 2u);
}

TEST_F(ConnectionCacheTest, UnknownNameIsNotFound) {
    ConnectionCache cache(registry_);
    ConnectionHandle h;
    EXPECT_EQ(cache.get("missing", &h).code, StatusCode::NotFound);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.open_count(), 0u);
}

TEST_F(ConnectionCacheTest, OpenFailureIsNotCached) {
    ConnectionCache cache(registry_);
    std::filesystem::rename(dir_.file("other.db"), dir_.file("moved.bak"));

    ConnectionHandle h;
    EXPECT_EQ(cache.get("other", &h).code, StatusCode::NotFound);
    EXPECT_EQ(cache.size(), 0u);

    std::filesystem::rename(dir_.file("moved.bak"), dir_.file("other.db"));
    EXPECT_TRUE(is_ok(cache.get("other", &h)));
    EXPECT_EQ(cache.open_count(), 1u);
}

TEST_F(ConnectionCacheTest, FailedLookupsAndOpensLeaveNoSlots) {
    ConnectionCache cache(registry_);
    ConnectionHandle h;
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(cache.get("missing-" + std::to_string(i), &h).code, StatusCode::NotFound);
    }
    EXPECT_EQ(cache.slot_count(), 0u);

    std::filesystem::rename(dir_.file("other.db"), dir_.file("moved.bak"));
    EXPECT_FALSE(is_ok(cache.get("other", &h)));
    EXPECT_EQ(cache.slot_count(), 0u);

    ASSERT_TRUE(is_ok(cache.get("fixtures", &h)));
    EXPECT_EQ(cache.slot_count(), 1u);
}

TEST_F(ConnectionCacheTest, ConcurrentFirstAccessOpensOneConnection) {
    ConnectionCache cache(registry_);
    constexpr int kThreads = 16;
    std::vector<ConnectionHandle> handles(kThreads);
    std::vector<Status> statuses(kThreads);
    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] { statuses[i] = cache.get("fixtures", &handles[i]); });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kThreads; ++i) {
        EXPECT_TRUE(is_ok(statuses[i]));
        EXPECT_EQ(handles[i], handles[0]);
    }
    EXPECT_EQ(cache.open_count(), 1u);
}
