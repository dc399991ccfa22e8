#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include "sqlcas/cli/config.hpp"

namespace {

const char* no_env(const char*) {
    return nullptr;
}

const char* fake_env(const char* name) {
    if (std::strcmp(name, "SQLCAS_ROOT") == 0) return "/srv/dbs";
    if (std::strcmp(name, "SQLCAS_HOST") == 0) return "127.0.0.1";
    if (std::strcmp(name, "SQLCAS_PORT") == 0) return "9001";
    return nullptr;
}

const char* bad_port_env(const char* name) {
    return std::strcmp(name, "SQLCAS_PORT") == 0 ? "http" : nullptr;
}

} // namespace

TEST(CliConfig, Defaults) {
    sqlcas::cli::ParsedOptions none{};
    sqlcas::cli::AppConfig cfg;
    ASSERT_TRUE(sqlcas::core::is_ok(sqlcas::cli::load_config(no_env, none, &cfg, nullptr)));
    EXPECT_EQ(cfg.root, ".");
    EXPECT_EQ(cfg.snapshot_path, "./build-metadata.json");
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 8006);
    EXPECT_FALSE(cfg.verbose);
}

TEST(CliConfig, EnvironmentOverridesDefaults) {
    sqlcas::cli::ParsedOptions none{};
    sqlcas::cli::AppConfig cfg;
    ASSERT_TRUE(sqlcas::core::is_ok(sqlcas::cli::load_config(fake_env, none, &cfg, nullptr)));
    EXPECT_EQ(cfg.root, "/srv/dbs");
    EXPECT_EQ(cfg.snapshot_path, "/srv/dbs/build-metadata.json");
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 9001);
}

TEST(CliConfig, FlagsOverrideEnvironment) {
    const char* argv[] = {"-r", "/data", "--port=0", "-s", "/tmp/meta.json", "-v"};
    sqlcas::cli::ParsedOption buf[8]{};
    sqlcas::cli::ParsedOptions opts{buf, 0, 8};
    sqlcas::cli::u32 consumed = 0;
    ASSERT_TRUE(sqlcas::core::is_ok(sqlcas::cli::parse_options(
        {argv, 6}, sqlcas::cli::kOptionSpecs, sqlcas::cli::kOptionSpecCount, &opts, &consumed)));

    sqlcas::cli::AppConfig cfg;
    ASSERT_TRUE(sqlcas::core::is_ok(sqlcas::cli::load_config(fake_env, opts, &cfg, nullptr)));
    EXPECT_EQ(cfg.root, "/data");
    EXPECT_EQ(cfg.snapshot_path, "/tmp/meta.json");
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 0);
    EXPECT_TRUE(cfg.verbose);
}

TEST(CliConfig, RejectsBadPorts) {
    sqlcas::cli::ParsedOptions none{};
    sqlcas::cli::AppConfig cfg;
    std::string detail;
    EXPECT_EQ(sqlcas::cli::load_config(bad_port_env, none, &cfg, &detail).code, sqlcas::core::StatusCode::Invalid);
    EXPECT_FALSE(detail.empty());

    const char* argv[] = {"-p", "70000"};
    sqlcas::cli::ParsedOption buf[2]{};
    sqlcas::cli::ParsedOptions opts{buf, 0, 2};
    sqlcas::cli::u32 consumed = 0;
    ASSERT_TRUE(sqlcas::core::is_ok(sqlcas::cli::parse_options(
        {argv, 2}, sqlcas::cli::kOptionSpecs, sqlcas::cli::kOptionSpecCount, &opts, &consumed)));
    EXPECT_EQ(sqlcas::cli::load_config(no_env, opts, &cfg, &detail).code, sqlcas::core::StatusCode::Invalid);
}
