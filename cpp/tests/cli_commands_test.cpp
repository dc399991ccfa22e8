#include <gtest/gtest.h>

#include "sqlcas/cli/commands.hpp"

using sqlcas::cli::CommandId;

namespace {

sqlcas::core::Status parse(const char* const* argv, sqlcas::cli::u32 argc,
                           sqlcas::cli::CommandInvocation* out, sqlcas::cli::u32* consumed) {
    return sqlcas::cli::parse_command({argv, argc}, sqlcas::cli::kCommandSpecs, sqlcas::cli::kCommandSpecCount,
                                      CommandId::Serve, out, consumed);
}

} // namespace

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const char* argv[] = {"resolve", "--root", "data", "fixtures"};
    sqlcas::cli::CommandInvocation out{};
    sqlcas::cli::u32 consumed = 0;
    ASSERT_EQ(parse(argv, 4, &out, &consumed).code, sqlcas::core::StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, CommandId::Resolve);
    ASSERT_EQ(out.args.argc, 3u);
    EXPECT_STREQ(out.args.argv[0], "--root");
}

TEST(CliCommands, DefaultsToServe) {
    sqlcas::cli::CommandInvocation out{};
    sqlcas::cli::u32 consumed = 7;
    ASSERT_EQ(parse(nullptr, 0, &out, &consumed).code, sqlcas::core::StatusCode::Ok);
    EXPECT_EQ(out.id, CommandId::Serve);
    EXPECT_EQ(consumed, 0u);

    const char* argv[] = {"--port", "9000"};
    ASSERT_EQ(parse(argv, 2, &out, &consumed).code, sqlcas::core::StatusCode::Ok);
    EXPECT_EQ(out.id, CommandId::Serve);
    EXPECT_EQ(consumed, 0u);
    EXPECT_EQ(out.args.argc, 2u);
}

TEST(CliCommands, EveryCommandNameParses) {
    for (const auto& spec : sqlcas::cli::kCommandSpecs) {
        const char* argv[] = {spec.name};
        sqlcas::cli::CommandInvocation out{};
        sqlcas::cli::u32 consumed = 0;
        ASSERT_EQ(parse(argv, 1, &out, &consumed).code, sqlcas::core::StatusCode::Ok) << spec.name;
        EXPECT_EQ(out.id, spec.id);
        EXPECT_EQ(out.args.argc, 0u);
    }
}

TEST(CliCommands, InvalidOnUnknownCommand) {
    const char* argv[] = {"nope"};
    sqlcas::cli::CommandInvocation out{};
    sqlcas::cli::u32 consumed = 0;
    EXPECT_EQ(parse(argv, 1, &out, &consumed).code, sqlcas::core::StatusCode::Invalid);
}

TEST(CliCommands, InvalidOnNullOut) {
    const char* argv[] = {"build"};
    sqlcas::cli::u32 consumed = 0;
    EXPECT_EQ(parse(argv, 1, nullptr, &consumed).code, sqlcas::core::StatusCode::Invalid);
}
