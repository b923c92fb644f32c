#include <array>

#include <gtest/gtest.h>

#include "waypoint/cli/commands.hpp"

namespace cli = waypoint::cli;
using waypoint::core::Status;
using waypoint::core::StatusCode;

namespace {
    const std::array<cli::CommandSpec, 4> kSpecs = {{
        {cli::CommandId::Help, "help", nullptr},
        {cli::CommandId::Run, "run", nullptr},
        {cli::CommandId::Get, "get", "cat"},
        {cli::CommandId::List, "ls", "list"},
    }};
}

TEST(CliCommands, ParsesKnownCommandAndReturnsRemainingArgs) {
    const char* argv[] = {"run", "--experiment", "exp.json"};

    cli::CommandInvocation out{};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_command({argv, 3}, kSpecs.data(), kSpecs.size(), &out, &consumed).code, StatusCode::Ok);
    EXPECT_EQ(consumed, 1u);
    EXPECT_EQ(out.id, cli::CommandId::Run);
    ASSERT_EQ(out.args.argc, 2u);
    EXPECT_STREQ(out.args.argv[0], "--experiment");
}

TEST(CliCommands, MatchesAlias) {
    const char* argv[] = {"cat", "abc"};

    cli::CommandInvocation out{};
    cli::u32 consumed = 0;
    ASSERT_EQ(cli::parse_command({argv, 2}, kSpecs.data(), kSpecs.size(), &out, &consumed).code, StatusCode::Ok);
    EXPECT_EQ(out.id, cli::CommandId::Get);
}

TEST(CliCommands, UnknownAndMissingCommands) {
    cli::CommandInvocation out{};
    cli::u32 consumed = 0;

    const char* unknown[] = {"nope"};
    EXPECT_EQ(cli::parse_command({unknown, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::NotFound);

    const char* option[] = {"--help"};
    EXPECT_EQ(cli::parse_command({option, 1}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::Invalid);

    EXPECT_EQ(cli::parse_command({nullptr, 0}, kSpecs.data(), kSpecs.size(), &out, &consumed).code,
              StatusCode::Invalid);
    EXPECT_EQ(out.id, cli::CommandId::None);
}
