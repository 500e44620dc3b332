#include "qual/application/command_line.hpp"
#include "qual/core/errors.hpp"
#include <gtest/gtest.h>

namespace qual {

TEST(CommandLineTest, NoArgumentsShowsHelp)
{
    EXPECT_EQ(parse_command_line(std::vector<std::string>{}).command, Command::HELP);
}

TEST(CommandLineTest, HelpAnywhere)
{
    EXPECT_EQ(parse_command_line({"help"}).command, Command::HELP);
    EXPECT_EQ(parse_command_line({"--help"}).command, Command::HELP);
    EXPECT_EQ(parse_command_line({"check", "src", "-h"}).command, Command::HELP);
}

TEST(CommandLineTest, CheckDefaults)
{
    auto config = parse_command_line({"check"});

    EXPECT_EQ(config.command, Command::CHECK);
    EXPECT_EQ(config.path, ".");
    EXPECT_TRUE(config.analyzer.empty());
    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(config.color);
    EXPECT_FALSE(config.width.has_value());
}

TEST(CommandLineTest, CheckOptions)
{
    auto config = parse_command_line({"check", "src", "-a", "format_args", "-v", "-c", "-w", "120"});

    EXPECT_EQ(config.path, "src");
    EXPECT_EQ(config.analyzer, "format_args");
    EXPECT_TRUE(config.verbose);
    EXPECT_TRUE(config.color);
    ASSERT_TRUE(config.width.has_value());
    EXPECT_EQ(*config.width, 120u);
}

TEST(CommandLineTest, FixDryRun)
{
    auto config = parse_command_line({"fix", "--dry-run", "lib.rs"});

    EXPECT_EQ(config.command, Command::FIX);
    EXPECT_TRUE(config.dry_run);
    EXPECT_EQ(config.path, "lib.rs");
}

TEST(CommandLineTest, FormatIsFixWithEverything)
{
    auto config = parse_command_line({"format", "src"});

    EXPECT_EQ(config.command, Command::FIX);
    EXPECT_FALSE(config.dry_run);
    EXPECT_TRUE(config.analyzer.empty());
    EXPECT_EQ(config.path, "src");

    EXPECT_EQ(parse_command_line({"format", "--help"}).command, Command::HELP);
    EXPECT_THROW(parse_command_line({"format", "-d"}), ConfigError);
    EXPECT_THROW(parse_command_line({"format", "-a", "mod_rs"}), ConfigError);
}

TEST(CommandLineTest, DiffModes)
{
    EXPECT_EQ(parse_command_line({"diff"}).diff_mode, DiffMode::FULL);
    EXPECT_EQ(parse_command_line({"diff", "-s"}).diff_mode, DiffMode::SUMMARY);
    EXPECT_EQ(parse_command_line({"diff", "--interactive"}).diff_mode, DiffMode::INTERACTIVE);
}

TEST(CommandLineTest, RejectsInvalidInput)
{
    EXPECT_THROW(parse_command_line({"lint"}), ConfigError);
    EXPECT_THROW(parse_command_line({"check", "-x"}), ConfigError);
    EXPECT_THROW(parse_command_line({"fix", "-v"}), ConfigError);
    EXPECT_THROW(parse_command_line({"check", "a", "b"}), ConfigError);
    EXPECT_THROW(parse_command_line({"check", "-a"}), ConfigError);
    EXPECT_THROW(parse_command_line({"diff", "-w", "0"}), ConfigError);
    EXPECT_THROW(parse_command_line({"diff", "-w", "wide"}), ConfigError);
    EXPECT_THROW(parse_command_line({"diff", "-s", "-i"}), ConfigError);
}

TEST(CommandLineTest, ArgvOverload)
{
    char program[] = "qual";
    char command[] = "diff";
    char flag[] = "-s";
    char* argv[] = {program, command, flag};

    auto config = parse_command_line(3, argv);

    EXPECT_EQ(config.command, Command::DIFF);
    EXPECT_EQ(config.diff_mode, DiffMode::SUMMARY);
}

TEST(CommandLineTest, UsageListsCommands)
{
    auto usage = usage_text();
    EXPECT_NE(usage.find("check"), std::string::npos);
    EXPECT_NE(usage.find("--interactive"), std::string::npos);
    EXPECT_NE(usage.find("path_import"), std::string::npos);
    EXPECT_NE(usage.find("format [path]"), std::string::npos);
    EXPECT_NE(usage.find("mod_rs"), std::string::npos);
}

} // namespace qual
