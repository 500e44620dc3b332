#include "qual/application/qual_app.hpp"
#include "qual/core/errors.hpp"
#include "qual/parsers/source_parser.hpp"
#include "../test_mocks.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;
using ::testing::Throw;

namespace qual {

class QualAppTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        mock_terminal_ = std::make_unique<NiceMock<MockTerminal>>();
        mock_filesystem_ = std::make_unique<MockFileSystem>();
        terminal_ptr_ = mock_terminal_.get();
        filesystem_ptr_ = mock_filesystem_.get();
        ON_CALL(*terminal_ptr_, width()).WillByDefault(Return(80));
    }

    auto run(const Config& config) -> int
    {
        QualApp app(std::move(mock_terminal_), std::move(mock_filesystem_),
                    std::make_unique<SourceParser>());

        std::streambuf* orig_out = std::cout.rdbuf();
        std::streambuf* orig_err = std::cerr.rdbuf();
        std::cout.rdbuf(output_.rdbuf());
        std::cerr.rdbuf(errors_.rdbuf());

        int result = app.run(config);

        std::cout.rdbuf(orig_out);
        std::cerr.rdbuf(orig_err);
        return result;
    }

    auto serve(const std::string& path, const std::string& content) -> void
    {
        EXPECT_CALL(*filesystem_ptr_, list_source_files("."))
            .WillOnce(Return(std::vector<std::string>{path}));
        EXPECT_CALL(*filesystem_ptr_, read_file(path)).WillRepeatedly(Return(content));
    }

    std::unique_ptr<NiceMock<MockTerminal>> mock_terminal_;
    std::unique_ptr<MockFileSystem> mock_filesystem_;
    NiceMock<MockTerminal>* terminal_ptr_ = nullptr;
    MockFileSystem* filesystem_ptr_ = nullptr;
    std::ostringstream output_;
    std::ostringstream errors_;

    const std::string sample_ = "fn main() {\n"
                                "    std::fs::remove_file(\"a\");\n"
                                "\n"
                                "    println!(\"{}\", 1);\n"
                                "}\n";
};

TEST_F(QualAppTest, HelpPrintsUsage)
{
    EXPECT_EQ(run(Config{.command = Command::HELP}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Usage: qual"));
}

TEST_F(QualAppTest, UnknownAnalyzerIsConfigError)
{
    EXPECT_CALL(*filesystem_ptr_, list_source_files(_)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::CHECK, .analyzer = "nope"}), 2);
    EXPECT_THAT(errors_.str(), HasSubstr("Unknown analyzer: nope"));
}

TEST_F(QualAppTest, MissingPathIsIoError)
{
    EXPECT_CALL(*filesystem_ptr_, list_source_files("missing"))
        .WillOnce(Throw(IoError("missing", "no such file or directory")));

    EXPECT_EQ(run(Config{.command = Command::CHECK, .path = "missing"}), 1);
    EXPECT_THAT(errors_.str(), HasSubstr("Error: IO error: missing"));
}

TEST_F(QualAppTest, CheckReportsIssues)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*filesystem_ptr_, write_file(_, _)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::CHECK, .width = 80}), 0);

    auto out = output_.str();
    EXPECT_THAT(out, HasSubstr("File: main.rs"));
    EXPECT_THAT(out, HasSubstr("[path_import]"));
    EXPECT_THAT(out, HasSubstr("  2:5 - Use import instead of path: std::fs::remove_file"));
    EXPECT_THAT(out, HasSubstr("[format_args]"));
    EXPECT_THAT(out, HasSubstr("[empty_lines]"));
    EXPECT_THAT(out, HasSubstr("Total issues: 3  Fixable: 2  Files: 1"));
}

TEST_F(QualAppTest, CheckVerboseUsesTextReport)
{
    serve("main.rs", sample_);

    EXPECT_EQ(run(Config{.command = Command::CHECK, .analyzer = "path_import", .verbose = true}),
              0);

    auto out = output_.str();
    EXPECT_THAT(out, HasSubstr("Quality report for: main.rs"));
    EXPECT_THAT(out, HasSubstr("    Fix: Add import: use std::fs::remove_file;"));
}

TEST_F(QualAppTest, CheckReportsModRsLayout)
{
    serve("src/util/mod.rs", "pub fn helper() {}\n");

    EXPECT_EQ(run(Config{.command = Command::CHECK, .width = 80}), 0);

    auto out = output_.str();
    EXPECT_THAT(out, HasSubstr("[mod_rs]"));
    EXPECT_THAT(out, HasSubstr("Use `util.rs` instead of `util/mod.rs` (modern module style)"));
    EXPECT_THAT(out, HasSubstr("Total issues: 1  Fixable: 1  Files: 1"));
}

TEST_F(QualAppTest, CheckModRsOnlySkipsContent)
{
    EXPECT_CALL(*filesystem_ptr_, list_source_files("."))
        .WillOnce(Return(std::vector<std::string>{"src/util/mod.rs", "src/main.rs"}));
    EXPECT_CALL(*filesystem_ptr_, read_file(_)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::CHECK, .analyzer = "mod_rs", .width = 80}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Total issues: 1  Fixable: 1  Files: 1"));
}

TEST_F(QualAppTest, CheckCleanFile)
{
    serve("ok.rs", "fn main() {\n    run();\n}\n");

    EXPECT_EQ(run(Config{.command = Command::CHECK}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("No issues found in 1 files."));
}

TEST_F(QualAppTest, ParseErrorIsReportedPerFile)
{
    EXPECT_CALL(*filesystem_ptr_, list_source_files("."))
        .WillOnce(Return(std::vector<std::string>{"bad.rs", "ok.rs"}));
    EXPECT_CALL(*filesystem_ptr_, read_file("bad.rs")).WillOnce(Return("fn main() {\n"));
    EXPECT_CALL(*filesystem_ptr_, read_file("ok.rs")).WillOnce(Return("fn ok() {}\n"));

    EXPECT_EQ(run(Config{.command = Command::CHECK}), 1);
    EXPECT_THAT(errors_.str(), HasSubstr("Error processing bad.rs: Parse error"));
    EXPECT_THAT(output_.str(), HasSubstr("No issues found in 2 files."));
}

TEST_F(QualAppTest, FixWritesRewrittenSource)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*filesystem_ptr_, write_file("main.rs",
                                             "use std::fs::remove_file;\n"
                                             "fn main() {\n"
                                             "    remove_file(\"a\");\n"
                                             "    println!(\"{}\", 1);\n"
                                             "}\n"))
        .WillOnce(Return(true));

    EXPECT_EQ(run(Config{.command = Command::FIX}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Fixed 2 issues in main.rs"));
}

TEST_F(QualAppTest, FixDryRunWritesNothing)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*filesystem_ptr_, write_file(_, _)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::FIX, .dry_run = true}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Dry run - no files modified. 2 issues would be fixed."));
}

TEST_F(QualAppTest, FixWriteFailureIsAnError)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*filesystem_ptr_, write_file(_, _)).WillOnce(Return(false));

    EXPECT_EQ(run(Config{.command = Command::FIX}), 1);
    EXPECT_THAT(errors_.str(), HasSubstr("Error: Failed to write main.rs"));
}

TEST_F(QualAppTest, FixMovesModRsAfterContentFixes)
{
    serve("src/util/mod.rs", "pub fn helper() {\n    std::fs::remove_file(\"a\");\n}\n");
    const std::string fixed = "use std::fs::remove_file;\npub fn helper() {\n    remove_file(\"a\");\n}\n";
    {
        ::testing::InSequence sequence;
        EXPECT_CALL(*filesystem_ptr_, write_file("src/util/mod.rs", fixed)).WillOnce(Return(true));
        EXPECT_CALL(*filesystem_ptr_, file_exists("src/util.rs")).WillOnce(Return(false));
        EXPECT_CALL(*filesystem_ptr_, write_file("src/util.rs", _)).WillOnce(Return(true));
        EXPECT_CALL(*filesystem_ptr_, remove_file("src/util/mod.rs")).WillOnce(Return(true));
        EXPECT_CALL(*filesystem_ptr_, remove_directory_if_empty("src/util"));
    }

    EXPECT_EQ(run(Config{.command = Command::FIX}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Fixed 1 issues in src/util/mod.rs"));
    EXPECT_THAT(output_.str(), HasSubstr("Fixed 1 mod.rs files"));
}

TEST_F(QualAppTest, FixDryRunListsModRsMoves)
{
    serve("src/util/mod.rs", "pub fn helper() {}\n");
    EXPECT_CALL(*filesystem_ptr_, write_file(_, _)).Times(0);
    EXPECT_CALL(*filesystem_ptr_, remove_file(_)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::FIX, .analyzer = "mod_rs", .dry_run = true}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Would fix: src/util/mod.rs -> src/util.rs"));
    EXPECT_THAT(output_.str(), HasSubstr("Dry run - no files modified. 1 issues would be fixed."));
}

TEST_F(QualAppTest, FixModRsConflictIsAnError)
{
    serve("src/util/mod.rs", "pub fn helper() {}\n");
    EXPECT_CALL(*filesystem_ptr_, file_exists("src/util.rs")).WillOnce(Return(true));
    EXPECT_CALL(*filesystem_ptr_, remove_file(_)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::FIX, .analyzer = "mod_rs"}), 1);
    EXPECT_THAT(errors_.str(), HasSubstr("Error processing src/util/mod.rs"));
    EXPECT_THAT(errors_.str(), HasSubstr("already exists"));
}

TEST_F(QualAppTest, DiffSummaryNeverWrites)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*filesystem_ptr_, write_file(_, _)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::DIFF, .diff_mode = DiffMode::SUMMARY}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("main.rs: 2 changes (path_import: 1, empty_lines: 1)"));
}

TEST_F(QualAppTest, DiffWithNothingToChange)
{
    serve("ok.rs", "fn main() {\n    println!(\"{}\", 1);\n}\n");

    EXPECT_EQ(run(Config{.command = Command::DIFF}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("No changes proposed"));
}

TEST_F(QualAppTest, InteractiveAppliesAcceptedEntries)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillOnce(Return(true));
    EXPECT_CALL(*terminal_ptr_, read_line())
        .WillOnce(Return(std::optional<std::string>("y")))
        .WillOnce(Return(std::optional<std::string>("n")));
    EXPECT_CALL(*filesystem_ptr_, write_file("main.rs",
                                             "use std::fs::remove_file;\n"
                                             "fn main() {\n"
                                             "    remove_file(\"a\");\n"
                                             "\n"
                                             "    println!(\"{}\", 1);\n"
                                             "}\n"))
        .WillOnce(Return(true));

    EXPECT_EQ(run(Config{.command = Command::DIFF, .diff_mode = DiffMode::INTERACTIVE}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Applied 1 changes to main.rs (1 imports added)"));
}

TEST_F(QualAppTest, InteractiveApplyComposesSameLineFixesAndKeepsCrlf)
{
    serve("main.rs", "fn main() {\r\n"
                     "    let a = std::fs::read(\"x\"); let b = std::env::var(\"y\");\r\n"
                     "}");
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillOnce(Return(true));
    EXPECT_CALL(*terminal_ptr_, read_line()).WillOnce(Return(std::optional<std::string>("a")));
    EXPECT_CALL(*filesystem_ptr_, write_file("main.rs",
                                             "use std::{env::var, fs::read};\r\n"
                                             "fn main() {\r\n"
                                             "    let a = read(\"x\"); let b = var(\"y\");\r\n"
                                             "}"))
        .WillOnce(Return(true));

    EXPECT_EQ(run(Config{.command = Command::DIFF, .diff_mode = DiffMode::INTERACTIVE}), 0);
    EXPECT_THAT(output_.str(), HasSubstr("Applied 2 changes to main.rs (1 imports added)"));
    EXPECT_THAT(errors_.str(), Not(HasSubstr("Skipped")));
}

TEST_F(QualAppTest, InteractiveDryRunWritesNothing)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillOnce(Return(true));
    EXPECT_CALL(*terminal_ptr_, read_line()).WillOnce(Return(std::optional<std::string>("a")));
    EXPECT_CALL(*filesystem_ptr_, write_file(_, _)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::DIFF,
                         .dry_run = true,
                         .diff_mode = DiffMode::INTERACTIVE}),
              0);
    EXPECT_THAT(output_.str(), HasSubstr("Dry run - no files modified. 2 changes selected."));
}

TEST_F(QualAppTest, InteractiveWithoutTerminalFallsBackToFullDiff)
{
    serve("main.rs", sample_);
    EXPECT_CALL(*terminal_ptr_, is_interactive()).WillOnce(Return(false));
    EXPECT_CALL(*terminal_ptr_, read_line()).Times(0);
    EXPECT_CALL(*filesystem_ptr_, write_file(_, _)).Times(0);

    EXPECT_EQ(run(Config{.command = Command::DIFF, .diff_mode = DiffMode::INTERACTIVE}), 0);
    EXPECT_THAT(errors_.str(), HasSubstr("Warning:"));
    EXPECT_THAT(output_.str(), HasSubstr("DIFF OUTPUT"));
}

} // namespace qual
