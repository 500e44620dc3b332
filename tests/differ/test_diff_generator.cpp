#include "qual/analyzers/empty_lines.hpp"
#include "qual/analyzers/format_args.hpp"
#include "qual/analyzers/path_import.hpp"
#include "qual/core/errors.hpp"
#include "qual/differ/diff_generator.hpp"
#include "qual/parsers/source_parser.hpp"
#include "../test_mocks.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace qual {

class DiffGeneratorTest : public ::testing::Test {
protected:
    auto single(std::unique_ptr<IAnalyzer> analyzer) -> AnalyzerList
    {
        AnalyzerList analyzers;
        analyzers.push_back(std::move(analyzer));
        return analyzers;
    }

    MockFileSystem filesystem_;
    SourceParser parser_;
};

TEST_F(DiffGeneratorTest, PreviewsPathImport)
{
    std::string content = "fn main() { let x = std::fs::read_to_string(\"f\"); }";
    EXPECT_CALL(filesystem_, read_file("main.rs")).WillOnce(Return(content));
    EXPECT_CALL(filesystem_, write_file(_, _)).Times(0);

    auto diff = generate_diff("main.rs", single(std::make_unique<PathImportAnalyzer>()),
                              filesystem_, parser_);

    ASSERT_EQ(diff.entries.size(), 1u);
    const auto& entry = diff.entries[0];
    EXPECT_EQ(diff.path, "main.rs");
    EXPECT_EQ(entry.line, 1u);
    EXPECT_EQ(entry.analyzer, "path_import");
    EXPECT_EQ(entry.original, content);
    EXPECT_EQ(entry.modified, "fn main() { let x = read_to_string(\"f\"); }");
    ASSERT_TRUE(entry.import.has_value());
    EXPECT_EQ(*entry.import, "use std::fs::read_to_string;");
    EXPECT_EQ(entry.description, "Use import instead of path: std::fs::read_to_string");
}

TEST_F(DiffGeneratorTest, SkipsIssuesWithoutFix)
{
    EXPECT_CALL(filesystem_, read_file("a.rs"))
        .WillOnce(Return("fn main() {\n    println!(\"{}\", 1);\n}\n"));

    auto diff = generate_diff("a.rs", single(std::make_unique<FormatArgsAnalyzer>()),
                              filesystem_, parser_);

    EXPECT_TRUE(diff.empty());
}

TEST_F(DiffGeneratorTest, EmptyLineEntriesReplaceWithNothing)
{
    EXPECT_CALL(filesystem_, read_file("a.rs"))
        .WillOnce(Return("fn f() {\n    a();\n    \n    b();\n}\n"));

    auto diff = generate_diff("a.rs", single(std::make_unique<EmptyLinesAnalyzer>()),
                              filesystem_, parser_);

    ASSERT_EQ(diff.entries.size(), 1u);
    EXPECT_EQ(diff.entries[0].line, 3u);
    EXPECT_EQ(diff.entries[0].original, "    ");
    EXPECT_EQ(diff.entries[0].modified, "");
    EXPECT_FALSE(diff.entries[0].import.has_value());
}

TEST_F(DiffGeneratorTest, ReplacesFirstOccurrenceOnly)
{
    auto analyzer = std::make_unique<MockAnalyzer>();
    EXPECT_CALL(*analyzer, name()).WillRepeatedly(Return(std::string_view("mock")));
    EXPECT_CALL(*analyzer, analyze(_, _))
        .WillOnce(Return(make_analysis_result(
            {Issue{.line = 1,
                   .column = 1,
                   .message = "m",
                   .fix = ImportFix{.import_statement = "use a::b::f;",
                                    .search_pattern = "a::b::f",
                                    .replacement = "f"}}})));
    EXPECT_CALL(filesystem_, read_file("x.rs")).WillOnce(Return("g(a::b::f(), a::b::f());\n"));

    auto diff = generate_diff("x.rs", single(std::move(analyzer)), filesystem_, parser_);

    ASSERT_EQ(diff.entries.size(), 1u);
    EXPECT_EQ(diff.entries[0].modified, "g(f(), a::b::f());");
}

TEST_F(DiffGeneratorTest, SpacedPathPreviewMatchesSourceText)
{
    EXPECT_CALL(filesystem_, read_file("s.rs"))
        .WillOnce(Return("fn main() {\n    let d = std:: fs::read(p);\n}\n"));

    auto diff = generate_diff("s.rs", single(std::make_unique<PathImportAnalyzer>()),
                              filesystem_, parser_);

    ASSERT_EQ(diff.entries.size(), 1u);
    EXPECT_EQ(diff.entries[0].original, "    let d = std:: fs::read(p);");
    EXPECT_EQ(diff.entries[0].modified, "    let d = read(p);");
    EXPECT_EQ(diff.entries[0].search_pattern, "std:: fs::read");
    EXPECT_EQ(diff.entries[0].replacement, "read");
    EXPECT_EQ(*diff.entries[0].import, "use std::fs::read;");
}

TEST_F(DiffGeneratorTest, PathBrokenAcrossLinesHasNoPreview)
{
    EXPECT_CALL(filesystem_, read_file("s.rs"))
        .WillOnce(Return("fn main() {\n    let d = std::\n        fs::read(p);\n}\n"));

    auto diff = generate_diff("s.rs", single(std::make_unique<PathImportAnalyzer>()),
                              filesystem_, parser_);

    EXPECT_TRUE(diff.empty());
}

TEST_F(DiffGeneratorTest, OutOfRangeLineGivesEmptyText)
{
    auto analyzer = std::make_unique<MockAnalyzer>();
    EXPECT_CALL(*analyzer, name()).WillRepeatedly(Return(std::string_view("mock")));
    EXPECT_CALL(*analyzer, analyze(_, _))
        .WillOnce(Return(make_analysis_result(
            {Issue{.line = 42, .column = 1, .message = "m", .fix = SimpleFix{.replacement = "x"}}})));
    EXPECT_CALL(filesystem_, read_file("x.rs")).WillOnce(Return("fn f() {}\n"));

    auto diff = generate_diff("x.rs", single(std::move(analyzer)), filesystem_, parser_);

    ASSERT_EQ(diff.entries.size(), 1u);
    EXPECT_EQ(diff.entries[0].original, "");
    EXPECT_EQ(diff.entries[0].modified, "x");
}

TEST_F(DiffGeneratorTest, ParseErrorPropagates)
{
    EXPECT_CALL(filesystem_, read_file("bad.rs")).WillOnce(Return("fn main() {\n"));
    EXPECT_CALL(filesystem_, write_file(_, _)).Times(0);

    EXPECT_THROW(generate_diff("bad.rs", single(std::make_unique<PathImportAnalyzer>()),
                               filesystem_, parser_),
                 ParseError);
}

TEST_F(DiffGeneratorTest, ReadErrorPropagates)
{
    EXPECT_CALL(filesystem_, read_file("gone.rs"))
        .WillOnce(Throw(IoError("gone.rs", "No such file")));

    EXPECT_THROW(generate_diff("gone.rs", single(std::make_unique<PathImportAnalyzer>()),
                               filesystem_, parser_),
                 IoError);
}

TEST_F(DiffGeneratorTest, TreeIsLeftUntouched)
{
    std::string content = "fn main() {\n    std::fs::remove_file(p);\n\n    done();\n}\n";
    auto tree = parse_source(content);
    AnalyzerList analyzers;
    analyzers.push_back(std::make_unique<PathImportAnalyzer>());
    analyzers.push_back(std::make_unique<EmptyLinesAnalyzer>());

    auto first = compute_file_diff("m.rs", content, tree, analyzers);
    auto second = compute_file_diff("m.rs", content, tree, analyzers);

    EXPECT_EQ(unparse(tree), content);
    EXPECT_EQ(first.entries.size(), 2u);
    EXPECT_EQ(first.entries, second.entries);
}

} // namespace qual
