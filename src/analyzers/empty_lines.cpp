#include "qual/analyzers/empty_lines.hpp"
#include "qual/core/issue.hpp"
#include "qual/core/syntax_tree.hpp"
#include "qual/string_utils.hpp"
#include <set>
#include <utility>

namespace qual {

namespace {

// Blank lines hugging the braces are layout, not paragraph breaks
auto is_after_opening_brace(const std::vector<std::string>& lines, size_t index) -> bool {
    return index > 0 && StringUtils::trim(lines[index - 1]).ends_with('{');
}

auto is_before_closing_brace(const std::vector<std::string>& lines, size_t index) -> bool {
    return index + 1 < lines.size() && StringUtils::trim(lines[index + 1]).starts_with('}');
}

} // namespace

auto EmptyLinesAnalyzer::analyze(const SyntaxTree& tree, std::string_view source) const
    -> AnalysisResult {
    auto lines = split_lines(source);
    auto literal_lines = lines_inside_literals(tree);
    std::set<size_t> in_literal(literal_lines.begin(), literal_lines.end());

    std::vector<Issue> issues;
    for (const auto& body : find_function_bodies(tree)) {
        for (size_t line = body.open_line + 1; line + 1 < body.close_line; ++line) {
            size_t index = line - 1;
            if (index >= lines.size() || !StringUtils::is_blank(lines[index])) {
                continue;
            }
            if (in_literal.contains(line) || is_after_opening_brace(lines, index)
                || is_before_closing_brace(lines, index)) {
                continue;
            }

            issues.push_back(
                Issue{.line = line,
                      .column = 1,
                      .message = "Empty line in function body indicates untamed complexity",
                      .fix = SimpleFix{.replacement = ""}});
        }
    }

    return make_analysis_result(std::move(issues));
}

auto EmptyLinesAnalyzer::fix(SyntaxTree& tree) const -> size_t {
    auto result = analyze(tree, unparse(tree));

    size_t removed = 0;
    for (auto it = result.issues.rbegin(); it != result.issues.rend(); ++it) {
        if (tree.remove_blank_line(it->line)) {
            ++removed;
        }
    }
    return removed;
}

} // namespace qual
