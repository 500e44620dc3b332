#include "qual/analyzers/inline_comments.hpp"
#include "qual/core/issue.hpp"
#include "qual/core/syntax_tree.hpp"
#include "qual/string_utils.hpp"
#include <optional>
#include <set>
#include <utility>

namespace qual {

namespace {

// The code a comment describes: the next line that is neither blank, another
// comment, nor a closing brace
auto find_related_code(const std::vector<std::string>& lines, size_t comment_index)
    -> std::optional<std::string> {
    for (size_t i = comment_index + 1; i < lines.size(); ++i) {
        auto trimmed = StringUtils::trim(lines[i]);
        if (trimmed.empty() || trimmed.starts_with("//") || trimmed.starts_with('}')) {
            continue;
        }
        return std::string(trimmed);
    }
    return std::nullopt;
}

auto comment_text(std::string_view trimmed) -> std::string {
    auto start = trimmed.find_first_not_of('/');
    if (start == std::string_view::npos) {
        return "";
    }
    return std::string(StringUtils::trim(trimmed.substr(start)));
}

} // namespace

auto InlineCommentsAnalyzer::analyze(const SyntaxTree& tree, std::string_view source) const
    -> AnalysisResult {
    auto lines = split_lines(source);
    auto literal_lines = lines_inside_literals(tree);
    std::set<size_t> in_literal(literal_lines.begin(), literal_lines.end());

    std::vector<Issue> issues;
    for (const auto& body : find_function_bodies(tree)) {
        for (size_t line = body.open_line; line < body.close_line; ++line) {
            size_t index = line - 1;
            if (index >= lines.size() || in_literal.contains(line)) {
                continue;
            }

            auto trimmed = StringUtils::trim(lines[index]);
            if (!trimmed.starts_with("//") || trimmed.starts_with("///")) {
                continue;
            }

            auto text = comment_text(trimmed);
            std::string note = "/// - " + text;
            if (auto code = find_related_code(lines, index)) {
                note += " - `" + *code + "`";
            }

            issues.push_back(Issue{.line = line,
                                   .column = 1,
                                   .message = "Inline comment found: \"" + text
                                              + "\"; move it to the doc block # Notes section as: "
                                              + note});
        }
    }

    return make_analysis_result(std::move(issues));
}

auto InlineCommentsAnalyzer::fix([[maybe_unused]] SyntaxTree& tree) const -> size_t { return 0; }

} // namespace qual
