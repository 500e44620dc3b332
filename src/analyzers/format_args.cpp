#include "qual/analyzers/format_args.hpp"
#include "qual/core/issue.hpp"
#include "qual/core/syntax_tree.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace qual {

namespace {

constexpr std::array<std::string_view, 7> kFormatMacros = {
    "format", "print", "println", "eprint", "eprintln", "write", "writeln"};

auto is_format_macro(std::string_view name) -> bool {
    return std::find(kFormatMacros.begin(), kFormatMacros.end(), name) != kFormatMacros.end();
}

auto is_string_literal(const Token& token) -> bool {
    if (token.kind != TokenKind::LITERAL) {
        return false;
    }
    const auto& text = token.text;
    return text.starts_with('"') || text.starts_with("r\"") || text.starts_with("r#");
}

// Counts `{}`, `{:?}`, `{0}` style placeholders; `{{` is an escaped brace and
// `{name}` is already named
auto count_positional_placeholders(std::string_view literal) -> size_t {
    size_t count = 0;
    size_t i = 0;

    while (i < literal.size()) {
        if (literal[i] != '{') {
            ++i;
            continue;
        }
        if (i + 1 < literal.size() && literal[i + 1] == '{') {
            i += 2;
            continue;
        }

        auto close = literal.find('}', i + 1);
        if (close == std::string_view::npos) {
            break;
        }

        auto placeholder = literal.substr(i + 1, close - i - 1);
        auto argument = placeholder.substr(0, placeholder.find(':'));
        bool positional = std::all_of(argument.begin(), argument.end(), [](char ch) {
            return std::isdigit(static_cast<unsigned char>(ch)) != 0;
        });
        if (positional) {
            ++count;
        }
        i = close + 1;
    }

    return count;
}

auto uses_positional_arguments(const SyntaxTree& tree, size_t open) -> bool {
    auto close = tree.matching(open);
    size_t format_string = SyntaxTree::npos;

    for (size_t i = open + 1; i < close; ++i) {
        if (tree[i].kind == TokenKind::OPEN_DELIM) {
            i = tree.matching(i);
            continue;
        }
        if (format_string == SyntaxTree::npos) {
            if (is_string_literal(tree[i])) {
                if (count_positional_placeholders(tree[i].text) == 0) {
                    return false;
                }
                format_string = i;
            }
        } else if (tree.is(i, ",")) {
            return true;
        }
    }

    return false;
}

} // namespace

auto FormatArgsAnalyzer::analyze(const SyntaxTree& tree,
                                 [[maybe_unused]] std::string_view source) const
    -> AnalysisResult {
    std::vector<Issue> issues;
    size_t i = 0;

    while (i + 2 < tree.size()) {
        const auto& token = tree[i];
        bool invocation = token.kind == TokenKind::IDENT && tree.is(i + 1, "!")
                          && tree[i + 1].leading_trivia.empty()
                          && tree[i + 2].kind == TokenKind::OPEN_DELIM;
        if (!invocation) {
            ++i;
            continue;
        }

        if (is_format_macro(token.text) && uses_positional_arguments(tree, i + 2)) {
            issues.push_back(Issue{.line = token.line,
                                   .column = token.column,
                                   .message = "Use named format arguments instead of positional"});
        }
        i = tree.matching(i + 2) + 1;
    }

    return make_analysis_result(std::move(issues));
}

auto FormatArgsAnalyzer::fix([[maybe_unused]] SyntaxTree& tree) const -> size_t { return 0; }

} // namespace qual
