#include "qual/analyzers/path_import.hpp"
#include "qual/core/import_grouper.hpp"
#include "qual/core/issue.hpp"
#include "qual/core/syntax_tree.hpp"
#include "qual/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <utility>

namespace qual {

namespace {

constexpr size_t npos = SyntaxTree::npos;

struct PathMatch {
    size_t first{};  // Token index of the first segment
    size_t last{};   // Token index of the last segment
    std::vector<std::string> segments;

    auto joined() const -> std::string {
        std::string path;
        for (const auto& segment : segments) {
            if (!path.empty()) {
                path += "::";
            }
            path += segment;
        }
        return path;
    }

    // The path exactly as written, inner whitespace and comments included
    auto source_text(const SyntaxTree& tree) const -> std::string {
        auto text = tree[first].text;
        for (auto k = first + 1; k <= last; ++k) {
            text += tree[k].leading_trivia;
            text += tree[k].text;
        }
        return text;
    }
};

auto first_char(const std::string& name) -> unsigned char {
    if (name.starts_with("r#") && name.size() > 2) {
        return static_cast<unsigned char>(name[2]);
    }
    return name.empty() ? 0 : static_cast<unsigned char>(name.front());
}

auto is_uppercase_start(const std::string& name) -> bool {
    return std::isupper(first_char(name)) != 0;
}

auto is_screaming_snake_case(const std::string& name) -> bool {
    return std::all_of(name.begin(), name.end(), [](char ch) {
        auto byte = static_cast<unsigned char>(ch);
        return std::isupper(byte) != 0 || std::isdigit(byte) != 0 || ch == '_';
    });
}

auto is_stdlib_root(const std::string& name) -> bool {
    return name == "std" || name == "core" || name == "alloc";
}

// Module paths to free functions; types, enum variants, associated items and
// constants stay qualified
auto should_extract_to_import(const std::vector<std::string>& segments) -> bool {
    if (segments.size() < 2) {
        return false;
    }

    const auto& first = segments.front();
    const auto& last = segments.back();
    const auto& parent = segments[segments.size() - 2];

    if (is_uppercase_start(first) || is_screaming_snake_case(last) || is_uppercase_start(last)
        || is_uppercase_start(parent)) {
        return false;
    }

    if (is_stdlib_root(first)) {
        return true;
    }

    return segments.size() >= 3 && std::islower(first_char(first)) != 0;
}

// Index one past the end of the token group opened at `open`
auto skip_group(const SyntaxTree& tree, size_t open) -> size_t {
    auto close = tree.matching(open);
    return close == npos ? tree.size() : close + 1;
}

// Index one past the `>` closing the generic argument list opened at `open`;
// npos when the list does not close before the statement ends
auto skip_generic_args(const SyntaxTree& tree, size_t open) -> size_t {
    int depth = 0;
    size_t i = open;
    while (i < tree.size()) {
        const auto& token = tree[i];
        if (token.kind == TokenKind::OPEN_DELIM) {
            i = skip_group(tree, i);
            continue;
        }
        if (token.kind == TokenKind::CLOSE_DELIM || token.text == ";") {
            return npos;
        }
        if (token.text == "<") {
            ++depth;
        } else if (token.text == ">" && !(token.leading_trivia.empty() && tree.is(i - 1, "-"))) {
            if (--depth == 0) {
                return i + 1;
            }
        }
        ++i;
    }
    return npos;
}

// End of a `use` declaration starting at `start`
auto skip_use_declaration(const SyntaxTree& tree, size_t start) -> size_t {
    size_t i = start;
    while (i < tree.size()) {
        if (tree[i].kind == TokenKind::OPEN_DELIM) {
            i = skip_group(tree, i);
        } else if (tree[i].kind == TokenKind::CLOSE_DELIM) {
            return i;
        } else if (tree.is(i, ";")) {
            return i + 1;
        } else {
            ++i;
        }
    }
    return i;
}

auto is_macro_invocation(const SyntaxTree& tree, size_t i) -> bool {
    return tree[i].kind == TokenKind::IDENT && tree.is(i + 1, "!")
           && tree[i + 1].leading_trivia.empty();
}

auto is_value_position(const SyntaxTree& tree, size_t first, size_t after) -> bool {
    if (tree.is(after, "(")) {
        return true;
    }
    if (first == 0) {
        return false;
    }

    const auto& before = tree[first - 1].text;
    bool opens = before == "(" || before == "," || before == "=";
    bool closes = tree.is(after, ")") || tree.is(after, ",") || tree.is(after, ";");
    return opens && closes;
}

auto find_extractable_paths(const SyntaxTree& tree) -> std::vector<PathMatch> {
    std::vector<PathMatch> matches;
    size_t i = 0;

    while (i < tree.size()) {
        const auto& token = tree[i];

        if (token.kind == TokenKind::IDENT && token.text == "use") {
            i = skip_use_declaration(tree, i + 1);
            continue;
        }

        // Attributes: #[...] and #![...]
        if (token.text == "#") {
            size_t open = tree.is(i + 1, "!") ? i + 2 : i + 1;
            if (tree.is(open, "[")) {
                i = skip_group(tree, open);
                continue;
            }
        }

        // Macro bodies are unparsed token streams
        if (is_macro_invocation(tree, i)) {
            size_t open = i + 2;
            if (token.text == "macro_rules" && open < tree.size()
                && tree[open].kind == TokenKind::IDENT) {
                ++open;
            }
            if (open < tree.size() && tree[open].kind == TokenKind::OPEN_DELIM) {
                i = skip_group(tree, open);
                continue;
            }
        }

        bool starts_path = token.kind == TokenKind::IDENT && !(i > 0 && tree.is(i - 1, "::"))
                           && tree.is(i + 1, "::") && i + 2 < tree.size()
                           && tree[i + 2].kind == TokenKind::IDENT;
        if (!starts_path) {
            ++i;
            continue;
        }

        PathMatch match{.first = i, .last = i, .segments = {token.text}};
        while (tree.is(match.last + 1, "::") && match.last + 2 < tree.size()
               && tree[match.last + 2].kind == TokenKind::IDENT) {
            match.last += 2;
            match.segments.push_back(tree[match.last].text);
        }

        size_t after = match.last + 1;
        if (tree.is(after, "::") && tree.is(after + 1, "<")) {
            after = skip_generic_args(tree, after + 1);
            if (after == npos) {
                i = match.last + 1;
                continue;
            }
        }

        // The path continues past generic arguments or into a glob/group
        if (tree.is(after, "::")) {
            i = after;
            continue;
        }

        if (is_value_position(tree, match.first, after)
            && should_extract_to_import(match.segments)) {
            matches.push_back(std::move(match));
        }
        i = after;
    }

    return matches;
}

} // namespace

auto PathImportAnalyzer::analyze(const SyntaxTree& tree,
                                 [[maybe_unused]] std::string_view source) const
    -> AnalysisResult {
    std::vector<Issue> issues;

    for (const auto& match : find_extractable_paths(tree)) {
        auto path = match.joined();
        const auto& head = tree[match.first];

        issues.push_back(Issue{.line = head.line,
                               .column = head.column,
                               .message = "Use import instead of path: " + path,
                               .fix = ImportFix{.import_statement = "use " + path + ";",
                                                .search_pattern = match.source_text(tree),
                                                .replacement = match.segments.back()}});
    }

    return make_analysis_result(std::move(issues));
}

auto PathImportAnalyzer::fix(SyntaxTree& tree) const -> size_t {
    auto matches = find_extractable_paths(tree);
    if (matches.empty()) {
        return 0;
    }

    // Back to front so earlier token indices stay valid
    for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
        tree.splice(it->first, it->last + 1, it->segments.back());
    }

    std::set<std::string> present;
    for (const auto& line : split_lines(unparse(tree))) {
        present.emplace(StringUtils::trim(line));
    }

    std::vector<std::string> imports;
    for (const auto& match : matches) {
        auto statement = "use " + match.joined() + ";";
        if (!present.contains(statement)) {
            imports.push_back(std::move(statement));
        }
    }

    auto insert_at = find_import_insertion_line(tree);
    for (const auto& statement : group_imports(imports)) {
        if (!present.contains(statement)) {
            tree.insert_line(insert_at++, statement);
        }
    }

    return matches.size();
}

} // namespace qual
