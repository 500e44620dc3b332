#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace qual {

enum class TokenKind {
    IDENT,
    LIFETIME,
    LITERAL,
    PUNCT,
    OPEN_DELIM,
    CLOSE_DELIM
};

struct Token {
    TokenKind kind = TokenKind::PUNCT;
    std::string leading_trivia;  // Whitespace and comments before the token
    std::string text;
    size_t offset{};             // Byte offset of text in the source
    size_t line{};               // 1-based
    size_t column{};             // 1-based, in characters
    size_t partner = static_cast<size_t>(-1);  // Matching delimiter (delimiters only)
};

// Function body located by find_function_bodies()
struct FunctionBody {
    std::string name;
    size_t open_index{};   // Token index of '{'
    size_t close_index{};  // Token index of '}'
    size_t open_line{};
    size_t close_line{};
};

// Lossless token tree: every byte of the source lives either in a token's
// text or in trivia, so unparse(parse_source(text)) == text. Delimiters are
// matched at parse time; a tree that exists is always balanced.
class SyntaxTree {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    SyntaxTree() = default;
    SyntaxTree(std::vector<Token> tokens, std::string trailing_trivia);

    auto tokens() const -> const std::vector<Token>& { return tokens_; }
    auto size() const -> size_t { return tokens_.size(); }
    auto empty() const -> bool { return tokens_.empty(); }
    auto operator[](size_t index) const -> const Token& { return tokens_[index]; }
    auto trailing_trivia() const -> const std::string& { return trailing_trivia_; }

    // Index of the delimiter matching `index`; npos for anything else
    auto matching(size_t index) const -> size_t;

    // Token-wise text comparison; false when out of range
    auto is(size_t index, std::string_view text) const -> bool;

    // Mutations rewrite the source text and re-lex it. They throw ParseError
    // when the rewritten text no longer balances.

    // Replace tokens [first, last) by `replacement`; the leading trivia of
    // `first` is kept
    auto splice(size_t first, size_t last, std::string_view replacement) -> void;

    // Insert `content` as a new physical line before 1-based `line`
    // (line count + 1 appends)
    auto insert_line(size_t line, std::string_view content) -> void;

    // Remove 1-based physical `line` if it holds only whitespace
    auto remove_blank_line(size_t line) -> bool;

private:
    auto reparse(const std::string& text) -> void;

    std::vector<Token> tokens_;
    std::string trailing_trivia_;
};

auto parse_source(std::string_view text) -> SyntaxTree;
auto unparse(const SyntaxTree& tree) -> std::string;

// Line helpers matching how the diff generator indexes source lines
auto split_lines(std::string_view text) -> std::vector<std::string>;
auto join_lines(const std::vector<std::string>& lines, std::string_view ending = "\n",
                bool final_newline = true) -> std::string;

// "\r\n" when the first line break is CRLF, "\n" otherwise
auto detect_line_ending(std::string_view text) -> std::string;
auto ends_with_newline(std::string_view text) -> bool;  // true for empty text

// Bodies of `fn` items, outermost only (bodies nested in another body are
// covered by the enclosing one)
auto find_function_bodies(const SyntaxTree& tree) -> std::vector<FunctionBody>;

// Physical lines a multi-line literal continues onto
auto lines_inside_literals(const SyntaxTree& tree) -> std::vector<size_t>;

} // namespace qual
