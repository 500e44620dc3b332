#include "qual/core/syntax_tree.hpp"
#include "qual/core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace qual {

namespace {

constexpr size_t npos = SyntaxTree::npos;

auto is_ident_start(char ch) -> bool {
    auto byte = static_cast<unsigned char>(ch);
    return std::isalpha(byte) != 0 || ch == '_' || byte >= 0x80;
}

auto is_ident_continue(char ch) -> bool {
    auto byte = static_cast<unsigned char>(ch);
    return std::isalnum(byte) != 0 || ch == '_' || byte >= 0x80;
}

auto closing_for(char open) -> char {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    case '{':
        return '}';
    default:
        return '\0';
    }
}

auto utf8_length(char lead) -> size_t {
    auto byte = static_cast<unsigned char>(lead);
    if (byte < 0x80) {
        return 1;
    }
    if ((byte & 0xE0) == 0xC0) {
        return 2;
    }
    if ((byte & 0xF0) == 0xE0) {
        return 3;
    }
    return 4;
}

class Lexer {
public:
    explicit Lexer(std::string_view text) : text_(text) {}

    auto run() -> SyntaxTree {
        std::vector<Token> tokens;
        std::vector<size_t> open_stack;
        std::string trailing;

        while (true) {
            auto trivia = take_trivia();
            if (at_end()) {
                trailing = std::move(trivia);
                break;
            }

            Token token;
            token.leading_trivia = std::move(trivia);
            token.offset = pos_;
            token.line = line_;
            token.column = column_;
            lex_token(token);

            if (token.kind == TokenKind::OPEN_DELIM) {
                open_stack.push_back(tokens.size());
            } else if (token.kind == TokenKind::CLOSE_DELIM) {
                if (open_stack.empty()) {
                    throw ParseError(token.line, token.column,
                                     "unexpected closing delimiter '" + token.text + "'");
                }
                auto open_index = open_stack.back();
                if (closing_for(tokens[open_index].text.front()) != token.text.front()) {
                    throw ParseError(token.line, token.column,
                                     "mismatched closing delimiter '" + token.text + "'");
                }
                open_stack.pop_back();
                token.partner = open_index;
                tokens[open_index].partner = tokens.size();
            }

            tokens.push_back(std::move(token));
        }

        if (!open_stack.empty()) {
            const auto& open = tokens[open_stack.back()];
            throw ParseError(open.line, open.column, "unclosed delimiter '" + open.text + "'");
        }

        return SyntaxTree(std::move(tokens), std::move(trailing));
    }

private:
    std::string_view text_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    auto at_end() const -> bool { return pos_ >= text_.size(); }

    auto peek(size_t ahead = 0) const -> char {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    auto advance() -> char {
        char ch = text_[pos_++];
        if (ch == '\n') {
            ++line_;
            column_ = 1;
        } else if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++column_;
        }
        return ch;
    }

    auto take_trivia() -> std::string {
        auto start = pos_;

        if (pos_ == 0 && peek() == '#' && peek(1) == '!' && !inner_attribute_follows()) {
            while (!at_end() && peek() != '\n') {
                advance();
            }
        }

        while (!at_end()) {
            char ch = peek();
            if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
                advance();
            } else if (ch == '/' && peek(1) == '/') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
            } else if (ch == '/' && peek(1) == '*') {
                skip_block_comment();
            } else {
                break;
            }
        }

        return std::string(text_.substr(start, pos_ - start));
    }

    // "#!" opens a shebang line unless it starts an inner attribute "#![...]"
    auto inner_attribute_follows() const -> bool {
        size_t i = pos_ + 2;
        while (i < text_.size() && std::isspace(static_cast<unsigned char>(text_[i])) != 0) {
            ++i;
        }
        return i < text_.size() && text_[i] == '[';
    }

    auto skip_block_comment() -> void {
        auto start_line = line_;
        auto start_column = column_;
        advance();
        advance();

        size_t depth = 1;
        while (depth > 0) {
            if (at_end()) {
                throw ParseError(start_line, start_column, "unterminated block comment");
            }
            if (peek() == '/' && peek(1) == '*') {
                advance();
                advance();
                ++depth;
            } else if (peek() == '*' && peek(1) == '/') {
                advance();
                advance();
                --depth;
            } else {
                advance();
            }
        }
    }

    auto raw_string_at(size_t at) const -> bool {
        if (at >= text_.size() || text_[at] != 'r') {
            return false;
        }
        size_t i = at + 1;
        while (i < text_.size() && text_[i] == '#') {
            ++i;
        }
        return i < text_.size() && text_[i] == '"';
    }

    auto lex_token(Token& token) -> void {
        auto start = pos_;
        char ch = peek();

        if (raw_string_at(pos_)) {
            lex_raw_string();
            token.kind = TokenKind::LITERAL;
        } else if ((ch == 'b' || ch == 'c') && raw_string_at(pos_ + 1)) {
            advance();
            lex_raw_string();
            token.kind = TokenKind::LITERAL;
        } else if ((ch == 'b' || ch == 'c') && peek(1) == '"') {
            advance();
            lex_quoted('"', "string literal");
            token.kind = TokenKind::LITERAL;
        } else if (ch == 'b' && peek(1) == '\'') {
            advance();
            lex_quoted('\'', "byte literal");
            token.kind = TokenKind::LITERAL;
        } else if (is_ident_start(ch)) {
            lex_identifier();
            token.kind = TokenKind::IDENT;
        } else if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
            lex_number();
            token.kind = TokenKind::LITERAL;
        } else if (ch == '"') {
            lex_quoted('"', "string literal");
            token.kind = TokenKind::LITERAL;
        } else if (ch == '\'') {
            token.kind = lex_quote();
        } else if (ch == ':' && peek(1) == ':') {
            advance();
            advance();
            token.kind = TokenKind::PUNCT;
        } else if (ch == '(' || ch == '[' || ch == '{') {
            advance();
            token.kind = TokenKind::OPEN_DELIM;
        } else if (ch == ')' || ch == ']' || ch == '}') {
            advance();
            token.kind = TokenKind::CLOSE_DELIM;
        } else {
            advance();
            token.kind = TokenKind::PUNCT;
        }

        token.text = std::string(text_.substr(start, pos_ - start));
    }

    auto lex_identifier() -> void {
        if (peek() == 'r' && peek(1) == '#' && is_ident_start(peek(2))) {
            advance();
            advance();
        }
        while (!at_end() && is_ident_continue(peek())) {
            advance();
        }
    }

    auto lex_number() -> void {
        bool hex = peek() == '0' && (peek(1) == 'x' || peek(1) == 'X');
        while (!at_end()) {
            char ch = peek();
            char prev = pos_ > 0 ? text_[pos_ - 1] : '\0';
            if (is_ident_continue(ch)) {
                advance();
            } else if (ch == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
                advance();
            } else if (!hex && (ch == '+' || ch == '-') && (prev == 'e' || prev == 'E')) {
                advance();
            } else {
                break;
            }
        }
    }

    auto lex_quoted(char quote, const std::string& what) -> void {
        auto start_line = line_;
        auto start_column = column_;
        advance();

        while (true) {
            if (at_end()) {
                throw ParseError(start_line, start_column, "unterminated " + what);
            }
            char ch = advance();
            if (ch == '\\') {
                if (!at_end()) {
                    advance();
                }
            } else if (ch == quote) {
                return;
            }
        }
    }

    auto lex_raw_string() -> void {
        auto start_line = line_;
        auto start_column = column_;
        advance();

        size_t hashes = 0;
        while (peek() == '#') {
            advance();
            ++hashes;
        }
        advance();

        while (true) {
            if (at_end()) {
                throw ParseError(start_line, start_column, "unterminated raw string literal");
            }
            if (advance() != '"') {
                continue;
            }
            size_t closing = 0;
            while (closing < hashes && peek() == '#') {
                advance();
                ++closing;
            }
            if (closing == hashes) {
                return;
            }
        }
    }

    // A quote starts either a character literal or a lifetime/label
    auto lex_quote() -> TokenKind {
        if (peek(1) == '\\') {
            lex_quoted('\'', "character literal");
            return TokenKind::LITERAL;
        }

        if (pos_ + 1 < text_.size()) {
            auto length = utf8_length(peek(1));
            if (peek(1 + length) == '\'') {
                lex_quoted('\'', "character literal");
                return TokenKind::LITERAL;
            }
        }

        if (is_ident_start(peek(1))) {
            advance();
            while (!at_end() && is_ident_continue(peek())) {
                advance();
            }
            return TokenKind::LIFETIME;
        }

        throw ParseError(line_, column_, "invalid character literal");
    }
};

// Byte offset where 1-based `line` starts, npos when the text has fewer lines
auto line_start_offset(std::string_view source, size_t line) -> size_t {
    if (line == 0) {
        return npos;
    }

    size_t offset = 0;
    for (size_t current = 1; current < line; ++current) {
        auto newline = source.find('\n', offset);
        if (newline == std::string_view::npos) {
            return npos;
        }
        offset = newline + 1;
    }
    return offset;
}

auto find_body_open(const SyntaxTree& tree, size_t from) -> size_t {
    for (size_t i = from; i < tree.size(); ++i) {
        const auto& token = tree[i];
        if (token.kind == TokenKind::OPEN_DELIM) {
            if (token.text == "{") {
                return i;
            }
            i = token.partner;
        } else if (token.kind == TokenKind::CLOSE_DELIM
                   || (token.kind == TokenKind::PUNCT && token.text == ";")) {
            return npos;
        }
    }
    return npos;
}

} // namespace

SyntaxTree::SyntaxTree(std::vector<Token> tokens, std::string trailing_trivia)
    : tokens_(std::move(tokens)), trailing_trivia_(std::move(trailing_trivia)) {}

auto SyntaxTree::matching(size_t index) const -> size_t {
    if (index >= tokens_.size()) {
        return npos;
    }
    const auto& token = tokens_[index];
    if (token.kind != TokenKind::OPEN_DELIM && token.kind != TokenKind::CLOSE_DELIM) {
        return npos;
    }
    return token.partner;
}

auto SyntaxTree::is(size_t index, std::string_view text) const -> bool {
    return index < tokens_.size() && tokens_[index].text == text;
}

auto SyntaxTree::splice(size_t first, size_t last, std::string_view replacement) -> void {
    auto source = unparse(*this);
    last = std::min(last, tokens_.size());
    first = std::min(first, last);

    size_t begin = first < tokens_.size() ? tokens_[first].offset
                                          : source.size() - trailing_trivia_.size();
    size_t end = begin;
    if (last > first) {
        const auto& final_token = tokens_[last - 1];
        end = final_token.offset + final_token.text.size();
    }

    std::string rewritten;
    rewritten.reserve(source.size() + replacement.size());
    rewritten.append(source, 0, begin);
    rewritten.append(replacement);
    rewritten.append(source, end, std::string::npos);

    reparse(rewritten);
}

auto SyntaxTree::insert_line(size_t line, std::string_view content) -> void {
    auto source = unparse(*this);
    auto offset = line_start_offset(source, line);

    std::string inserted(content);
    inserted += '\n';

    if (offset == npos || offset > source.size()) {
        offset = source.size();
        if (!source.empty() && source.back() != '\n') {
            inserted.insert(inserted.begin(), '\n');
        }
    }

    source.insert(offset, inserted);
    reparse(source);
}

auto SyntaxTree::remove_blank_line(size_t line) -> bool {
    auto source = unparse(*this);
    auto start = line_start_offset(source, line);
    if (start == npos || start >= source.size()) {
        return false;
    }

    auto newline = source.find('\n', start);
    auto end = newline == std::string::npos ? source.size() : newline;
    auto content = std::string_view(source).substr(start, end - start);
    if (content.find_first_not_of(" \t\r") != std::string_view::npos) {
        return false;
    }

    if (newline != std::string::npos) {
        source.erase(start, end - start + 1);
    } else if (start > 0) {
        source.erase(start - 1, end - start + 1);  // Last line: drop the newline before it
    } else {
        source.clear();
    }

    reparse(source);
    return true;
}

auto SyntaxTree::reparse(const std::string& text) -> void { *this = parse_source(text); }

auto parse_source(std::string_view text) -> SyntaxTree { return Lexer(text).run(); }

auto unparse(const SyntaxTree& tree) -> std::string {
    std::string output;
    for (const auto& token : tree.tokens()) {
        output += token.leading_trivia;
        output += token.text;
    }
    output += tree.trailing_trivia();
    return output;
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t start = 0;

    while (start < text.size()) {
        auto newline = text.find('\n', start);
        auto end = newline == std::string_view::npos ? text.size() : newline;
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);

        if (newline == std::string_view::npos) {
            break;
        }
        start = newline + 1;
    }

    return lines;
}

auto join_lines(const std::vector<std::string>& lines, std::string_view ending,
                bool final_newline) -> std::string {
    std::string output;
    for (size_t i = 0; i < lines.size(); ++i) {
        output += lines[i];
        if (i + 1 < lines.size() || final_newline) {
            output += ending;
        }
    }
    return output;
}

auto detect_line_ending(std::string_view text) -> std::string {
    auto newline = text.find('\n');
    if (newline != std::string_view::npos && newline > 0 && text[newline - 1] == '\r') {
        return "\r\n";
    }
    return "\n";
}

auto ends_with_newline(std::string_view text) -> bool {
    return text.empty() || text.back() == '\n';
}

auto find_function_bodies(const SyntaxTree& tree) -> std::vector<FunctionBody> {
    std::vector<FunctionBody> bodies;
    size_t covered_until = 0;

    for (size_t i = 0; i + 1 < tree.size(); ++i) {
        if (i < covered_until) {
            continue;
        }
        if (tree[i].kind != TokenKind::IDENT || tree[i].text != "fn"
            || tree[i + 1].kind != TokenKind::IDENT) {
            continue;
        }

        auto open = find_body_open(tree, i + 2);
        if (open == npos) {
            continue;
        }

        auto close = tree.matching(open);
        bodies.push_back(FunctionBody{.name = tree[i + 1].text,
                                      .open_index = open,
                                      .close_index = close,
                                      .open_line = tree[open].line,
                                      .close_line = tree[close].line});
        covered_until = close;
    }

    return bodies;
}

auto lines_inside_literals(const SyntaxTree& tree) -> std::vector<size_t> {
    std::vector<size_t> lines;

    for (const auto& token : tree.tokens()) {
        if (token.kind != TokenKind::LITERAL) {
            continue;
        }
        auto newlines = static_cast<size_t>(std::count(token.text.begin(), token.text.end(), '\n'));
        for (size_t n = 1; n <= newlines; ++n) {
            lines.push_back(token.line + n);
        }
    }

    return lines;
}

} // namespace qual
