#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace qual {

// File read or write failure
class IoError : public std::runtime_error {
public:
    IoError(std::string path, const std::string& reason);

    auto path() const -> const std::string& { return path_; }

private:
    std::string path_;
};

// Source text that does not lex or does not balance its delimiters
class ParseError : public std::runtime_error {
public:
    ParseError(size_t line, size_t column, const std::string& reason);

    auto line() const -> size_t { return line_; }
    auto column() const -> size_t { return column_; }

private:
    size_t line_{};
    size_t column_{};
};

// Invalid command-line input, e.g. an unknown analyzer name
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message);
};

} // namespace qual
