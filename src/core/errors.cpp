#include "qual/core/errors.hpp"
#include <utility>

namespace qual {

IoError::IoError(std::string path, const std::string& reason)
    : std::runtime_error("IO error: " + path + ": " + reason), path_(std::move(path)) {}

ParseError::ParseError(size_t line, size_t column, const std::string& reason)
    : std::runtime_error("Parse error at " + std::to_string(line) + ":" + std::to_string(column)
                         + ": " + reason),
      line_(line), column_(column) {}

ConfigError::ConfigError(const std::string& message)
    : std::runtime_error("Invalid configuration: " + message) {}

} // namespace qual
