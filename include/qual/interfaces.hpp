#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qual {

// Forward declarations
class SyntaxTree;
struct AnalysisResult;

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::string = 0;
    virtual auto write_file(const std::string& path, const std::string& content) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto remove_file(const std::string& path) -> bool = 0;
    // No-op for a directory that still has entries; throws IoError on failure
    virtual auto remove_directory_if_empty(const std::string& path) -> void = 0;
    virtual auto list_source_files(const std::string& root) -> std::vector<std::string> = 0;
};

class ISourceParser {
public:
    virtual ~ISourceParser() = default;
    virtual auto parse(const std::string& source) -> SyntaxTree = 0;
    virtual auto unparse(const SyntaxTree& tree) -> std::string = 0;
};

class ITerminal {
public:
    virtual ~ITerminal() = default;
    virtual auto read_line() -> std::optional<std::string> = 0;  // nullopt at end of input
    virtual auto is_interactive() -> bool = 0;
    virtual auto width() -> size_t = 0;
};

// Detector for one category of style issue.
// analyze() sees the tree read-only together with the original text, which
// still carries the comments and blank lines some rules look at. fix()
// rewrites the tree in place and returns how many fixes it applied.
class IAnalyzer {
public:
    virtual ~IAnalyzer() = default;
    virtual auto name() const -> std::string_view = 0;
    virtual auto analyze(const SyntaxTree& tree, std::string_view source) const
        -> AnalysisResult = 0;
    virtual auto fix(SyntaxTree& tree) const -> size_t = 0;
};

using AnalyzerList = std::vector<std::unique_ptr<IAnalyzer>>;

} // namespace qual
