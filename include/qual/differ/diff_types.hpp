#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qual {

// One issue's before/after preview of a single source line
struct DiffEntry {
    size_t line{};  // 1-based
    std::string analyzer;
    std::string original;
    std::string modified;
    std::string description;
    std::optional<std::string> import;  // `use` statement the fix needs
    std::string search_pattern;  // Import fixes: source text `replacement` stands in for
    std::string replacement;

    auto operator==(const DiffEntry& other) const -> bool = default;
};

struct FileDiff {
    std::string path;
    std::vector<DiffEntry> entries;

    auto add_entry(DiffEntry entry) -> void;
    auto total_changes() const -> size_t { return entries.size(); }
    auto empty() const -> bool { return entries.empty(); }
};

struct DiffResult {
    std::vector<FileDiff> files;

    // Files without entries are dropped
    auto add_file(FileDiff file) -> void;
    auto total_changes() const -> size_t;
    auto total_files() const -> size_t { return files.size(); }
    auto empty() const -> bool { return files.empty(); }
};

} // namespace qual
