#pragma once

#include "qual/differ/diff_types.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace qual {

struct AppliedFile {
    std::string content;
    size_t inserted_imports{};  // Lines added at the import insertion point
    size_t replaced{};          // Entries that changed their line
    size_t skipped{};           // Out of range, or in conflict with an earlier entry
};

// Applies accepted entries to `content`. Entries on the same line compose:
// import fixes substitute their search pattern inside the running line, a
// wholesale rewrite only applies to a line nothing else has touched. The
// imports of applied entries are grouped and inserted, minus statements the
// file already has, after the leading attribute/doc block. The file's line
// terminator and final-newline state are kept.
auto apply_entries(std::string_view content, const std::vector<DiffEntry>& entries)
    -> AppliedFile;

} // namespace qual
