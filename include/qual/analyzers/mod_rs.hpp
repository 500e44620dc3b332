#pragma once

#include "qual/core/report.hpp"
#include "qual/interfaces.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qual {

// Module layout check. Works on file paths rather than syntax trees, so it is
// not an IAnalyzer: `foo/mod.rs` should be `foo.rs` next to the `foo` directory.
inline constexpr std::string_view MOD_RS_ANALYZER = "mod_rs";

struct ModRsIssue {
    std::string path;       // The mod.rs file
    std::string suggested;  // Where its content belongs
    std::string message;
    size_t line = 1;
    size_t column = 1;
};

// Empty unless `path` names a mod.rs inside a named directory
auto make_mod_rs_issue(const std::string& path) -> std::optional<ModRsIssue>;

auto find_mod_rs_issues(const std::vector<std::string>& files) -> std::vector<ModRsIssue>;

// Report holding the issue as a fixable file-level finding
auto make_mod_rs_report(const ModRsIssue& issue) -> Report;

// Moves the file to its suggested path and removes the directory it leaves
// empty. Throws IoError, also when the suggested path already exists.
auto fix_mod_rs(const ModRsIssue& issue, IFileSystem& filesystem) -> void;

} // namespace qual
