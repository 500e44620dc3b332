#pragma once

#include "qual/interfaces.hpp"
#include <string>
#include <vector>

namespace qual {

// path_import, format_args, empty_lines, inline_comments, in that order
auto make_default_analyzers() -> AnalyzerList;

// The content analyzers followed by mod_rs
auto analyzer_names() -> std::vector<std::string>;

// Every analyzer when `name` is empty, else the one with that name; none
// for mod_rs, which checks file layout instead of content.
// Throws ConfigError naming the valid analyzers for an unknown name.
auto select_analyzers(const std::string& name) -> AnalyzerList;

// Whether the mod.rs layout check runs for the `-a` value `name`
auto runs_mod_rs(const std::string& name) -> bool;

} // namespace qual
