#pragma once

#include "qual/core/syntax_tree.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace qual {

// Merge recommended `use` statements into the fewest statements that still
// cover exactly the deduplicated input, one per root crate, roots sorted.
//   {"use std::fs::write;", "use std::io::read;"} -> {"use std::{fs::write, io::read};"}
auto group_imports(const std::vector<std::string>& imports) -> std::vector<std::string>;

// Longest common `::`-delimited prefix; empty for fewer than two paths
auto find_common_prefix(const std::vector<std::string>& paths) -> std::string;

// 1-based line before which new imports go: after the leading run of inner
// attributes, `//!` doc comments, blank lines and a shebang. Attribute extents
// come from matched delimiters, so brackets inside literals do not count.
auto find_import_insertion_line(const SyntaxTree& tree) -> size_t;

} // namespace qual
