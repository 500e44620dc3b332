#pragma once

#include "qual/differ/diff_types.hpp"
#include "qual/interfaces.hpp"
#include <string>
#include <string_view>

namespace qual {

// Previews every available fix in one file without applying it. The file is
// read once and never written; each analyzer sees the same unmodified tree.
// Throws IoError when the file cannot be read and ParseError when it does not
// parse (no partial diff).
auto generate_diff(const std::string& path, const AnalyzerList& analyzers,
                   IFileSystem& filesystem, ISourceParser& parser) -> FileDiff;

// Pure core of generate_diff() over already loaded content
auto compute_file_diff(const std::string& path, std::string_view content,
                       const SyntaxTree& tree, const AnalyzerList& analyzers) -> FileDiff;

} // namespace qual
