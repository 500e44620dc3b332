#pragma once

#include "qual/core/report.hpp"
#include "qual/differ/diff_types.hpp"
#include "qual/ui/grid_layout.hpp"

namespace qual {

// File header, grouped imports, per-analyzer sections of line changes
auto render_file_block(const FileDiff& file, bool color) -> RenderedBlock;

// Compact per-file issue list used by `check`
auto render_report_block(const Report& report, bool color) -> RenderedBlock;

} // namespace qual
