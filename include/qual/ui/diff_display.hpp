#pragma once

#include "qual/differ/diff_types.hpp"
#include "qual/interfaces.hpp"
#include <cstddef>
#include <ostream>
#include <vector>

namespace qual {

struct DisplayOptions {
    bool color = true;
    size_t terminal_width = 80;
};

// Every file as a rendered block, laid out in as many columns as fit
auto show_full(const DiffResult& result, const DisplayOptions& options, std::ostream& out)
    -> void;

// One line per file with per-analyzer counts
auto show_summary(const DiffResult& result, const DisplayOptions& options, std::ostream& out)
    -> void;

// Walks every entry asking y/n/a/q on `terminal`; returns the accepted
// entries in their original order. End of input stops like `q`.
auto show_interactive(const DiffResult& result, const DisplayOptions& options,
                      ITerminal& terminal, std::ostream& out) -> std::vector<DiffEntry>;

} // namespace qual
