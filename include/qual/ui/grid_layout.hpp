#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace qual {

constexpr size_t kColumnGap = 4;
constexpr size_t kMinBlockWidth = 40;

// Pre-rendered lines (possibly colored) plus their widest visible width,
// never narrower than kMinBlockWidth
struct RenderedBlock {
    std::vector<std::string> lines;
    size_t width = kMinBlockWidth;

    auto line_count() const -> size_t { return lines.size(); }
};

auto make_block(std::vector<std::string> lines) -> RenderedBlock;

// Most columns of the widest block that fit the terminal, at least 1:
//   cols * max_width + (cols - 1) * kColumnGap <= terminal_width
auto calculate_columns(const std::vector<RenderedBlock>& blocks, size_t terminal_width) -> size_t;

// Prints blocks side by side, `columns` per row of blocks, each followed by a
// blank line. One column prints the blocks one after another.
auto render_grid(const std::vector<RenderedBlock>& blocks, size_t columns, std::ostream& out)
    -> void;

// Right-pads to `width` visible columns; longer text is left as is
auto pad_to_width(const std::string& text, size_t width) -> std::string;

} // namespace qual
