#include "qual/ui/grid_layout.hpp"
#include "qual/ui/ansi.hpp"
#include <algorithm>
#include <utility>

namespace qual {

namespace {

auto widest(const std::vector<RenderedBlock>& blocks) -> size_t {
    size_t width = kMinBlockWidth;
    for (const auto& block : blocks) {
        width = std::max(width, block.width);
    }
    return width;
}

} // namespace

auto make_block(std::vector<std::string> lines) -> RenderedBlock {
    size_t width = kMinBlockWidth;
    for (const auto& line : lines) {
        width = std::max(width, visible_width(line));
    }
    return RenderedBlock{.lines = std::move(lines), .width = width};
}

auto calculate_columns(const std::vector<RenderedBlock>& blocks, size_t terminal_width)
    -> size_t {
    if (blocks.empty()) {
        return 1;
    }

    auto max_width = widest(blocks);
    for (size_t columns = blocks.size(); columns > 1; --columns) {
        auto total = columns * max_width + (columns - 1) * kColumnGap;
        if (total <= terminal_width) {
            return columns;
        }
    }
    return 1;
}

auto render_grid(const std::vector<RenderedBlock>& blocks, size_t columns, std::ostream& out)
    -> void {
    if (columns <= 1) {
        for (const auto& block : blocks) {
            for (const auto& line : block.lines) {
                out << line << "\n";
            }
            out << "\n";
        }
        return;
    }

    auto column_width = widest(blocks);
    const std::string gap(kColumnGap, ' ');

    for (size_t start = 0; start < blocks.size(); start += columns) {
        auto end = std::min(start + columns, blocks.size());

        size_t rows = 0;
        for (size_t i = start; i < end; ++i) {
            rows = std::max(rows, blocks[i].line_count());
        }

        for (size_t row = 0; row < rows; ++row) {
            std::string output;
            for (size_t i = start; i < end; ++i) {
                const auto& lines = blocks[i].lines;
                output += pad_to_width(row < lines.size() ? lines[row] : "", column_width);
                if (i + 1 < end) {
                    output += gap;
                }
            }
            out << output << "\n";
        }
        out << "\n";
    }
}

auto pad_to_width(const std::string& text, size_t width) -> std::string {
    auto current = visible_width(text);
    if (current >= width) {
        return text;
    }
    return text + std::string(width - current, ' ');
}

} // namespace qual
