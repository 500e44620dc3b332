#include "qual/differ/diff_types.hpp"
#include <utility>

namespace qual {

auto FileDiff::add_entry(DiffEntry entry) -> void { entries.push_back(std::move(entry)); }

auto DiffResult::add_file(FileDiff file) -> void {
    if (file.empty()) {
        return;
    }
    files.push_back(std::move(file));
}

auto DiffResult::total_changes() const -> size_t {
    size_t total = 0;
    for (const auto& file : files) {
        total += file.total_changes();
    }
    return total;
}

} // namespace qual
