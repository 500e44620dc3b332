#include "qual/differ/fix_applier.hpp"
#include "qual/core/import_grouper.hpp"
#include "qual/core/syntax_tree.hpp"
#include "qual/string_utils.hpp"
#include <map>
#include <set>
#include <utility>

namespace qual {

auto apply_entries(std::string_view content, const std::vector<DiffEntry>& entries)
    -> AppliedFile {
    AppliedFile applied;
    auto insert_index = find_import_insertion_line(parse_source(content)) - 1;
    auto lines = split_lines(content);

    std::set<std::string> present;
    for (const auto& line : lines) {
        present.emplace(StringUtils::trim(line));
    }

    std::map<size_t, std::vector<const DiffEntry*>> by_line;
    for (const auto& entry : entries) {
        if (entry.line < 1 || entry.line > lines.size()) {
            ++applied.skipped;
            continue;
        }
        by_line[entry.line].push_back(&entry);
    }

    std::vector<std::string> imports;
    auto want_import = [&](const DiffEntry& entry) {
        if (!entry.import) {
            return;
        }
        std::string statement(StringUtils::trim(*entry.import));
        if (!present.contains(statement)) {
            imports.push_back(std::move(statement));
        }
    };

    for (const auto& [line, line_entries] : by_line) {
        const auto& original = lines[line - 1];
        auto running = original;

        for (const auto* entry : line_entries) {
            if (entry->import && !entry->search_pattern.empty()) {
                if (running.find(entry->search_pattern) == std::string::npos) {
                    ++applied.skipped;
                    continue;
                }
                running = StringUtils::replace_first(running, entry->search_pattern,
                                                     entry->replacement);
            } else if (running != original) {
                ++applied.skipped;
                continue;
            } else {
                running = entry->modified;
            }
            want_import(*entry);
            ++applied.replaced;
        }

        lines[line - 1] = std::move(running);
    }

    for (const auto& statement : group_imports(imports)) {
        if (present.contains(statement)) {
            continue;
        }
        lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(insert_index), statement);
        ++insert_index;
        ++applied.inserted_imports;
    }

    applied.content = join_lines(lines, detect_line_ending(content), ends_with_newline(content));
    return applied;
}

} // namespace qual
