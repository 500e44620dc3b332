#include "qual/ui/block_renderer.hpp"
#include "qual/core/import_grouper.hpp"
#include "qual/ui/ansi.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace qual {

namespace {

constexpr size_t kRuleWidth = 40;

auto repeat(std::string_view unit, size_t count) -> std::string {
    std::string rule;
    rule.reserve(unit.size() * count);
    for (size_t i = 0; i < count; ++i) {
        rule += unit;
    }
    return rule;
}

auto push_header(std::vector<std::string>& lines, const std::string& path, bool color) -> void {
    lines.push_back(paint("File: " + path, Style::HEADER, color));
    lines.push_back(paint(repeat("─", kRuleWidth), Style::RULE, color));
}

auto push_imports(std::vector<std::string>& lines, const FileDiff& file, bool color) -> void {
    std::vector<std::string> imports;
    for (const auto& entry : file.entries) {
        if (entry.import) {
            imports.push_back(*entry.import);
        }
    }
    if (imports.empty()) {
        return;
    }

    lines.emplace_back("Imports (file top)");
    for (const auto& statement : group_imports(imports)) {
        lines.push_back(paint("+    " + statement, Style::ADDED, color));
    }
    lines.emplace_back();
}

auto push_entries(std::vector<std::string>& lines, const FileDiff& file, bool color) -> void {
    std::string current;

    for (const auto& entry : file.entries) {
        if (entry.analyzer != current) {
            if (!current.empty()) {
                lines.emplace_back();
            }
            auto count = std::count_if(file.entries.begin(), file.entries.end(),
                                       [&](const DiffEntry& other) {
                                           return other.analyzer == entry.analyzer;
                                       });
            lines.push_back(paint(entry.analyzer + " (" + std::to_string(count) + " issues)",
                                  Style::HEADING, color));
            lines.emplace_back();
            current = entry.analyzer;
        }

        lines.push_back(paint("Line " + std::to_string(entry.line), Style::LOCATION, color));
        lines.push_back(paint("-    " + entry.original, Style::REMOVED, color));
        lines.push_back(paint("+    " + entry.modified, Style::ADDED, color));
        lines.emplace_back();
    }
}

} // namespace

auto render_file_block(const FileDiff& file, bool color) -> RenderedBlock {
    std::vector<std::string> lines;
    push_header(lines, file.path, color);
    push_imports(lines, file, color);
    push_entries(lines, file, color);
    lines.push_back(paint(repeat("═", kRuleWidth), Style::RULE, color));
    return make_block(std::move(lines));
}

auto render_report_block(const Report& report, bool color) -> RenderedBlock {
    std::vector<std::string> lines;
    push_header(lines, report.file_path, color);

    for (const auto& [name, result] : report.results) {
        if (result.issues.empty()) {
            continue;
        }
        lines.push_back(paint("[" + name + "]", Style::HEADING, color));
        for (const auto& issue : result.issues) {
            lines.push_back("  "
                            + paint(std::to_string(issue.line) + ":"
                                        + std::to_string(issue.column),
                                    Style::LOCATION, color)
                            + " - " + issue.message);
        }
        lines.emplace_back();
    }

    lines.push_back(paint(repeat("═", kRuleWidth), Style::RULE, color));
    lines.push_back("Issues: " + std::to_string(report.total_issues())
                    + "  Fixable: " + std::to_string(report.total_fixable()));
    return make_block(std::move(lines));
}

} // namespace qual
