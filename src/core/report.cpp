#include "qual/core/report.hpp"
#include <set>
#include <sstream>

namespace qual {

auto Report::add_result(std::string analyzer, AnalysisResult result) -> void {
    results.emplace_back(std::move(analyzer), std::move(result));
}

auto Report::total_issues() const -> size_t {
    size_t total = 0;
    for (const auto& [name, result] : results) {
        total += result.issues.size();
    }
    return total;
}

auto Report::total_fixable() const -> size_t {
    size_t total = 0;
    for (const auto& [name, result] : results) {
        total += result.fixable_count;
    }
    return total;
}

auto GlobalReport::add_report(Report report) -> void { reports.push_back(std::move(report)); }

auto GlobalReport::total_issues() const -> size_t {
    size_t total = 0;
    for (const auto& report : reports) {
        total += report.total_issues();
    }
    return total;
}

auto GlobalReport::total_fixable() const -> size_t {
    size_t total = 0;
    for (const auto& report : reports) {
        total += report.total_fixable();
    }
    return total;
}

auto GlobalReport::files_with_issues() const -> size_t {
    std::set<std::string> paths;
    for (const auto& report : reports) {
        if (report.total_issues() > 0) {
            paths.insert(report.file_path);
        }
    }
    return paths.size();
}

auto format_report(const Report& report) -> std::string {
    std::ostringstream out;
    out << "Quality report for: " << report.file_path << "\n";
    out << std::string(80, '=') << "\n\n";

    for (const auto& [name, result] : report.results) {
        if (result.issues.empty()) {
            continue;
        }

        out << "[" << name << "]\n";
        for (const auto& issue : result.issues) {
            out << "  " << issue.line << ":" << issue.column << " - " << issue.message << "\n";

            if (const auto* import_fix = as_import(issue.fix)) {
                out << "    Fix: Add import: " << import_fix->import_statement << "\n";
                out << "    (Will replace path with short name)\n";
            } else if (const auto* simple_fix = as_simple(issue.fix)) {
                out << "    Fix: " << simple_fix->replacement << "\n";
            }
        }
        out << "\n";
    }

    out << "Total issues: " << report.total_issues() << "\n";
    out << "Fixable: " << report.total_fixable() << "\n";
    return out.str();
}

} // namespace qual
