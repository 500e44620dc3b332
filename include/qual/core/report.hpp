#pragma once

#include "qual/core/issue.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace qual {

// Issues found in one file, grouped by analyzer in run order
struct Report {
    std::string file_path;
    std::vector<std::pair<std::string, AnalysisResult>> results;

    auto add_result(std::string analyzer, AnalysisResult result) -> void;
    auto total_issues() const -> size_t;
    auto total_fixable() const -> size_t;
};

struct GlobalReport {
    std::vector<Report> reports;

    auto add_report(Report report) -> void;
    auto total_issues() const -> size_t;
    auto total_fixable() const -> size_t;
    auto files_with_issues() const -> size_t;
};

// Plain-text rendering used by `check --verbose`
auto format_report(const Report& report) -> std::string;

} // namespace qual
