#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace qual {

// Fix variants an analyzer can attach to an issue
struct NoFix {
    auto operator==(const NoFix& other) const -> bool = default;
};

struct SimpleFix {
    std::string replacement;  // Replaces the issue's line wholesale

    auto operator==(const SimpleFix& other) const -> bool = default;
};

struct ImportFix {
    std::string import_statement;  // e.g. "use std::fs::read;"
    std::string search_pattern;    // Text to find on the issue's line
    std::string replacement;       // Text that replaces the first match

    auto operator==(const ImportFix& other) const -> bool = default;
};

using Fix = std::variant<NoFix, SimpleFix, ImportFix>;

struct Issue {
    size_t line{};    // 1-based, 0 = unlocated
    size_t column{};  // 1-based
    std::string message;
    Fix fix = NoFix{};

    auto operator==(const Issue& other) const -> bool = default;
};

struct AnalysisResult {
    std::vector<Issue> issues;
    size_t fixable_count{};
};

auto is_available(const Fix& fix) -> bool;
auto as_simple(const Fix& fix) -> const SimpleFix*;
auto as_import(const Fix& fix) -> const ImportFix*;

// Located and fixable: the only issues the diff generator looks at
auto is_diffable(const Issue& issue) -> bool;

// Builds a result whose fixable_count matches the issues it holds
auto make_analysis_result(std::vector<Issue> issues) -> AnalysisResult;

} // namespace qual
