#include "qual/core/issue.hpp"
#include <algorithm>
#include <utility>

namespace qual {

auto is_available(const Fix& fix) -> bool { return !std::holds_alternative<NoFix>(fix); }

auto as_simple(const Fix& fix) -> const SimpleFix* { return std::get_if<SimpleFix>(&fix); }

auto as_import(const Fix& fix) -> const ImportFix* { return std::get_if<ImportFix>(&fix); }

auto is_diffable(const Issue& issue) -> bool {
    return issue.line != 0 && is_available(issue.fix);
}

auto make_analysis_result(std::vector<Issue> issues) -> AnalysisResult {
    auto fixable = std::count_if(issues.begin(), issues.end(),
                                 [](const Issue& issue) { return is_available(issue.fix); });

    return AnalysisResult{.issues = std::move(issues),
                          .fixable_count = static_cast<size_t>(fixable)};
}

} // namespace qual
