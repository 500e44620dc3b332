#include "qual/analyzers/registry.hpp"
#include "qual/analyzers/empty_lines.hpp"
#include "qual/analyzers/format_args.hpp"
#include "qual/analyzers/inline_comments.hpp"
#include "qual/analyzers/mod_rs.hpp"
#include "qual/analyzers/path_import.hpp"
#include "qual/core/errors.hpp"
#include <utility>

namespace qual {

auto make_default_analyzers() -> AnalyzerList {
    AnalyzerList analyzers;
    analyzers.push_back(std::make_unique<PathImportAnalyzer>());
    analyzers.push_back(std::make_unique<FormatArgsAnalyzer>());
    analyzers.push_back(std::make_unique<EmptyLinesAnalyzer>());
    analyzers.push_back(std::make_unique<InlineCommentsAnalyzer>());
    return analyzers;
}

auto analyzer_names() -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& analyzer : make_default_analyzers()) {
        names.emplace_back(analyzer->name());
    }
    names.emplace_back(MOD_RS_ANALYZER);
    return names;
}

auto select_analyzers(const std::string& name) -> AnalyzerList {
    auto analyzers = make_default_analyzers();
    if (name.empty()) {
        return analyzers;
    }
    if (name == MOD_RS_ANALYZER) {
        return {};
    }

    AnalyzerList selected;
    for (auto& analyzer : analyzers) {
        if (analyzer->name() == name) {
            selected.push_back(std::move(analyzer));
        }
    }

    if (selected.empty()) {
        std::string message = "Unknown analyzer: " + name + ". Available analyzers:";
        for (const auto& valid : analyzer_names()) {
            message += "\n  - " + valid;
        }
        throw ConfigError(message);
    }

    return selected;
}

auto runs_mod_rs(const std::string& name) -> bool {
    return name.empty() || name == MOD_RS_ANALYZER;
}

} // namespace qual
