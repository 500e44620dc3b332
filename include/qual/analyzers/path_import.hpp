#pragma once

#include "qual/interfaces.hpp"

namespace qual {

// Flags module-qualified free-function paths (`std::fs::read_to_string(..)`)
// and moves them behind a `use` import
class PathImportAnalyzer : public IAnalyzer {
public:
    auto name() const -> std::string_view override { return "path_import"; }
    auto analyze(const SyntaxTree& tree, std::string_view source) const -> AnalysisResult override;
    auto fix(SyntaxTree& tree) const -> size_t override;
};

} // namespace qual
