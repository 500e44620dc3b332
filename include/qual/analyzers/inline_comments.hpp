#pragma once

#include "qual/interfaces.hpp"

namespace qual {

// Reports `//` comments inside function bodies; the text belongs in the
// function's doc block instead
class InlineCommentsAnalyzer : public IAnalyzer {
public:
    auto name() const -> std::string_view override { return "inline_comments"; }
    auto analyze(const SyntaxTree& tree, std::string_view source) const -> AnalysisResult override;
    auto fix(SyntaxTree& tree) const -> size_t override;
};

} // namespace qual
