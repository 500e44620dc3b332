#pragma once

#include "qual/interfaces.hpp"

namespace qual {

// Flags blank lines that split a function body into paragraphs
class EmptyLinesAnalyzer : public IAnalyzer {
public:
    auto name() const -> std::string_view override { return "empty_lines"; }
    auto analyze(const SyntaxTree& tree, std::string_view source) const -> AnalysisResult override;
    auto fix(SyntaxTree& tree) const -> size_t override;
};

} // namespace qual
