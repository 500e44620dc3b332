#pragma once

#include "qual/interfaces.hpp"

namespace qual {

// Flags formatting macros that fill `{}` placeholders positionally
class FormatArgsAnalyzer : public IAnalyzer {
public:
    auto name() const -> std::string_view override { return "format_args"; }
    auto analyze(const SyntaxTree& tree, std::string_view source) const -> AnalysisResult override;
    auto fix(SyntaxTree& tree) const -> size_t override;
};

} // namespace qual
