#pragma once

#include "qual/interfaces.hpp"

namespace qual {

class SourceParser : public ISourceParser {
public:
    auto parse(const std::string& source) -> SyntaxTree override;
    auto unparse(const SyntaxTree& tree) -> std::string override;
};

} // namespace qual
