#include "qual/parsers/source_parser.hpp"
#include "qual/core/syntax_tree.hpp"

namespace qual {

auto SourceParser::parse(const std::string& source) -> SyntaxTree { return parse_source(source); }

auto SourceParser::unparse(const SyntaxTree& tree) -> std::string { return qual::unparse(tree); }

} // namespace qual
