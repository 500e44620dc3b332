#include "qual/differ/diff_generator.hpp"
#include "qual/core/issue.hpp"
#include "qual/core/syntax_tree.hpp"
#include "qual/string_utils.hpp"
#include <optional>
#include <utility>

namespace qual {

namespace {

// Empty when the fix would leave its line unchanged, e.g. a path broken
// across lines
auto preview_entry(const Issue& issue, std::string_view analyzer,
                   const std::vector<std::string>& lines) -> std::optional<DiffEntry> {
    auto original = issue.line >= 1 && issue.line <= lines.size() ? lines[issue.line - 1] : std::string();

    DiffEntry entry{.line = issue.line,
                    .analyzer = std::string(analyzer),
                    .original = original,
                    .modified = original,
                    .description = issue.message};

    if (const auto* simple_fix = as_simple(issue.fix)) {
        entry.modified = simple_fix->replacement;
    } else if (const auto* import_fix = as_import(issue.fix)) {
        if (original.find(import_fix->search_pattern) == std::string::npos) {
            return std::nullopt;
        }
        entry.modified = StringUtils::replace_first(original, import_fix->search_pattern,
                                                    import_fix->replacement);
        entry.import = import_fix->import_statement;
        entry.search_pattern = import_fix->search_pattern;
        entry.replacement = import_fix->replacement;
    }

    return entry;
}

} // namespace

auto compute_file_diff(const std::string& path, std::string_view content,
                       const SyntaxTree& tree, const AnalyzerList& analyzers) -> FileDiff {
    FileDiff diff{.path = path};
    auto lines = split_lines(content);

    for (const auto& analyzer : analyzers) {
        auto result = analyzer->analyze(tree, content);
        for (const auto& issue : result.issues) {
            if (!is_diffable(issue)) {
                continue;
            }
            if (auto entry = preview_entry(issue, analyzer->name(), lines)) {
                diff.add_entry(std::move(*entry));
            }
        }
    }

    return diff;
}

auto generate_diff(const std::string& path, const AnalyzerList& analyzers,
                   IFileSystem& filesystem, ISourceParser& parser) -> FileDiff {
    auto content = filesystem.read_file(path);
    const auto tree = parser.parse(content);
    return compute_file_diff(path, content, tree, analyzers);
}

} // namespace qual
