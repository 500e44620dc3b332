#include "qual/analyzers/mod_rs.hpp"
#include "qual/core/errors.hpp"
#include <filesystem>
#include <utility>

namespace qual {

auto make_mod_rs_issue(const std::string& path) -> std::optional<ModRsIssue> {
    std::filesystem::path file(path);
    if (file.filename().string() != "mod.rs") {
        return std::nullopt;
    }

    auto directory = file.parent_path();
    auto module_name = directory.filename().string();
    if (module_name.empty() || module_name == "." || module_name == "..") {
        return std::nullopt;
    }

    auto suggested = directory.parent_path() / (module_name + ".rs");
    return ModRsIssue{.path = path,
                      .suggested = suggested.string(),
                      .message = "Use `" + module_name + ".rs` instead of `" + module_name
                                 + "/mod.rs` (modern module style)"};
}

auto find_mod_rs_issues(const std::vector<std::string>& files) -> std::vector<ModRsIssue> {
    std::vector<ModRsIssue> issues;
    for (const auto& file : files) {
        if (auto issue = make_mod_rs_issue(file)) {
            issues.push_back(std::move(*issue));
        }
    }
    return issues;
}

auto make_mod_rs_report(const ModRsIssue& issue) -> Report {
    Report report{.file_path = issue.path};
    report.add_result(std::string(MOD_RS_ANALYZER),
                      make_analysis_result({Issue{.line = issue.line,
                                                  .column = issue.column,
                                                  .message = issue.message,
                                                  .fix = SimpleFix{.replacement = issue.suggested}}}));
    return report;
}

auto fix_mod_rs(const ModRsIssue& issue, IFileSystem& filesystem) -> void {
    if (filesystem.file_exists(issue.suggested)) {
        throw IoError(issue.suggested, "already exists");
    }

    auto content = filesystem.read_file(issue.path);
    if (!filesystem.write_file(issue.suggested, content)) {
        throw IoError(issue.suggested, "write failed");
    }
    if (!filesystem.remove_file(issue.path)) {
        throw IoError(issue.path, "cannot remove file");
    }

    filesystem.remove_directory_if_empty(std::filesystem::path(issue.path).parent_path().string());
}

} // namespace qual
