#include "qual/core/import_grouper.hpp"
#include "qual/string_utils.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <string_view>
#include <utility>

namespace qual {

namespace {

auto split_path(std::string_view path) -> std::vector<std::string> {
    std::vector<std::string> components;
    size_t start = 0;
    while (true) {
        auto separator = path.find("::", start);
        if (separator == std::string_view::npos) {
            components.emplace_back(path.substr(start));
            break;
        }
        components.emplace_back(path.substr(start, separator - start));
        start = separator + 2;
    }
    return components;
}

// "use std::fs::read;" -> {"std", "fs::read"}; "use std;" -> {"std", ""}
auto split_import(std::string_view statement) -> std::pair<std::string, std::string> {
    auto body = StringUtils::trim(statement);
    if (body.starts_with("use ")) {
        body = StringUtils::trim(body.substr(4));
    }
    if (body.ends_with(';')) {
        body = StringUtils::trim(body.substr(0, body.size() - 1));
    }

    auto separator = body.find("::");
    if (separator == std::string_view::npos) {
        return {std::string(body), ""};
    }
    return {std::string(body.substr(0, separator)), std::string(body.substr(separator + 2))};
}

auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

auto group_statement(const std::string& root, const std::set<std::string>& paths) -> std::string {
    if (paths.size() == 1) {
        const auto& path = *paths.begin();
        return path.empty() ? "use " + root + ";" : "use " + root + "::" + path + ";";
    }

    std::vector<std::string> sorted(paths.begin(), paths.end());
    auto prefix = find_common_prefix(sorted);

    std::vector<std::string> members;
    for (const auto& path : sorted) {
        std::string member = path;
        if (!prefix.empty()) {
            member = path.size() > prefix.size() ? path.substr(prefix.size() + 2) : "";
        }
        members.push_back(member.empty() ? "self" : member);
    }

    auto base = prefix.empty() ? root : root + "::" + prefix;
    return "use " + base + "::{" + join(members, ", ") + "};";
}

} // namespace

auto group_imports(const std::vector<std::string>& imports) -> std::vector<std::string> {
    std::set<std::string> unique(imports.begin(), imports.end());

    std::map<std::string, std::set<std::string>> by_root;
    for (const auto& statement : unique) {
        auto [root, path] = split_import(statement);
        by_root[root].insert(path);
    }

    std::vector<std::string> grouped;
    grouped.reserve(by_root.size());
    for (const auto& [root, paths] : by_root) {
        grouped.push_back(group_statement(root, paths));
    }
    return grouped;
}

auto find_common_prefix(const std::vector<std::string>& paths) -> std::string {
    if (paths.size() < 2) {
        return "";
    }

    auto prefix = split_path(paths.front());
    for (size_t i = 1; i < paths.size() && !prefix.empty(); ++i) {
        auto components = split_path(paths[i]);
        size_t shared = 0;
        while (shared < prefix.size() && shared < components.size()
               && prefix[shared] == components[shared]) {
            ++shared;
        }
        prefix.resize(shared);
    }

    return join(prefix, "::");
}

auto find_import_insertion_line(const SyntaxTree& tree) -> size_t {
    std::set<size_t> attribute_lines;
    size_t i = 0;
    while (tree.is(i, "#") && tree.is(i + 1, "!") && tree.is(i + 2, "[")) {
        auto close = tree.matching(i + 2);
        for (auto line = tree[i].line; line <= tree[close].line; ++line) {
            attribute_lines.insert(line);
        }
        i = close + 1;
    }

    auto lines = split_lines(unparse(tree));
    size_t index = 0;
    while (index < lines.size()) {
        auto line = StringUtils::trim(lines[index]);
        bool shebang = index == 0 && line.starts_with("#!") && !attribute_lines.contains(1);

        if (!attribute_lines.contains(index + 1) && !shebang && !line.empty()
            && !line.starts_with("//!")) {
            break;
        }
        ++index;
    }

    return index + 1;
}

} // namespace qual
