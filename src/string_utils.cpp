#include "qual/string_utils.hpp"

namespace qual {

auto StringUtils::trim(std::string_view text) -> std::string_view {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

auto StringUtils::is_blank(std::string_view line) -> bool { return trim(line).empty(); }

auto StringUtils::replace_first(const std::string& text, std::string_view pattern,
                                std::string_view replacement) -> std::string {
    if (pattern.empty()) {
        return text;
    }
    auto position = text.find(pattern);
    if (position == std::string::npos) {
        return text;
    }

    std::string result = text;
    result.replace(position, pattern.size(), replacement);
    return result;
}

} // namespace qual
