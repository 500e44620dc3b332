#pragma once

#include <string>
#include <string_view>

namespace qual {

class StringUtils {
public:
    // Strip leading and trailing whitespace
    static auto trim(std::string_view text) -> std::string_view;

    static auto is_blank(std::string_view line) -> bool;

    // `text` with the first occurrence of `pattern` replaced; unchanged when
    // the pattern is absent or empty
    static auto replace_first(const std::string& text, std::string_view pattern,
                              std::string_view replacement) -> std::string;
};

} // namespace qual
