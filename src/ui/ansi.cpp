#include "qual/ui/ansi.hpp"
#include <ftxui/screen/string.hpp>

namespace qual {

namespace {

constexpr std::string_view kReset = "\033[0m";

auto sequence_for(Style style) -> std::string_view {
    switch (style) {
    case Style::HEADER:
        return "\033[1;36m";
    case Style::RULE:
        return "\033[2m";
    case Style::REMOVED:
        return "\033[31m";
    case Style::ADDED:
        return "\033[32m";
    case Style::HEADING:
        return "\033[1;32m";
    case Style::LOCATION:
        return "\033[36m";
    case Style::TITLE:
        return "\033[1m";
    case Style::SUMMARY:
        return "\033[1;33m";
    case Style::SKIPPED:
        return "\033[33m";
    }
    return "";
}

} // namespace

auto paint(std::string_view text, Style style, bool enabled) -> std::string {
    if (!enabled) {
        return std::string(text);
    }

    std::string painted(sequence_for(style));
    painted += text;
    painted += kReset;
    return painted;
}

auto strip_ansi(std::string_view text) -> std::string {
    std::string plain;
    plain.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\033' && i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            // Parameter and intermediate bytes run until a final byte in @..~
            while (i < text.size() && (text[i] < 0x40 || text[i] > 0x7E)) {
                ++i;
            }
            ++i;
            continue;
        }
        plain += text[i];
        ++i;
    }

    return plain;
}

auto visible_width(std::string_view text) -> size_t {
    auto width = ftxui::string_width(strip_ansi(text));
    return width > 0 ? static_cast<size_t>(width) : 0;
}

} // namespace qual
