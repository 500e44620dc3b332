#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace qual {

enum class Style {
    HEADER,   // cyan bold
    RULE,     // dim
    REMOVED,  // red
    ADDED,    // green
    HEADING,  // green bold
    LOCATION, // cyan
    TITLE,    // bold
    SUMMARY,  // yellow bold
    SKIPPED   // yellow
};

// Wraps `text` in the SGR sequence for `style`; plain text when disabled
auto paint(std::string_view text, Style style, bool enabled) -> std::string;

// Removes CSI escape sequences (ESC '[' params final-byte)
auto strip_ansi(std::string_view text) -> std::string;

// Terminal columns `text` occupies once escapes are stripped
auto visible_width(std::string_view text) -> size_t;

} // namespace qual
