#include "qual/ui/terminal.hpp"
#include <ftxui/screen/terminal.hpp>
#include <iostream>
#include <unistd.h>

namespace qual {

namespace {

constexpr size_t kFallbackWidth = 80;

} // namespace

Terminal::Terminal() {
    if (!isatty(STDIN_FILENO)) {
        tty_file_ = fopen("/dev/tty", "r");
        use_tty_ = tty_file_ != nullptr;
    }
}

Terminal::~Terminal() {
    if (tty_file_) {
        fclose(tty_file_);
        tty_file_ = nullptr;
    }
}

auto Terminal::read_line() -> std::optional<std::string> {
    if (!use_tty_) {
        std::string line;
        if (!std::getline(std::cin, line)) {
            return std::nullopt;
        }
        return line;
    }

    std::string line;
    int ch = 0;
    while ((ch = fgetc(tty_file_)) != EOF) {
        if (ch == '\n') {
            return line;
        }
        if (ch != '\r') {
            line += static_cast<char>(ch);
        }
    }
    if (line.empty()) {
        return std::nullopt;
    }
    return line;
}

auto Terminal::is_interactive() -> bool { return isatty(STDIN_FILENO) || use_tty_; }

auto Terminal::width() -> size_t {
    auto size = ftxui::Terminal::Size();
    return size.dimx > 0 ? static_cast<size_t>(size.dimx) : kFallbackWidth;
}

} // namespace qual
