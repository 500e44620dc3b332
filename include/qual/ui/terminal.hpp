#pragma once

#include "qual/interfaces.hpp"
#include <cstdio>

namespace qual {

// Console terminal. When stdin is a pipe the prompts read from /dev/tty so
// `qual diff -i` still works in a pipeline.
class Terminal : public ITerminal {
private:
    FILE* tty_file_ = nullptr;
    bool use_tty_ = false;

public:
    Terminal();
    ~Terminal() override;

    Terminal(const Terminal&) = delete;
    auto operator=(const Terminal&) -> Terminal& = delete;

    auto read_line() -> std::optional<std::string> override;
    auto is_interactive() -> bool override;
    auto width() -> size_t override;
};

} // namespace qual
