#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace qual {

enum class Command { CHECK, FIX, DIFF, HELP };

enum class DiffMode { FULL, SUMMARY, INTERACTIVE };

struct Config {
    Command command = Command::HELP;
    std::string path = ".";        // File or directory to analyze
    std::string analyzer;          // Empty runs every analyzer
    bool verbose = false;
    bool color = false;
    bool dry_run = false;
    DiffMode diff_mode = DiffMode::FULL;
    std::optional<size_t> width;   // Overrides the detected terminal width
};

} // namespace qual
