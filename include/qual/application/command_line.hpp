#pragma once

#include "qual/application/config.hpp"
#include <string>
#include <vector>

namespace qual {

// Throws ConfigError for unknown subcommands or options, missing option
// values and conflicting flags
auto parse_command_line(const std::vector<std::string>& args) -> Config;
auto parse_command_line(int argc, char* argv[]) -> Config;

auto usage_text() -> std::string;

} // namespace qual
