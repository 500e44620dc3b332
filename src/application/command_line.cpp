#include "qual/application/command_line.hpp"
#include "qual/core/errors.hpp"
#include <charconv>

namespace qual {

namespace {

auto parse_command(const std::string& word) -> Command {
    if (word == "check") {
        return Command::CHECK;
    }
    // "format" is fix with every analyzer and no options
    if (word == "fix" || word == "format") {
        return Command::FIX;
    }
    if (word == "diff") {
        return Command::DIFF;
    }
    if (word == "help" || word == "-h" || word == "--help") {
        return Command::HELP;
    }
    throw ConfigError("unknown command '" + word + "' (see 'qual help')");
}

auto parse_width(const std::string& value) -> size_t {
    size_t width = 0;
    const auto* end = value.data() + value.size();
    auto [ptr, error] = std::from_chars(value.data(), end, width);
    if (error != std::errc() || ptr != end || width == 0) {
        throw ConfigError("width must be a positive number, got '" + value + "'");
    }
    return width;
}

auto accepts(Command command, const std::string& option) -> bool {
    bool any = option == "-a" || option == "--analyzer";
    bool colored = option == "-c" || option == "--color" || option == "-w" || option == "--width";
    bool dry = option == "-d" || option == "--dry-run";

    switch (command) {
    case Command::CHECK:
        return any || colored || option == "-v" || option == "--verbose";
    case Command::FIX:
        return any || dry;
    case Command::DIFF:
        return any || colored || dry || option == "-s" || option == "--summary" || option == "-i"
               || option == "--interactive";
    case Command::HELP:
        return false;
    }
    return false;
}

} // namespace

auto parse_command_line(const std::vector<std::string>& args) -> Config {
    Config config;
    if (args.empty()) {
        return config;
    }

    config.command = parse_command(args.front());
    if (config.command == Command::HELP) {
        return config;
    }

    bool format = args.front() == "format";
    bool have_path = false;
    bool summary = false;
    bool interactive = false;

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            config.command = Command::HELP;
            return config;
        }

        if (!arg.starts_with("-")) {
            if (have_path) {
                throw ConfigError("unexpected argument '" + arg + "'");
            }
            config.path = arg;
            have_path = true;
            continue;
        }

        if (format || !accepts(config.command, arg)) {
            throw ConfigError("unexpected option '" + arg + "' for '" + args.front() + "'");
        }

        if (arg == "-a" || arg == "--analyzer" || arg == "-w" || arg == "--width") {
            if (i + 1 >= args.size()) {
                throw ConfigError("option '" + arg + "' needs a value");
            }
            const auto& value = args[++i];
            if (arg == "-a" || arg == "--analyzer") {
                config.analyzer = value;
            } else {
                config.width = parse_width(value);
            }
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-c" || arg == "--color") {
            config.color = true;
        } else if (arg == "-d" || arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "-s" || arg == "--summary") {
            summary = true;
            config.diff_mode = DiffMode::SUMMARY;
        } else if (arg == "-i" || arg == "--interactive") {
            interactive = true;
            config.diff_mode = DiffMode::INTERACTIVE;
        }
    }

    if (summary && interactive) {
        throw ConfigError("--summary and --interactive cannot be combined");
    }

    return config;
}

auto parse_command_line(int argc, char* argv[]) -> Config {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_command_line(args);
}

auto usage_text() -> std::string {
    return "Usage: qual <command> [path] [options]\n"
           "\n"
           "Commands:\n"
           "  check [path]    Report quality issues without modifying files\n"
           "  fix [path]      Apply automatic fixes in place\n"
           "  diff [path]     Preview proposed fixes before applying them\n"
           "  format [path]   Apply every fix (same as 'fix' without options)\n"
           "  help            Show this help\n"
           "\n"
           "Options:\n"
           "  -a, --analyzer <name>  Run one analyzer only (check, fix, diff)\n"
           "  -v, --verbose          Full report for every file (check)\n"
           "  -c, --color            Colored output (check, diff)\n"
           "  -w, --width <n>        Layout width instead of the terminal's (check, diff)\n"
           "  -s, --summary          One line per file (diff)\n"
           "  -i, --interactive      Choose fixes one by one, then apply them (diff)\n"
           "  -d, --dry-run          Do not write any file (fix, diff)\n"
           "  -h, --help             Show this help\n"
           "\n"
           "Analyzers: path_import, format_args, empty_lines, inline_comments, mod_rs\n"
           "\n"
           "Examples:\n"
           "  qual check src                        # Issues grouped per file\n"
           "  qual diff -s                          # How many changes, where\n"
           "  qual diff src -i                      # Review and apply fixes\n"
           "  qual fix -a path_import --dry-run     # Preview one analyzer's fixes\n";
}

} // namespace qual
