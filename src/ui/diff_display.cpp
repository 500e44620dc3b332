#include "qual/ui/diff_display.hpp"
#include "qual/string_utils.hpp"
#include "qual/ui/ansi.hpp"
#include "qual/ui/block_renderer.hpp"
#include "qual/ui/grid_layout.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace qual {

namespace {

enum class Answer { ACCEPT, SKIP, ACCEPT_ALL, QUIT, INVALID };

auto parse_answer(const std::string& input) -> Answer {
    std::string answer(StringUtils::trim(input));
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (answer == "y" || answer == "yes") {
        return Answer::ACCEPT;
    }
    if (answer == "n" || answer == "no") {
        return Answer::SKIP;
    }
    if (answer == "a" || answer == "all") {
        return Answer::ACCEPT_ALL;
    }
    if (answer == "q" || answer == "quit") {
        return Answer::QUIT;
    }
    return Answer::INVALID;
}

auto print_total(const DiffResult& result, const DisplayOptions& options, std::ostream& out)
    -> void {
    out << paint("Total: " + std::to_string(result.total_changes()) + " changes in "
                     + std::to_string(result.total_files()) + " files",
                 Style::SUMMARY, options.color)
        << "\n";
}

auto print_entry(const DiffEntry& entry, size_t index, size_t count, bool color,
                 std::ostream& out) -> void {
    out << paint("[" + std::to_string(index) + "/" + std::to_string(count) + "] ", Style::TITLE,
                 color)
        << paint(entry.analyzer, Style::HEADING, color) << "\n";
    out << paint("Line " + std::to_string(entry.line) + ":", Style::RULE, color) << "\n";
    out << paint("- " + entry.original, Style::REMOVED, color) << "\n";
    if (entry.import) {
        out << paint("+ " + *entry.import, Style::ADDED, color) << "\n";
    }
    out << paint("+ " + entry.modified, Style::ADDED, color) << "\n\n";
}

} // namespace

auto show_full(const DiffResult& result, const DisplayOptions& options, std::ostream& out)
    -> void {
    out << "\n" << paint("DIFF OUTPUT", Style::TITLE, options.color) << "\n\n";

    std::vector<RenderedBlock> blocks;
    blocks.reserve(result.files.size());
    for (const auto& file : result.files) {
        blocks.push_back(render_file_block(file, options.color));
    }

    auto columns = calculate_columns(blocks, options.terminal_width);
    if (columns > 1) {
        out << paint("Layout: " + std::to_string(columns) + " columns (terminal width: "
                         + std::to_string(options.terminal_width) + ")",
                     Style::RULE, options.color)
            << "\n\n";
    }

    render_grid(blocks, columns, out);
    print_total(result, options, out);
}

auto show_summary(const DiffResult& result, const DisplayOptions& options, std::ostream& out)
    -> void {
    out << "\n" << paint("DIFF SUMMARY", Style::TITLE, options.color) << "\n\n";

    for (const auto& file : result.files) {
        // Analyzers in the order they first reported
        std::vector<std::pair<std::string, size_t>> counts;
        for (const auto& entry : file.entries) {
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&](const auto& count) { return count.first == entry.analyzer; });
            if (it == counts.end()) {
                counts.emplace_back(entry.analyzer, 1);
            } else {
                ++it->second;
            }
        }

        std::string breakdown;
        for (const auto& [analyzer, count] : counts) {
            if (!breakdown.empty()) {
                breakdown += ", ";
            }
            breakdown += paint(analyzer, Style::ADDED, options.color) + ": " + std::to_string(count);
        }

        out << paint(file.path, Style::HEADER, options.color) << ": " << file.total_changes()
            << " changes (" << breakdown << ")\n";
    }

    out << "\n";
    print_total(result, options, out);
}

auto show_interactive(const DiffResult& result, const DisplayOptions& options,
                      ITerminal& terminal, std::ostream& out) -> std::vector<DiffEntry> {
    std::vector<DiffEntry> selected;
    bool apply_all = false;
    bool quit = false;

    out << "\n" << paint("INTERACTIVE DIFF", Style::TITLE, options.color) << "\n\n";
    out << paint("Commands: y=yes, n=no, a=all, q=quit", Style::RULE, options.color) << "\n\n";

    for (const auto& file : result.files) {
        if (quit) {
            break;
        }
        out << paint("File: " + file.path, Style::HEADER, options.color) << "\n\n";

        for (size_t i = 0; i < file.entries.size() && !quit; ++i) {
            const auto& entry = file.entries[i];
            print_entry(entry, i + 1, file.entries.size(), options.color, out);

            if (apply_all) {
                selected.push_back(entry);
                continue;
            }

            out << paint("Apply this fix? [y/n/a/q]: ", Style::TITLE, options.color);
            out.flush();

            auto input = terminal.read_line();
            auto answer = input ? parse_answer(*input) : Answer::QUIT;
            if (!input) {
                out << "\n";
            }

            switch (answer) {
            case Answer::ACCEPT:
                selected.push_back(entry);
                out << paint("Applied", Style::ADDED, options.color) << "\n";
                break;
            case Answer::SKIP:
                out << paint("Skipped", Style::SKIPPED, options.color) << "\n";
                break;
            case Answer::ACCEPT_ALL:
                apply_all = true;
                selected.push_back(entry);
                out << paint("Applying all remaining changes", Style::HEADING, options.color)
                    << "\n";
                break;
            case Answer::QUIT:
                quit = true;
                out << paint("Quit", Style::REMOVED, options.color) << "\n";
                break;
            case Answer::INVALID:
                out << paint("Invalid input, skipping", Style::REMOVED, options.color) << "\n";
                break;
            }
            out << "\n";
        }
    }

    out << "\n"
        << paint("Selected " + std::to_string(selected.size()) + " changes for application",
                 Style::SUMMARY, options.color)
        << "\n";
    return selected;
}

} // namespace qual
