#include "qual/application/qual_app.hpp"
#include "qual/analyzers/mod_rs.hpp"
#include "qual/analyzers/registry.hpp"
#include "qual/application/command_line.hpp"
#include "qual/core/errors.hpp"
#include "qual/core/report.hpp"
#include "qual/core/syntax_tree.hpp"
#include "qual/differ/diff_generator.hpp"
#include "qual/differ/fix_applier.hpp"
#include "qual/ui/block_renderer.hpp"
#include "qual/ui/grid_layout.hpp"
#include <iostream>
#include <utility>

namespace qual {

QualApp::QualApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IFileSystem> filesystem,
                 std::unique_ptr<ISourceParser> parser)
    : terminal_(std::move(terminal)), filesystem_(std::move(filesystem)),
      parser_(std::move(parser)) {}

auto QualApp::run(const Config& config) -> int {
    if (config.command == Command::HELP) {
        std::cout << usage_text();
        return 0;
    }

    AnalyzerList analyzers;
    std::vector<std::string> files;
    try {
        analyzers = select_analyzers(config.analyzer);
        files = filesystem_->list_source_files(config.path);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const IoError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    switch (config.command) {
    case Command::CHECK:
        return run_check(config, analyzers, files);
    case Command::FIX:
        return run_fix(config, analyzers, files);
    case Command::DIFF:
        return run_diff(config, analyzers, files);
    case Command::HELP:
        break;
    }
    return 0;
}

auto QualApp::run_check(const Config& config, const AnalyzerList& analyzers,
                        const std::vector<std::string>& files) -> int {
    GlobalReport global;
    bool failed = false;

    if (runs_mod_rs(config.analyzer)) {
        for (const auto& issue : find_mod_rs_issues(files)) {
            global.add_report(make_mod_rs_report(issue));
        }
    }

    for (const auto& path : files) {
        if (analyzers.empty()) {
            break;
        }
        try {
            auto content = filesystem_->read_file(path);
            const auto tree = parser_->parse(content);

            Report report{.file_path = path};
            for (const auto& analyzer : analyzers) {
                report.add_result(std::string(analyzer->name()), analyzer->analyze(tree, content));
            }

            if (report.total_issues() > 0 || config.verbose) {
                global.add_report(std::move(report));
            }
        } catch (const std::exception& e) {
            std::cerr << "Error processing " << path << ": " << e.what() << "\n";
            failed = true;
        }
    }

    if (config.verbose) {
        for (const auto& report : global.reports) {
            std::cout << format_report(report) << "\n";
        }
    } else if (global.total_issues() > 0) {
        std::vector<RenderedBlock> blocks;
        for (const auto& report : global.reports) {
            blocks.push_back(render_report_block(report, config.color));
        }
        auto options = display_options(config);
        render_grid(blocks, calculate_columns(blocks, options.terminal_width), std::cout);
    }

    if (global.total_issues() == 0) {
        std::cout << "No issues found in " << files.size() << " files.\n";
    } else {
        std::cout << "Total issues: " << global.total_issues()
                  << "  Fixable: " << global.total_fixable() << "  Files: "
                  << global.files_with_issues() << "\n";
    }

    return failed ? 1 : 0;
}

auto QualApp::run_fix(const Config& config, const AnalyzerList& analyzers,
                      const std::vector<std::string>& files) -> int {
    bool failed = false;
    size_t total_fixed = 0;

    for (const auto& path : files) {
        if (analyzers.empty()) {
            break;
        }
        try {
            auto tree = parser_->parse(filesystem_->read_file(path));

            size_t fixed = 0;
            for (const auto& analyzer : analyzers) {
                fixed += analyzer->fix(tree);
            }
            if (fixed == 0) {
                continue;
            }

            std::cout << "Fixed " << fixed << " issues in " << path << "\n";
            total_fixed += fixed;

            if (!config.dry_run && !filesystem_->write_file(path, parser_->unparse(tree))) {
                std::cerr << "Error: Failed to write " << path << "\n";
                failed = true;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error processing " << path << ": " << e.what() << "\n";
            failed = true;
        }
    }

    // Content first, so a moved mod.rs carries its fixes along
    if (runs_mod_rs(config.analyzer)) {
        size_t moved = 0;
        for (const auto& issue : find_mod_rs_issues(files)) {
            if (config.dry_run) {
                std::cout << "Would fix: " << issue.path << " -> " << issue.suggested << "\n";
                ++total_fixed;
                continue;
            }
            try {
                fix_mod_rs(issue, *filesystem_);
                ++moved;
            } catch (const std::exception& e) {
                std::cerr << "Error processing " << issue.path << ": " << e.what() << "\n";
                failed = true;
            }
        }
        if (moved > 0) {
            std::cout << "Fixed " << moved << " mod.rs files\n";
        }
    }

    if (config.dry_run) {
        std::cout << "Dry run - no files modified. " << total_fixed << " issues would be fixed.\n";
    }

    return failed ? 1 : 0;
}

auto QualApp::run_diff(const Config& config, const AnalyzerList& analyzers,
                       const std::vector<std::string>& files) -> int {
    DiffResult result;
    bool failed = false;

    for (const auto& path : files) {
        try {
            result.add_file(generate_diff(path, analyzers, *filesystem_, *parser_));
        } catch (const std::exception& e) {
            std::cerr << "Error processing " << path << ": " << e.what() << "\n";
            failed = true;
        }
    }

    if (result.total_changes() == 0) {
        std::cout << "No changes proposed\n";
        return failed ? 1 : 0;
    }

    auto options = display_options(config);

    switch (config.diff_mode) {
    case DiffMode::SUMMARY:
        show_summary(result, options, std::cout);
        break;
    case DiffMode::FULL:
        show_full(result, options, std::cout);
        break;
    case DiffMode::INTERACTIVE: {
        if (!terminal_->is_interactive()) {
            std::cerr << "Warning: No terminal for interactive mode, showing the full diff\n";
            show_full(result, options, std::cout);
            break;
        }

        auto selected = show_interactive(result, options, *terminal_, std::cout);
        if (config.dry_run) {
            std::cout << "Dry run - no files modified. " << selected.size()
                      << " changes selected.\n";
        } else if (!selected.empty() && !apply_selection(result, selected)) {
            failed = true;
        }
        break;
    }
    }

    return failed ? 1 : 0;
}

auto QualApp::apply_selection(const DiffResult& result, const std::vector<DiffEntry>& selected)
    -> bool {
    bool ok = true;
    size_t next = 0;  // `selected` is an ordered subsequence of all entries

    for (const auto& file : result.files) {
        std::vector<DiffEntry> accepted;
        for (const auto& entry : file.entries) {
            if (next < selected.size() && selected[next] == entry) {
                accepted.push_back(entry);
                ++next;
            }
        }
        if (accepted.empty()) {
            continue;
        }

        try {
            auto applied = apply_entries(filesystem_->read_file(file.path), accepted);

            if (!filesystem_->write_file(file.path, applied.content)) {
                std::cerr << "Error: Failed to write " << file.path << "\n";
                ok = false;
                continue;
            }
            std::cout << "Applied " << applied.replaced << " changes to " << file.path;
            if (applied.inserted_imports > 0) {
                std::cout << " (" << applied.inserted_imports << " imports added)";
            }
            std::cout << "\n";
            if (applied.skipped > 0) {
                std::cerr << "Warning: Skipped " << applied.skipped << " conflicting changes in "
                          << file.path << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "Error processing " << file.path << ": " << e.what() << "\n";
            ok = false;
        }
    }

    return ok;
}

auto QualApp::display_options(const Config& config) -> DisplayOptions {
    return DisplayOptions{.color = config.color,
                          .terminal_width = config.width ? *config.width : terminal_->width()};
}

} // namespace qual
