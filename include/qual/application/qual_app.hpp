#pragma once

#include "qual/application/config.hpp"
#include "qual/differ/diff_types.hpp"
#include "qual/interfaces.hpp"
#include "qual/ui/diff_display.hpp"
#include <memory>
#include <string>
#include <vector>

namespace qual {

// Runs check, fix and diff over every source file under Config::path.
// run() returns the process exit code: 0 success, 1 when a file could not be
// read, parsed or written, 2 for invalid configuration.
class QualApp {
private:
    std::unique_ptr<ITerminal> terminal_;
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<ISourceParser> parser_;

public:
    QualApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IFileSystem> filesystem,
            std::unique_ptr<ISourceParser> parser);

    auto run(const Config& config) -> int;

private:
    auto run_check(const Config& config, const AnalyzerList& analyzers,
                   const std::vector<std::string>& files) -> int;
    auto run_fix(const Config& config, const AnalyzerList& analyzers,
                 const std::vector<std::string>& files) -> int;
    auto run_diff(const Config& config, const AnalyzerList& analyzers,
                  const std::vector<std::string>& files) -> int;

    // Writes the accepted entries back file by file; false if any file failed
    auto apply_selection(const DiffResult& result, const std::vector<DiffEntry>& selected) -> bool;

    auto display_options(const Config& config) -> DisplayOptions;
};

} // namespace qual
