#include "qual/application/command_line.hpp"
#include "qual/application/qual_app.hpp"
#include "qual/core/errors.hpp"
#include "qual/io/file_system.hpp"
#include "qual/parsers/source_parser.hpp"
#include "qual/ui/terminal.hpp"
#include <iostream>
#include <memory>

auto main(int argc, char* argv[]) -> int {
    qual::Config config;
    try {
        config = qual::parse_command_line(argc, argv);
    } catch (const qual::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << qual::usage_text();
        return 2;
    }

    try {
        qual::QualApp app(std::make_unique<qual::Terminal>(), std::make_unique<qual::FileSystem>(),
                          std::make_unique<qual::SourceParser>());
        return app.run(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
