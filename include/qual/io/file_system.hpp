#pragma once

#include "qual/interfaces.hpp"
#include <string>
#include <vector>

namespace qual {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::string override;
    auto write_file(const std::string& path, const std::string& content) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
    auto remove_file(const std::string& path) -> bool override;
    auto remove_directory_if_empty(const std::string& path) -> void override;

    // `root` itself when it is a file, else every `.rs` file below it,
    // skipping hidden and `target` directories; sorted by path
    auto list_source_files(const std::string& root) -> std::vector<std::string> override;

private:
    auto write_atomic(const std::string& path, const std::string& content) -> bool;
};

} // namespace qual
