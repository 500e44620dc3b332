#include "qual/io/file_system.hpp"
#include "qual/core/errors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace qual {

namespace {

auto is_skipped_directory(const std::filesystem::path& directory) -> bool {
    auto name = directory.filename().string();
    return name == "target" || (name.size() > 1 && name.front() == '.' && name != "..");
}

} // namespace

auto FileSystem::read_file(const std::string& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IoError(path, "cannot open file for reading");
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw IoError(path, "read failed");
    }
    return content.str();
}

auto FileSystem::write_file(const std::string& path, const std::string& content) -> bool {
    return write_atomic(path, content);
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    return std::filesystem::exists(path);
}

auto FileSystem::remove_file(const std::string& path) -> bool {
    std::error_code error;
    return std::filesystem::remove(path, error) && !error;
}

auto FileSystem::remove_directory_if_empty(const std::string& path) -> void {
    std::error_code error;
    if (!std::filesystem::is_directory(path, error) || !std::filesystem::is_empty(path, error)) {
        return;
    }
    std::filesystem::remove(path, error);
    if (error) {
        throw IoError(path, error.message());
    }
}

auto FileSystem::list_source_files(const std::string& root) -> std::vector<std::string> {
    namespace fs = std::filesystem;

    std::error_code error;
    auto status = fs::status(root, error);
    if (error || !fs::exists(status)) {
        throw IoError(root, "no such file or directory");
    }
    if (fs::is_regular_file(status)) {
        return {root};
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(root, error);
    if (error) {
        throw IoError(root, error.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(error)) {
        if (error) {
            throw IoError(root, error.message());
        }
        const auto& entry = *it;
        if (entry.is_directory() && is_skipped_directory(entry.path())) {
            it.disable_recursion_pending();
            continue;
        }
        if (entry.is_regular_file() && entry.path().extension() == ".rs") {
            files.push_back(entry.path().string());
        }
    }
    if (error) {
        throw IoError(root, error.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto FileSystem::write_atomic(const std::string& path, const std::string& content) -> bool {
    // Write to a sibling temp file, then rename it over the original
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        file << content;
        if (file.fail()) {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    }

    std::error_code error;
    std::filesystem::rename(temp_path, path, error);
    if (error) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

} // namespace qual
