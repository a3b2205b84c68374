#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

/// A fresh directory under the system temp directory, removed with everything in it on destruction
class TempDir
{
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "suitegrader-test-XXXXXX").string();

        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }

        path_ = pattern;
    }

    ~TempDir() {
        std::error_code err;
        std::filesystem::remove_all(path_, err);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path operator/(std::string_view rel) const { return path_ / rel; }

    /// Create a subdirectory and return its path
    std::filesystem::path make_dir(std::string_view rel) const {
        auto dir = path_ / rel;
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path write_file(std::string_view rel, std::string_view contents) const {
        auto file_path = path_ / rel;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream file{file_path, std::ios::binary | std::ios::trunc};
        file << contents;
        return file_path;
    }

    static std::string read_file(const std::filesystem::path& file_path) {
        std::ifstream file{file_path, std::ios::binary};
        return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
    }

    static bool is_empty_dir(const std::filesystem::path& dir) {
        return std::filesystem::is_directory(dir) && std::filesystem::is_empty(dir);
    }

private:
    std::filesystem::path path_;
};
