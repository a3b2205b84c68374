#include "output/file_sink.hpp"

#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace suitegrader {

Expected<FileSink, std::string> FileSink::open(const std::filesystem::path& path) {
    if (path.empty()) {
        return {unexpected, std::string{"empty output path"}};
    }

    std::error_code err;

    if (auto parent = path.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent, err);

        if (err) {
            return {unexpected, fmt::format("cannot create directory '{}': {}", parent.string(), err.message())};
        }
    }

    if (std::filesystem::is_directory(path, err)) {
        return {unexpected, fmt::format("'{}' is a directory", path.string())};
    }

    std::ofstream stream{path, std::ios::out | std::ios::trunc | std::ios::binary};

    if (!stream) {
        return {unexpected, fmt::format("cannot open '{}': {}", path.string(), get_err_msg())};
    }

    return FileSink{path, std::move(stream)};
}

void FileSink::write(std::string_view str) {
    stream_.write(str.data(), static_cast<std::streamsize>(str.size()));
}

void FileSink::flush() {
    stream_.flush();
}

Expected<void, std::string> FileSink::close() {
    stream_.flush();

    const bool write_ok = stream_.good();
    stream_.close();

    if (!write_ok || stream_.fail()) {
        return fmt::format("writing '{}' failed", path_.string());
    }

    LOG_DEBUG("Wrote {}", path_.string());

    return {};
}

} // namespace suitegrader
