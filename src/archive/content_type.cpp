#include "archive/content_type.hpp"

#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <magic.h>

#include <filesystem>
#include <string>
#include <utility>

namespace suitegrader {

Expected<ContentTypeDetector, std::string> ContentTypeDetector::create() {
    MagicPtr cookie{magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR)};

    if (!cookie) {
        return fmt::format("magic_open failed: {}", get_err_msg());
    }

    // nullptr = the default database
    if (magic_load(cookie.get(), nullptr) != 0) {
        const char* err = magic_error(cookie.get());
        return fmt::format("magic_load failed: {}", err != nullptr ? err : "unknown error");
    }

    return ContentTypeDetector{std::move(cookie)};
}

Expected<std::string, std::string> ContentTypeDetector::detect(const std::filesystem::path& path) const {
    const char* mime = magic_file(cookie_.get(), path.c_str());

    if (mime == nullptr) {
        const char* err = magic_error(cookie_.get());
        // value and error types are the same, so the error must be tagged
        return {unexpected, fmt::format("cannot determine content type of '{}': {}", path.string(),
                                        err != nullptr ? err : "unknown error")};
    }

    LOG_DEBUG("Content type of '{}' is {}", path.string(), mime);

    return std::string{mime};
}

} // namespace suitegrader
