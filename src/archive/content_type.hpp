#pragma once

#include <suitegrader/common/expected.hpp>

#include <magic.h>

#include <filesystem>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace suitegrader {

/// Detects a file's MIME type from its contents using libmagic
class ContentTypeDetector
{
public:
    static Expected<ContentTypeDetector, std::string> create();

    /// e.g., "application/zip"
    Expected<std::string, std::string> detect(const std::filesystem::path& path) const;

private:
    struct MagicCloser
    {
        void operator()(magic_t cookie) const noexcept { magic_close(cookie); }
    };

    using MagicPtr = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

    explicit ContentTypeDetector(MagicPtr cookie)
        : cookie_{std::move(cookie)} {}

    MagicPtr cookie_;
};

} // namespace suitegrader
