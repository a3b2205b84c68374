#pragma once

#include "archive/zip_directory.hpp"

#include <suitegrader/common/expected.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace suitegrader {

enum class ExtractErrorKind {
    BadContentType,     ///< Archive bytes are not one of the accepted MIME types
    CorruptArchive,     ///< Not a structurally valid (supported) zip archive
    NotADirectory,      ///< Destination does not exist or is not a directory
    PathTraversal,      ///< An entry name is absolute or escapes the destination
    CompressionRatio,   ///< An entry's declared sizes exceed the maximum compression ratio
    SizeBudgetExceeded, ///< Total declared uncompressed size exceeds the budget
    IoFailure,          ///< Writing extracted content failed
};

constexpr std::string_view to_string(ExtractErrorKind kind) {
    switch (kind) {
    case ExtractErrorKind::BadContentType:
        return "BadContentType";
    case ExtractErrorKind::CorruptArchive:
        return "CorruptArchive";
    case ExtractErrorKind::NotADirectory:
        return "NotADirectory";
    case ExtractErrorKind::PathTraversal:
        return "PathTraversal";
    case ExtractErrorKind::CompressionRatio:
        return "CompressionRatio";
    case ExtractErrorKind::SizeBudgetExceeded:
        return "SizeBudgetExceeded";
    case ExtractErrorKind::IoFailure:
        return "IoFailure";
    }
    return "<unknown>";
}

struct ExtractError
{
    ExtractErrorKind kind;
    std::string detail;

    std::string to_string() const { return fmt::format("{}: {}", ::suitegrader::to_string(kind), detail); }
};

struct ExtractOptions
{
    static constexpr std::uint64_t BYTES_PER_MB = 1024 * 1024;

    static constexpr std::uint64_t DEFAULT_MAX_SIZE_MB = 100;

    /// Largest budget in MB whose size in bytes still fits in 64 bits
    static constexpr std::uint64_t MAX_SIZE_MB = std::numeric_limits<std::uint64_t>::max() / BYTES_PER_MB;

    std::uint64_t max_size_bytes = DEFAULT_MAX_SIZE_MB * BYTES_PER_MB;

    std::vector<std::string> accepted_content_types = default_content_types();

    static std::vector<std::string> default_content_types() {
        return {"application/zip", "application/x-zip-compressed", "application/zip-compressed"};
    }
};

/// Validates and unpacks a submission archive.
///
/// Every entry is checked before a single byte is written. If writing then fails
/// part way, everything created so far is removed again.
class ArchiveExtractor
{
public:
    static constexpr double MAX_COMPRESSION_RATIO = 100.0;

    explicit ArchiveExtractor(ExtractOptions opts = {})
        : opts_{std::move(opts)} {}

    /// Returns the paths of all extracted regular files
    Expected<std::vector<std::filesystem::path>, ExtractError> extract(const std::filesystem::path& archive,
                                                                       const std::filesystem::path& dest) const;

    /// Checks every entry of ``dir`` against the name, ratio and size budget rules
    Expected<void, ExtractError> validate_entries(const ZipDirectory& dir) const;

    /// Whether ``name`` is absolute or contains a ``..`` segment. Both ``/`` and ``\`` separate segments.
    static bool is_unsafe_name(std::string_view name);

    const ExtractOptions& get_options() const { return opts_; }

private:
    Expected<void, ExtractError> check_content_type(const std::filesystem::path& archive) const;

    static Expected<std::vector<std::filesystem::path>, ExtractError>
    write_entries(ZipDirectory& dir, const std::filesystem::path& dest);

    ExtractOptions opts_;
};

} // namespace suitegrader

template <>
struct fmt::formatter<::suitegrader::ExtractErrorKind> : fmt::formatter<std::string_view>
{
    auto format(::suitegrader::ExtractErrorKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::suitegrader::to_string(from), ctx);
    }
};
