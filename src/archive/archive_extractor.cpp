#include "archive/archive_extractor.hpp"

#include "archive/content_type.hpp"
#include "archive/zip_directory.hpp"

#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/view/reverse.hpp>

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace suitegrader {

namespace {

namespace fs = std::filesystem;

/// Remembers every file and directory created during extraction so a failed
/// extraction can be undone
class CreatedPaths
{
public:
    void add(fs::path path) { paths_.push_back(std::move(path)); }

    void commit() { paths_.clear(); }

    /// Remove in reverse creation order, so directories are empty by the time they are reached
    void rollback() {
        for (const auto& path : paths_ | ranges::views::reverse) {
            std::error_code err;
            fs::remove(path, err);
            if (err) {
                LOG_WARN("Failed to remove '{}' while undoing extraction: {}", path.string(), err.message());
            }
        }
        paths_.clear();
    }

private:
    std::vector<fs::path> paths_;
};

ExtractError make_error(ExtractErrorKind kind, std::string detail) {
    return ExtractError{.kind = kind, .detail = std::move(detail)};
}

/// Create each missing directory from ``dest`` down to ``dest / rel``, refusing to pass through symlinks
Expected<void, ExtractError> create_dirs(const fs::path& dest, const fs::path& rel, CreatedPaths& created) {
    fs::path current = dest;

    for (const auto& component : rel) {
        if (component.empty() || component == ".") {
            continue;
        }

        current /= component;

        std::error_code err;
        auto status = fs::symlink_status(current, err);

        if (fs::is_symlink(status)) {
            return make_error(ExtractErrorKind::PathTraversal,
                              fmt::format("'{}' is a symbolic link", current.string()));
        }

        if (fs::exists(status)) {
            if (!fs::is_directory(status)) {
                return make_error(ExtractErrorKind::IoFailure,
                                  fmt::format("'{}' exists and is not a directory", current.string()));
            }
            continue;
        }

        if (!fs::create_directory(current, err) || err) {
            return make_error(ExtractErrorKind::IoFailure,
                              fmt::format("cannot create directory '{}': {}", current.string(), err.message()));
        }

        created.add(current);
    }

    return {};
}

} // namespace

bool ArchiveExtractor::is_unsafe_name(std::string_view name) {
    if (name.empty()) {
        return false;
    }

    if (name.front() == '/' || name.front() == '\\') {
        return true;
    }

    // Drive letter, e.g. "C:" or "C:\foo"
    if (name.size() >= 2 && std::isalpha(static_cast<unsigned char>(name[0])) != 0 && name[1] == ':') {
        return true;
    }

    std::size_t seg_start = 0;
    while (seg_start <= name.size()) {
        std::size_t seg_end = name.find_first_of("/\\", seg_start);
        if (seg_end == std::string_view::npos) {
            seg_end = name.size();
        }

        if (name.substr(seg_start, seg_end - seg_start) == "..") {
            return true;
        }

        seg_start = seg_end + 1;
    }

    return false;
}

Expected<void, ExtractError> ArchiveExtractor::check_content_type(const std::filesystem::path& archive) const {
    auto detector = ContentTypeDetector::create();

    if (!detector) {
        return make_error(ExtractErrorKind::IoFailure, detector.error());
    }

    auto content_type = detector->detect(archive);

    if (!content_type) {
        return make_error(ExtractErrorKind::BadContentType, content_type.error());
    }

    if (ranges::find(opts_.accepted_content_types, *content_type) == opts_.accepted_content_types.end()) {
        return make_error(ExtractErrorKind::BadContentType,
                          fmt::format("content type '{}' is not an accepted archive type", *content_type));
    }

    return {};
}

Expected<void, ExtractError> ArchiveExtractor::validate_entries(const ZipDirectory& dir) const {
    std::uint64_t total_size = 0;

    for (const ZipEntry& entry : dir.entries()) {
        if (entry.name.empty()) {
            return make_error(ExtractErrorKind::CorruptArchive, "archive contains an entry with an empty name");
        }

        if (entry.name.find('\0') != std::string::npos) {
            return make_error(ExtractErrorKind::PathTraversal,
                              fmt::format("entry name '{}' contains a NUL byte", entry.name.c_str()));
        }

        if (is_unsafe_name(entry.name)) {
            return make_error(ExtractErrorKind::PathTraversal,
                              fmt::format("entry '{}' is absolute or escapes the destination", entry.name));
        }

        // Zero compressed size is only possible for empty entries; those count toward the budget only
        if (entry.compressed_size > 0) {
            const double ratio =
                static_cast<double>(entry.uncompressed_size) / static_cast<double>(entry.compressed_size);

            if (ratio > MAX_COMPRESSION_RATIO) {
                return make_error(ExtractErrorKind::CompressionRatio,
                                  fmt::format("entry '{}' has a compression ratio of {:.1f}:1 (max {}:1)",
                                              entry.name, ratio, MAX_COMPRESSION_RATIO));
            }
        }

        total_size += entry.uncompressed_size;

        if (total_size > opts_.max_size_bytes) {
            return make_error(ExtractErrorKind::SizeBudgetExceeded,
                              fmt::format("extracted size exceeds the budget of {} bytes (at entry '{}')",
                                          opts_.max_size_bytes, entry.name));
        }
    }

    return {};
}

Expected<std::vector<std::filesystem::path>, ExtractError>
ArchiveExtractor::extract(const std::filesystem::path& archive, const std::filesystem::path& dest) const {
    LOG_DEBUG("Extracting '{}' into '{}'", archive.string(), dest.string());

    TRY(check_content_type(archive));

    auto dir = ZipDirectory::open(archive);

    if (!dir) {
        return make_error(ExtractErrorKind::CorruptArchive, dir.error());
    }

    if (std::error_code err; !fs::is_directory(dest, err)) {
        return make_error(ExtractErrorKind::NotADirectory,
                          fmt::format("destination '{}' is not an existing directory", dest.string()));
    }

    TRY(validate_entries(*dir));

    return write_entries(*dir, dest);
}

Expected<std::vector<std::filesystem::path>, ExtractError> ArchiveExtractor::write_entries(ZipDirectory& dir,
                                                                                           const fs::path& dest) {
    CreatedPaths created;
    auto rollback_guard = gsl::finally([&created] { created.rollback(); });

    std::vector<fs::path> files;

    for (const ZipEntry& entry : dir.entries()) {
        const fs::path rel{entry.name};

        if (entry.is_directory()) {
            TRY(create_dirs(dest, rel, created));
            continue;
        }

        TRY(create_dirs(dest, rel.parent_path(), created));

        const fs::path target = dest / rel;

        std::error_code err;
        auto status = fs::symlink_status(target, err);

        if (fs::is_symlink(status)) {
            return make_error(ExtractErrorKind::PathTraversal,
                              fmt::format("'{}' is a symbolic link", target.string()));
        }

        if (fs::exists(status) && !fs::is_regular_file(status)) {
            return make_error(ExtractErrorKind::IoFailure,
                              fmt::format("'{}' exists and is not a regular file", target.string()));
        }

        const bool existed = fs::exists(status);

        std::ofstream out{target, std::ios::binary | std::ios::trunc};

        if (!out) {
            return make_error(ExtractErrorKind::IoFailure, fmt::format("cannot create '{}'", target.string()));
        }

        if (!existed) {
            created.add(target);
        }

        if (auto res = dir.extract_entry(entry, out); !res) {
            return make_error(ExtractErrorKind::CorruptArchive, res.error());
        }

        out.close();

        if (!out) {
            return make_error(ExtractErrorKind::IoFailure, fmt::format("failed writing '{}'", target.string()));
        }

        files.push_back(target);
    }

    created.commit();

    LOG_DEBUG("Extracted {} files", files.size());

    return files;
}

} // namespace suitegrader
