#pragma once

#include <suitegrader/common/class_traits.hpp>
#include <suitegrader/common/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace suitegrader {

/// One central directory record of a zip archive
struct ZipEntry
{
    std::string name;

    std::uint16_t flags{};
    std::uint16_t method{};
    std::uint32_t crc32{};

    std::uint64_t compressed_size{};
    std::uint64_t uncompressed_size{};
    std::uint64_t local_header_offset{};

    static constexpr std::uint16_t METHOD_STORED = 0;
    static constexpr std::uint16_t METHOD_DEFLATE = 8;

    bool is_directory() const { return !name.empty() && (name.back() == '/' || name.back() == '\\'); }

    bool is_encrypted() const { return (flags & 0x1U) != 0; }
};

/// Read-only view of a zip archive's central directory.
///
/// Opening only parses the end of central directory record (ZIP64 aware) and the
/// central directory itself; entry data is not touched until ``extract_entry``.
/// Multi-disk archives, encrypted entries and compression methods other than
/// stored and deflate are rejected when opening.
class ZipDirectory : NonCopyable
{
public:
    static Expected<ZipDirectory, std::string> open(const std::filesystem::path& path);

    const std::vector<ZipEntry>& entries() const { return entries_; }

    const std::filesystem::path& get_path() const { return path_; }

    /// Decompress ``entry`` into ``out``.
    ///
    /// Fails if the data would exceed the entry's declared uncompressed size, if the
    /// stream is truncated, or if the CRC-32 does not match.
    Expected<void, std::string> extract_entry(const ZipEntry& entry, std::ostream& out);

private:
    ZipDirectory(std::filesystem::path path, std::ifstream file, std::uint64_t file_size)
        : path_{std::move(path)}
        , file_{std::move(file)}
        , file_size_{file_size} {}

    Expected<void, std::string> read_central_directory();

    Expected<std::uint64_t, std::string> data_offset(const ZipEntry& entry);

    Expected<std::vector<unsigned char>, std::string> read_at(std::uint64_t offset, std::size_t count);

    Expected<void, std::string> copy_stored(const ZipEntry& entry, std::uint64_t offset, std::ostream& out);
    Expected<void, std::string> inflate(const ZipEntry& entry, std::uint64_t offset, std::ostream& out);

    std::filesystem::path path_;
    std::ifstream file_;
    std::uint64_t file_size_;

    std::vector<ZipEntry> entries_;
};

} // namespace suitegrader
