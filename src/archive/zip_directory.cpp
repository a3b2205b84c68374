#include "archive/zip_directory.hpp"

#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace suitegrader {

namespace {

constexpr std::uint32_t EOCD_SIGNATURE = 0x06054b50;
constexpr std::uint32_t ZIP64_EOCD_LOCATOR_SIGNATURE = 0x07064b50;
constexpr std::uint32_t ZIP64_EOCD_SIGNATURE = 0x06064b50;
constexpr std::uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
constexpr std::uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;

constexpr std::size_t EOCD_SIZE = 22;
constexpr std::size_t ZIP64_EOCD_LOCATOR_SIZE = 20;
constexpr std::size_t ZIP64_EOCD_SIZE = 56;
constexpr std::size_t CENTRAL_HEADER_SIZE = 46;
constexpr std::size_t LOCAL_HEADER_SIZE = 30;
constexpr std::size_t MAX_COMMENT_SIZE = 0xFFFF;

constexpr std::uint16_t ZIP64_EXTRA_ID = 0x0001;
constexpr std::uint16_t U16_SENTINEL = 0xFFFF;
constexpr std::uint32_t U32_SENTINEL = 0xFFFFFFFF;

constexpr std::size_t CHUNK_SIZE = 64 * 1024;

/// Little-endian reader over a byte buffer. Every read is bounds checked.
class ByteReader
{
public:
    explicit ByteReader(std::span<const unsigned char> data)
        : data_{data} {}

    bool has(std::size_t count) const { return pos_ + count <= data_.size(); }

    template <typename UInt>
    UInt read() {
        UInt value{};
        for (std::size_t i = 0; i < sizeof(UInt); ++i) {
            value |= static_cast<UInt>(static_cast<UInt>(data_[pos_ + i]) << (8 * i));
        }
        pos_ += sizeof(UInt);
        return value;
    }

    std::span<const unsigned char> read_bytes(std::size_t count) {
        auto bytes = data_.subspan(pos_, count);
        pos_ += count;
        return bytes;
    }

    void skip(std::size_t count) { pos_ += count; }

private:
    std::span<const unsigned char> data_;
    std::size_t pos_ = 0;
};

/// Replace the 32-bit fields of ``entry`` that are saturated with values from a ZIP64 extra field
bool apply_zip64_extra(ZipEntry& entry, std::span<const unsigned char> extra, bool need_usize, bool need_csize,
                       bool need_offset) {
    ByteReader reader{extra};

    while (reader.has(4)) {
        auto header_id = reader.read<std::uint16_t>();
        auto data_size = reader.read<std::uint16_t>();

        if (!reader.has(data_size)) {
            return false;
        }

        if (header_id != ZIP64_EXTRA_ID) {
            reader.skip(data_size);
            continue;
        }

        ByteReader field{reader.read_bytes(data_size)};

        // Fields only appear if the corresponding header value is saturated, in this order
        if (need_usize) {
            if (!field.has(8)) {
                return false;
            }
            entry.uncompressed_size = field.read<std::uint64_t>();
        }
        if (need_csize) {
            if (!field.has(8)) {
                return false;
            }
            entry.compressed_size = field.read<std::uint64_t>();
        }
        if (need_offset) {
            if (!field.has(8)) {
                return false;
            }
            entry.local_header_offset = field.read<std::uint64_t>();
        }

        return true;
    }

    // Saturated fields but no ZIP64 record to resolve them
    return !(need_usize || need_csize || need_offset);
}

} // namespace

Expected<ZipDirectory, std::string> ZipDirectory::open(const std::filesystem::path& path) {
    std::error_code err;
    auto file_size = std::filesystem::file_size(path, err);

    if (err) {
        return fmt::format("cannot stat '{}': {}", path.string(), err.message());
    }

    std::ifstream file{path, std::ios::binary};

    if (!file) {
        return fmt::format("cannot open '{}'", path.string());
    }

    ZipDirectory dir{path, std::move(file), file_size};

    if (auto res = dir.read_central_directory(); !res) {
        return res.error();
    }

    LOG_DEBUG("Read {} central directory entries from '{}'", dir.entries_.size(), path.string());

    return dir;
}

Expected<std::vector<unsigned char>, std::string> ZipDirectory::read_at(std::uint64_t offset, std::size_t count) {
    if (offset > file_size_ || count > file_size_ - offset) {
        return fmt::format("read of {} bytes at offset {} is past the end of the archive", count, offset);
    }

    std::vector<unsigned char> buffer(count);

    file_.clear();
    file_.seekg(gsl::narrow_cast<std::streamoff>(offset));
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    file_.read(reinterpret_cast<char*>(buffer.data()), gsl::narrow_cast<std::streamsize>(count));

    if (file_.gcount() != gsl::narrow_cast<std::streamsize>(count)) {
        return fmt::format("short read at offset {}", offset);
    }

    return buffer;
}

Expected<void, std::string> ZipDirectory::read_central_directory() {
    if (file_size_ < EOCD_SIZE) {
        return std::string{"file too small to be a zip archive"};
    }

    // The EOCD record sits at the very end, followed only by a comment of up to 64KiB
    const std::uint64_t tail_size = std::min<std::uint64_t>(file_size_, EOCD_SIZE + MAX_COMMENT_SIZE);
    const std::uint64_t tail_offset = file_size_ - tail_size;
    const auto tail = TRY(read_at(tail_offset, gsl::narrow_cast<std::size_t>(tail_size)));

    std::optional<std::size_t> eocd_pos;
    for (std::size_t pos = tail.size() - EOCD_SIZE + 1; pos-- > 0;) {
        ByteReader sig{std::span{tail}.subspan(pos, 4)};
        if (sig.read<std::uint32_t>() == EOCD_SIGNATURE) {
            eocd_pos = pos;
            break;
        }
    }

    if (!eocd_pos) {
        return std::string{"end of central directory record not found"};
    }

    const std::uint64_t eocd_offset = tail_offset + *eocd_pos;

    ByteReader eocd{std::span{tail}.subspan(*eocd_pos + 4)};
    std::uint32_t disk_num = eocd.read<std::uint16_t>();
    std::uint32_t cd_disk = eocd.read<std::uint16_t>();
    std::uint64_t entries_on_disk = eocd.read<std::uint16_t>();
    std::uint64_t total_entries = eocd.read<std::uint16_t>();
    std::uint64_t cd_size = eocd.read<std::uint32_t>();
    std::uint64_t cd_offset = eocd.read<std::uint32_t>();

    const bool is_zip64 = total_entries == U16_SENTINEL || entries_on_disk == U16_SENTINEL ||
                          cd_size == U32_SENTINEL || cd_offset == U32_SENTINEL;

    if (is_zip64) {
        if (eocd_offset < ZIP64_EOCD_LOCATOR_SIZE) {
            return std::string{"ZIP64 end of central directory locator missing"};
        }

        const auto locator_bytes = TRY(read_at(eocd_offset - ZIP64_EOCD_LOCATOR_SIZE, ZIP64_EOCD_LOCATOR_SIZE));
        ByteReader locator{locator_bytes};

        if (locator.read<std::uint32_t>() != ZIP64_EOCD_LOCATOR_SIGNATURE) {
            return std::string{"ZIP64 end of central directory locator missing"};
        }

        locator.skip(4);
        auto zip64_eocd_offset = locator.read<std::uint64_t>();

        const auto zip64_bytes = TRY(read_at(zip64_eocd_offset, ZIP64_EOCD_SIZE));
        ByteReader zip64{zip64_bytes};

        if (zip64.read<std::uint32_t>() != ZIP64_EOCD_SIGNATURE) {
            return std::string{"bad ZIP64 end of central directory signature"};
        }

        zip64.skip(8 + 2 + 2); // record size, version made by, version needed
        disk_num = zip64.read<std::uint32_t>();
        cd_disk = zip64.read<std::uint32_t>();
        entries_on_disk = zip64.read<std::uint64_t>();
        total_entries = zip64.read<std::uint64_t>();
        cd_size = zip64.read<std::uint64_t>();
        cd_offset = zip64.read<std::uint64_t>();
    }

    if (disk_num != 0 || cd_disk != 0 || entries_on_disk != total_entries) {
        return std::string{"multi-disk archives are not supported"};
    }

    if (cd_offset > eocd_offset || cd_size > eocd_offset - cd_offset) {
        return fmt::format("central directory (offset {}, size {}) lies outside the archive", cd_offset, cd_size);
    }

    // Every record takes at least CENTRAL_HEADER_SIZE bytes
    if (total_entries > cd_size / CENTRAL_HEADER_SIZE) {
        return fmt::format("central directory too small for {} entries", total_entries);
    }

    const auto cd_bytes = TRY(read_at(cd_offset, gsl::narrow_cast<std::size_t>(cd_size)));
    ByteReader reader{cd_bytes};

    entries_.reserve(gsl::narrow_cast<std::size_t>(total_entries));

    for (std::uint64_t i = 0; i < total_entries; ++i) {
        if (!reader.has(CENTRAL_HEADER_SIZE) || reader.read<std::uint32_t>() != CENTRAL_HEADER_SIGNATURE) {
            return fmt::format("central directory record {} is malformed", i);
        }

        ZipEntry entry;

        reader.skip(2 + 2); // version made by, version needed
        entry.flags = reader.read<std::uint16_t>();
        entry.method = reader.read<std::uint16_t>();
        reader.skip(2 + 2); // mod time, mod date
        entry.crc32 = reader.read<std::uint32_t>();
        entry.compressed_size = reader.read<std::uint32_t>();
        entry.uncompressed_size = reader.read<std::uint32_t>();
        auto name_len = reader.read<std::uint16_t>();
        auto extra_len = reader.read<std::uint16_t>();
        auto comment_len = reader.read<std::uint16_t>();
        auto start_disk = reader.read<std::uint16_t>();
        reader.skip(2 + 4); // internal attrs, external attrs
        entry.local_header_offset = reader.read<std::uint32_t>();

        if (!reader.has(std::size_t{name_len} + extra_len + comment_len)) {
            return fmt::format("central directory record {} is truncated", i);
        }

        auto name_bytes = reader.read_bytes(name_len);
        entry.name.assign(name_bytes.begin(), name_bytes.end());
        auto extra = reader.read_bytes(extra_len);
        reader.skip(comment_len);

        if (!apply_zip64_extra(entry, extra, entry.uncompressed_size == U32_SENTINEL,
                               entry.compressed_size == U32_SENTINEL, entry.local_header_offset == U32_SENTINEL)) {
            return fmt::format("entry '{}' has a malformed ZIP64 extra field", entry.name);
        }

        if (start_disk != 0 && start_disk != U16_SENTINEL) {
            return fmt::format("entry '{}' starts on another disk", entry.name);
        }

        if (entry.is_encrypted()) {
            return fmt::format("entry '{}' is encrypted", entry.name);
        }

        if (entry.method != ZipEntry::METHOD_STORED && entry.method != ZipEntry::METHOD_DEFLATE) {
            return fmt::format("entry '{}' uses unsupported compression method {}", entry.name, entry.method);
        }

        if (entry.local_header_offset >= cd_offset || entry.compressed_size > cd_offset - entry.local_header_offset) {
            return fmt::format("entry '{}' lies outside the archive data", entry.name);
        }

        if (entry.method == ZipEntry::METHOD_STORED && entry.compressed_size != entry.uncompressed_size) {
            return fmt::format("stored entry '{}' has mismatching sizes", entry.name);
        }

        entries_.push_back(std::move(entry));
    }

    return {};
}

Expected<std::uint64_t, std::string> ZipDirectory::data_offset(const ZipEntry& entry) {
    const auto header_bytes = TRY(read_at(entry.local_header_offset, LOCAL_HEADER_SIZE));
    ByteReader header{header_bytes};

    if (header.read<std::uint32_t>() != LOCAL_HEADER_SIGNATURE) {
        return fmt::format("bad local header signature for entry '{}'", entry.name);
    }

    header.skip(2 + 2 + 2 + 2 + 2 + 4 + 4 + 4); // everything up to the variable lengths
    auto name_len = header.read<std::uint16_t>();
    auto extra_len = header.read<std::uint16_t>();

    std::uint64_t offset = entry.local_header_offset + LOCAL_HEADER_SIZE + name_len + extra_len;

    if (offset > file_size_ || entry.compressed_size > file_size_ - offset) {
        return fmt::format("data of entry '{}' is past the end of the archive", entry.name);
    }

    return offset;
}

Expected<void, std::string> ZipDirectory::extract_entry(const ZipEntry& entry, std::ostream& out) {
    const std::uint64_t offset = TRY(data_offset(entry));

    if (entry.method == ZipEntry::METHOD_STORED) {
        return copy_stored(entry, offset, out);
    }

    return inflate(entry, offset, out);
}

Expected<void, std::string> ZipDirectory::copy_stored(const ZipEntry& entry, std::uint64_t offset,
                                                      std::ostream& out) {
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t remaining = entry.compressed_size;

    while (remaining > 0) {
        auto count = gsl::narrow_cast<std::size_t>(std::min<std::uint64_t>(remaining, CHUNK_SIZE));
        const auto chunk = TRY(read_at(offset, count));

        crc = crc32(crc, chunk.data(), gsl::narrow_cast<uInt>(chunk.size()));
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        out.write(reinterpret_cast<const char*>(chunk.data()), gsl::narrow_cast<std::streamsize>(chunk.size()));

        if (!out) {
            return fmt::format("write failed for entry '{}'", entry.name);
        }

        offset += count;
        remaining -= count;
    }

    if (crc != entry.crc32) {
        return fmt::format("CRC mismatch for entry '{}'", entry.name);
    }

    return {};
}

Expected<void, std::string> ZipDirectory::inflate(const ZipEntry& entry, std::uint64_t offset, std::ostream& out) {
    z_stream stream{};

    // Negative window bits: raw deflate data without a zlib header
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        return fmt::format("inflateInit failed for entry '{}'", entry.name);
    }

    auto stream_guard = gsl::finally([&stream] { inflateEnd(&stream); });

    std::array<unsigned char, CHUNK_SIZE> out_buf{};
    std::uint64_t remaining_in = entry.compressed_size;
    std::uint64_t written = 0;
    uLong crc = crc32(0L, Z_NULL, 0);
    int status = Z_OK;

    while (status != Z_STREAM_END) {
        std::vector<unsigned char> in_chunk;

        if (stream.avail_in == 0) {
            if (remaining_in == 0) {
                return fmt::format("deflate stream of entry '{}' is truncated", entry.name);
            }

            auto count = gsl::narrow_cast<std::size_t>(std::min<std::uint64_t>(remaining_in, CHUNK_SIZE));
            in_chunk = TRY(read_at(offset, count));
            offset += count;
            remaining_in -= count;

            stream.next_in = in_chunk.data();
            stream.avail_in = gsl::narrow_cast<uInt>(in_chunk.size());
        }

        // Drain all output this input chunk produces before the chunk goes out of scope
        do {
            stream.next_out = out_buf.data();
            stream.avail_out = gsl::narrow_cast<uInt>(out_buf.size());

            status = ::inflate(&stream, Z_NO_FLUSH);

            if (status != Z_OK && status != Z_STREAM_END && status != Z_BUF_ERROR) {
                return fmt::format("corrupt deflate data in entry '{}' ({})", entry.name,
                                   stream.msg != nullptr ? stream.msg : "unknown zlib error");
            }

            const std::size_t produced = out_buf.size() - stream.avail_out;
            written += produced;

            if (written > entry.uncompressed_size) {
                return fmt::format("entry '{}' inflates past its declared size of {} bytes", entry.name,
                                   entry.uncompressed_size);
            }

            crc = crc32(crc, out_buf.data(), gsl::narrow_cast<uInt>(produced));
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            out.write(reinterpret_cast<const char*>(out_buf.data()), gsl::narrow_cast<std::streamsize>(produced));

            if (!out) {
                return fmt::format("write failed for entry '{}'", entry.name);
            }
        } while (stream.avail_out == 0 && status != Z_STREAM_END);

        // Leftover input would dangle once `in_chunk` is destroyed
        if (status != Z_STREAM_END && stream.avail_in != 0) {
            return fmt::format("corrupt deflate data in entry '{}'", entry.name);
        }
    }

    if (written != entry.uncompressed_size) {
        return fmt::format("entry '{}' inflated to {} bytes, expected {}", entry.name, written,
                           entry.uncompressed_size);
    }

    if (crc != entry.crc32) {
        return fmt::format("CRC mismatch for entry '{}'", entry.name);
    }

    return {};
}

} // namespace suitegrader
