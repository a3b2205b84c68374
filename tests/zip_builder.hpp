#pragma once

#include <zlib.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/// Writes zip archives byte by byte, so tests can produce archives no well-behaved
/// tool would: hostile entry names, lying size fields, and so on.
class ZipBuilder
{
public:
    struct Entry
    {
        std::string name;
        std::string data;
        bool deflate = true;

        /// Replaces the uncompressed size written to both headers
        std::optional<std::uint32_t> declared_size;
    };

    ZipBuilder& add(std::string name, std::string data, bool deflate = true) {
        entries_.push_back(Entry{.name = std::move(name), .data = std::move(data), .deflate = deflate,
                                 .declared_size = std::nullopt});
        return *this;
    }

    ZipBuilder& add_lying(std::string name, std::string data, std::uint32_t declared_size) {
        entries_.push_back(Entry{.name = std::move(name), .data = std::move(data), .deflate = true,
                                 .declared_size = declared_size});
        return *this;
    }

    ZipBuilder& add_dir(std::string name) {
        entries_.push_back(Entry{.name = std::move(name), .data = "", .deflate = false, .declared_size = std::nullopt});
        return *this;
    }

    std::string build() const {
        std::string out;
        std::string central;

        for (const auto& entry : entries_) {
            const auto offset = static_cast<std::uint32_t>(out.size());
            const std::string payload = entry.deflate ? raw_deflate(entry.data) : entry.data;
            const auto crc = static_cast<std::uint32_t>(
                crc32(0L, reinterpret_cast<const Bytef*>(entry.data.data()), static_cast<uInt>(entry.data.size())));
            const auto usize = entry.declared_size.value_or(static_cast<std::uint32_t>(entry.data.size()));
            const auto csize = static_cast<std::uint32_t>(payload.size());
            const std::uint16_t method = entry.deflate ? 8 : 0;

            put32(out, 0x04034b50);
            put16(out, 20);
            put16(out, 0);
            put16(out, method);
            put16(out, 0);
            put16(out, 0x21);
            put32(out, crc);
            put32(out, csize);
            put32(out, usize);
            put16(out, static_cast<std::uint16_t>(entry.name.size()));
            put16(out, 0);
            out += entry.name;
            out += payload;

            put32(central, 0x02014b50);
            put16(central, 0x031E);
            put16(central, 20);
            put16(central, 0);
            put16(central, method);
            put16(central, 0);
            put16(central, 0x21);
            put32(central, crc);
            put32(central, csize);
            put32(central, usize);
            put16(central, static_cast<std::uint16_t>(entry.name.size()));
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put16(central, 0);
            put32(central, 0);
            put32(central, offset);
            central += entry.name;
        }

        const auto cd_offset = static_cast<std::uint32_t>(out.size());
        out += central;

        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<std::uint16_t>(entries_.size()));
        put16(out, static_cast<std::uint16_t>(entries_.size()));
        put32(out, static_cast<std::uint32_t>(central.size()));
        put32(out, cd_offset);
        put16(out, 0);

        return out;
    }

    void write_to(const std::filesystem::path& path) const {
        std::ofstream file{path, std::ios::binary | std::ios::trunc};
        const auto bytes = build();
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));

        if (!file) {
            throw std::runtime_error("could not write test archive " + path.string());
        }
    }

    static std::string raw_deflate(std::string_view data) {
        z_stream stream{};

        if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }

        std::string out(deflateBound(&stream, static_cast<uLong>(data.size())), '\0');

        // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast, cppcoreguidelines-pro-type-reinterpret-cast)
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
        stream.avail_in = static_cast<uInt>(data.size());
        stream.next_out = reinterpret_cast<Bytef*>(out.data());
        stream.avail_out = static_cast<uInt>(out.size());
        // NOLINTEND(cppcoreguidelines-pro-type-const-cast, cppcoreguidelines-pro-type-reinterpret-cast)

        const int status = deflate(&stream, Z_FINISH);
        out.resize(stream.total_out);
        deflateEnd(&stream);

        if (status != Z_STREAM_END) {
            throw std::runtime_error("deflate did not finish");
        }

        return out;
    }

private:
    static void put16(std::string& out, std::uint16_t value) {
        out.push_back(static_cast<char>(value & 0xFFU));
        out.push_back(static_cast<char>((value >> 8) & 0xFFU));
    }

    static void put32(std::string& out, std::uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<char>((value >> (8 * i)) & 0xFFU));
        }
    }

    std::vector<Entry> entries_;
};
