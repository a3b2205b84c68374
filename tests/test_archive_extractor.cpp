#include "catch2_custom.hpp"

#include "archive/archive_extractor.hpp"
#include "archive/zip_directory.hpp"
#include "temp_dir.hpp"
#include "zip_builder.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

using suitegrader::ArchiveExtractor;
using suitegrader::ExtractErrorKind;
using suitegrader::ExtractOptions;
using suitegrader::ZipDirectory;

namespace {

/// Not compressible, so stored and deflated sizes stay close
std::string noise(std::size_t size, unsigned seed = 1) {
    std::string data(size, '\0');
    std::uint32_t state = seed;

    for (auto& chr : data) {
        state = state * 1664525U + 1013904223U;
        chr = static_cast<char>(state >> 24);
    }

    return data;
}

} // namespace

TEST_CASE("Extract a well-formed archive") {
    TempDir tmp;
    const auto archive = tmp / "submission.zip";
    const auto dest = tmp.make_dir("work");

    ZipBuilder{}
        .add_dir("src/")
        .add("src/main.c", "int main(void) { return 0; }\n")
        .add("Makefile", "all:\n\tcc -o main src/main.c\n", /*deflate=*/false)
        .add("data/blob.bin", noise(4096))
        .write_to(archive);

    ArchiveExtractor extractor;
    auto files = extractor.extract(archive, dest);

    REQUIRE(files);
    REQUIRE(files->size() == 3);

    REQUIRE(TempDir::read_file(dest / "src/main.c") == "int main(void) { return 0; }\n");
    REQUIRE(TempDir::read_file(dest / "Makefile") == "all:\n\tcc -o main src/main.c\n");
    REQUIRE(TempDir::read_file(dest / "data/blob.bin") == noise(4096));
}

TEST_CASE("Entries with a zero compressed size are extracted and count toward the budget") {
    TempDir tmp;
    const auto archive = tmp / "empty_entry.zip";
    const auto dest = tmp.make_dir("work");

    ZipBuilder{}.add("empty.txt", "", /*deflate=*/false).add("notes.txt", "hello").write_to(archive);

    auto files = ArchiveExtractor{}.extract(archive, dest);

    REQUIRE(files);
    REQUIRE(std::filesystem::is_regular_file(dest / "empty.txt"));
    REQUIRE(std::filesystem::file_size(dest / "empty.txt") == 0);
}

TEST_CASE("Path traversal leaves the destination empty") {
    TempDir tmp;
    const auto archive = tmp / "evil.zip";
    const auto dest = tmp.make_dir("work");

    ZipBuilder{}.add("ok.txt", "harmless").add("../../etc/passwd", "root::0:0::/root:/bin/sh\n").write_to(archive);

    auto res = ArchiveExtractor{}.extract(archive, dest);

    REQUIRE(!res);
    REQUIRE(res.error().kind == ExtractErrorKind::PathTraversal);
    REQUIRE(TempDir::is_empty_dir(dest));
}

TEST_CASE("Unsafe entry names") {
    auto [name, unsafe] = GENERATE(table<std::string, bool>({
        {"../../etc/passwd", true},
        {"/etc/passwd", true},
        {"\\windows\\system32", true},
        {"C:\\autoexec.bat", true},
        {"c:relative", true},
        {"src/../../outside", true},
        {"src\\..\\..\\outside", true},
        {"dir/..", true},
        {"..", true},
        {"src/main.c", false},
        {"..hidden", false},
        {"a..b/c", false},
        {"./src/main.c", false},
        {"dir/", false},
    }));

    CAPTURE(name);
    REQUIRE(ArchiveExtractor::is_unsafe_name(name) == unsafe);
}

TEST_CASE("Compression ratio above 100:1 is rejected before writing") {
    TempDir tmp;
    const auto archive = tmp / "bomb.zip";
    const auto dest = tmp.make_dir("work");

    // A few bytes of deflate data claiming to expand to 50 MiB
    ZipBuilder{}.add("readme.txt", "fine").add_lying("bomb.bin", std::string(2000, 'A'), 50U * 1024 * 1024).write_to(
        archive);

    auto res = ArchiveExtractor{}.extract(archive, dest);

    REQUIRE(!res);
    REQUIRE(res.error().kind == ExtractErrorKind::CompressionRatio);
    REQUIRE(TempDir::is_empty_dir(dest));
}

TEST_CASE("Cumulative declared size beyond the budget is rejected") {
    TempDir tmp;
    const auto archive = tmp / "big.zip";
    const auto dest = tmp.make_dir("work");

    ZipBuilder{}
        .add("part1.bin", noise(600, 1), /*deflate=*/false)
        .add("part2.bin", noise(600, 2), /*deflate=*/false)
        .write_to(archive);

    ArchiveExtractor extractor{ExtractOptions{.max_size_bytes = 1000,
                                              .accepted_content_types = ExtractOptions::default_content_types()}};

    auto res = extractor.extract(archive, dest);

    REQUIRE(!res);
    REQUIRE(res.error().kind == ExtractErrorKind::SizeBudgetExceeded);
    REQUIRE(TempDir::is_empty_dir(dest));

    SECTION("The same archive fits a larger budget") {
        ArchiveExtractor roomy{ExtractOptions{.max_size_bytes = 1200,
                                              .accepted_content_types = ExtractOptions::default_content_types()}};
        REQUIRE(roomy.extract(archive, dest));
    }
}

TEST_CASE("Content type is detected from bytes, not the extension") {
    TempDir tmp;
    const auto dest = tmp.make_dir("work");

    SECTION("Plain text named .zip") {
        const auto fake = tmp.write_file("fake.zip", "this is not an archive, just text\n");

        auto res = ArchiveExtractor{}.extract(fake, dest);

        REQUIRE(!res);
        REQUIRE(res.error().kind == ExtractErrorKind::BadContentType);
    }

    SECTION("Real zip rejected when zip is not an accepted type") {
        const auto archive = tmp / "submission.zip";
        ZipBuilder{}.add("a.txt", "a").write_to(archive);

        ArchiveExtractor extractor{ExtractOptions{.max_size_bytes = 1024, .accepted_content_types = {"text/plain"}}};
        auto res = extractor.extract(archive, dest);

        REQUIRE(!res);
        REQUIRE(res.error().kind == ExtractErrorKind::BadContentType);
    }

    REQUIRE(TempDir::is_empty_dir(dest));
}

TEST_CASE("Structurally broken archives are rejected") {
    TempDir tmp;
    const auto dest = tmp.make_dir("work");

    auto bytes = ZipBuilder{}.add("a.txt", noise(256)).add("b.txt", noise(256, 7)).build();

    SECTION("Missing end of central directory") {
        bytes.resize(bytes.size() - 10);
    }

    SECTION("Central directory offset past the end") {
        // cd offset is the u32 at EOCD + 16, EOCD is the last 22 bytes
        const auto pos = bytes.size() - 22 + 16;
        bytes[pos + 3] = '\x7F';
    }

    const auto archive = tmp.write_file("broken.zip", bytes);

    auto res = ArchiveExtractor{}.extract(archive, dest);

    REQUIRE(!res);
    REQUIRE(res.error().kind == ExtractErrorKind::CorruptArchive);
    REQUIRE(TempDir::is_empty_dir(dest));
}

TEST_CASE("Destination must be an existing directory") {
    TempDir tmp;
    const auto archive = tmp / "submission.zip";
    ZipBuilder{}.add("a.txt", "a").write_to(archive);

    auto res = ArchiveExtractor{}.extract(archive, tmp / "does-not-exist");

    REQUIRE(!res);
    REQUIRE(res.error().kind == ExtractErrorKind::NotADirectory);
}

TEST_CASE("An entry that inflates past its declared size is rolled back") {
    TempDir tmp;
    const auto archive = tmp / "liar.zip";
    const auto dest = tmp.make_dir("work");

    // Ratio check passes (declared 64 bytes), but the data really is 4000 bytes
    ZipBuilder{}
        .add("first/ok.txt", "written before the bad entry")
        .add_lying("second/liar.txt", noise(4000), 64)
        .write_to(archive);

    auto res = ArchiveExtractor{}.extract(archive, dest);

    REQUIRE(!res);
    REQUIRE(res.error().kind == ExtractErrorKind::CorruptArchive);
    REQUIRE(TempDir::is_empty_dir(dest));
}

TEST_CASE("ZipDirectory lists entries without extracting") {
    TempDir tmp;
    const auto archive = tmp / "listing.zip";

    ZipBuilder{}.add_dir("dir/").add("dir/file.txt", std::string(1000, 'z')).write_to(archive);

    auto dir = ZipDirectory::open(archive);

    REQUIRE(dir);
    REQUIRE(dir->entries().size() == 2);

    const auto& dir_entry = dir->entries().at(0);
    const auto& file_entry = dir->entries().at(1);

    REQUIRE(dir_entry.is_directory());
    REQUIRE(file_entry.name == "dir/file.txt");
    REQUIRE(file_entry.method == suitegrader::ZipEntry::METHOD_DEFLATE);
    REQUIRE(file_entry.uncompressed_size == 1000);
    REQUIRE(file_entry.compressed_size < 1000);
}
