#pragma once

#include "output/sink.hpp"

#include <suitegrader/common/expected.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace suitegrader {

/// Writes to a file, replacing anything already there
class FileSink : public Sink
{
public:
    /// Creates missing parent directories, then opens ``path`` truncated
    static Expected<FileSink, std::string> open(const std::filesystem::path& path);

    void write(std::string_view str) override;
    void flush() override;

    /// Flush and close, reporting whether every write made it to the file
    Expected<void, std::string> close();

    const std::filesystem::path& get_path() const { return path_; }

    ~FileSink() override = default;

    FileSink(FileSink&&) = default;
    FileSink& operator=(FileSink&&) = default;

private:
    FileSink(std::filesystem::path path, std::ofstream stream)
        : path_{std::move(path)}
        , stream_{std::move(stream)} {}

    std::filesystem::path path_;
    std::ofstream stream_;
};

} // namespace suitegrader
