#pragma once

#include "archive/archive_extractor.hpp"

#include <suitegrader/common/error_types.hpp>
#include <suitegrader/common/expected.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace suitegrader {

struct ProgramOptions
{

    // ###### Argument fields

    std::filesystem::path config_path;

    /// Created if it does not exist
    std::filesystem::path work_dir;

    /// Grading runs on ``work_dir`` as is when absent
    std::optional<std::filesystem::path> submission_path;

    int submission_id = DEFAULT_SUBMISSION_ID;

    std::filesystem::path output_path = std::string{DEFAULT_OUTPUT_PATH};
    std::optional<std::filesystem::path> fallback_output_path;

    /// Also write the report as JSON
    std::optional<std::filesystem::path> json_output_path;

    /// Overrides the configuration's ``max_unzip_size_mb``
    std::optional<std::uint64_t> max_unzip_mb;

    bool debug = false;

    /// Also print the report to stdout
    bool print_report = false;

    // ###### Argument defaults

    static constexpr int DEFAULT_SUBMISSION_ID = -1;
    static constexpr std::string_view DEFAULT_OUTPUT_PATH = "./output.txt";

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        TRY(ensure_is_regular_file(config_path, "Configuration file '{}'"));

        if (work_dir.empty()) {
            return std::string{"Work directory must not be empty"};
        }

        // A missing work directory is created later; anything else in its place is an error
        if (std::filesystem::exists(work_dir) && !std::filesystem::is_directory(work_dir)) {
            return fmt::format("Work directory '{}' is not a directory", work_dir.string());
        }

        if (submission_path) {
            TRY(ensure_is_regular_file(*submission_path, "Submission '{}'"));
        }

        if (max_unzip_mb && *max_unzip_mb == 0) {
            return std::string{"Extraction budget must be greater than 0 MB"};
        }

        if (max_unzip_mb && *max_unzip_mb > ExtractOptions::MAX_SIZE_MB) {
            return fmt::format("Extraction budget must be at most {} MB", ExtractOptions::MAX_SIZE_MB);
        }

        return {};
    }
};

} // namespace suitegrader

template <>
struct fmt::formatter<::suitegrader::ProgramOptions> : fmt::formatter<std::string>
{
    auto format(const ::suitegrader::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(
            fmt::format("{{config={}, work_dir={}, submission={}, id={}, output={}, fallback={}, json={}, "
                        "max_unzip_mb={}, debug={}, print={}}}",
                        from.config_path.string(), from.work_dir.string(),
                        from.submission_path ? from.submission_path->string() : "<none>", from.submission_id,
                        from.output_path.string(),
                        from.fallback_output_path ? from.fallback_output_path->string() : "<default>",
                        from.json_output_path ? from.json_output_path->string() : "<none>",
                        from.max_unzip_mb ? fmt::to_string(*from.max_unzip_mb) : "<config>", from.debug,
                        from.print_report),
            ctx);
    }
};
