#pragma once

#include "archive/archive_extractor.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/common/expected.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace suitegrader {

/// A fully validated grading configuration
struct GradingConfig
{
    /// In declaration order; names are unique
    std::vector<SuiteConfig> suites;

    /// In (0, ExtractOptions::MAX_SIZE_MB]
    std::uint64_t max_unzip_size_mb = ExtractOptions::DEFAULT_MAX_SIZE_MB;

    std::vector<std::string> allowed_content_types = ExtractOptions::default_content_types();

    /// Relative suite implementation paths are resolved against this directory
    std::filesystem::path base_dir;

    /// Read and validate a configuration file. ``base_dir`` becomes the file's directory.
    static Expected<GradingConfig, std::string> load_file(const std::filesystem::path& path);

    /// Parse and validate configuration text
    static Expected<GradingConfig, std::string> parse(std::string_view yaml_text,
                                                      std::filesystem::path base_dir = ".");

    ExtractOptions extract_options() const {
        return ExtractOptions{.max_size_bytes = max_unzip_size_mb * ExtractOptions::BYTES_PER_MB,
                              .accepted_content_types = allowed_content_types};
    }

    double total_max_score() const;

private:
    static Expected<GradingConfig, std::string> from_node(const YAML::Node& root, std::filesystem::path base_dir);

    static Expected<SuiteConfig, std::string> parse_suite(const YAML::Node& entry, std::size_t index);
};

} // namespace suitegrader
