#include "config/grading_config.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace suitegrader {

namespace {

/// Read ``key`` from ``map`` into ``out`` if present; ``out`` keeps its default otherwise.
/// A present key of the wrong type is an error.
template <typename T>
Expected<void, std::string> read_key(const YAML::Node& map, const std::string& key, T& out, std::string_view context) {
    const YAML::Node value = map[key];

    if (!value || value.IsNull()) {
        return {};
    }

    try {
        out = value.as<T>();
    } catch (const YAML::Exception&) {
        return fmt::format("{}: key '{}' has the wrong type (line {})", context, key, value.Mark().line + 1);
    }

    return {};
}

template <typename Int>
Expected<void, std::string> ensure_positive(Int value, std::string_view key, std::string_view context) {
    if (value <= 0) {
        return fmt::format("{}: '{}' must be greater than 0 (got {})", context, key, value);
    }

    return {};
}

} // namespace

Expected<GradingConfig, std::string> GradingConfig::load_file(const std::filesystem::path& path) {
    std::ifstream file{path};

    if (!file) {
        return fmt::format("cannot read configuration file '{}'", path.string());
    }

    std::stringstream contents;
    contents << file.rdbuf();

    LOG_DEBUG("Loading configuration from '{}'", path.string());

    std::filesystem::path base_dir = path.parent_path();
    if (base_dir.empty()) {
        base_dir = ".";
    }

    return parse(contents.str(), std::move(base_dir));
}

Expected<GradingConfig, std::string> GradingConfig::parse(std::string_view yaml_text, std::filesystem::path base_dir) {
    YAML::Node root;

    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::Exception& ex) {
        return fmt::format("configuration is not valid YAML: {}", ex.what());
    }

    return from_node(root, std::move(base_dir));
}

Expected<GradingConfig, std::string> GradingConfig::from_node(const YAML::Node& root, std::filesystem::path base_dir) {
    if (!root.IsMap()) {
        return std::string{"configuration must be a mapping"};
    }

    GradingConfig config;
    config.base_dir = std::move(base_dir);

    TRY(read_key(root, "max_unzip_size_mb", config.max_unzip_size_mb, "configuration"));
    if (config.max_unzip_size_mb == 0) {
        return std::string{"configuration: 'max_unzip_size_mb' must be greater than 0"};
    }
    if (config.max_unzip_size_mb > ExtractOptions::MAX_SIZE_MB) {
        return fmt::format("configuration: 'max_unzip_size_mb' must be at most {} (got {})", ExtractOptions::MAX_SIZE_MB,
                           config.max_unzip_size_mb);
    }

    TRY(read_key(root, "allowed_content_types", config.allowed_content_types, "configuration"));
    if (config.allowed_content_types.empty()) {
        return std::string{"configuration: 'allowed_content_types' must not be empty"};
    }

    const YAML::Node suites = root["suites"];

    if (!suites || !suites.IsSequence() || suites.size() == 0) {
        return std::string{"configuration: 'suites' must be a non-empty list"};
    }

    for (std::size_t i = 0; i < suites.size(); ++i) {
        SuiteConfig suite = TRY(parse_suite(suites[i], i));

        auto same_name = [&suite](const SuiteConfig& other) { return other.name == suite.name; };
        if (ranges::find_if(config.suites, same_name) != config.suites.end()) {
            return fmt::format("configuration: duplicate suite name '{}'", suite.name);
        }

        config.suites.push_back(std::move(suite));
    }

    LOG_DEBUG("Configuration has {} suites", config.suites.size());

    return config;
}

Expected<SuiteConfig, std::string> GradingConfig::parse_suite(const YAML::Node& entry, std::size_t index) {
    if (!entry.IsMap() || entry.size() != 1) {
        return fmt::format("configuration: suite #{} must be a mapping with exactly one key (the suite name)",
                           index + 1);
    }

    const auto item = *entry.begin();

    SuiteConfig suite;

    try {
        suite.name = item.first.as<std::string>();
    } catch (const YAML::Exception&) {
        return fmt::format("configuration: suite #{} has an invalid name", index + 1);
    }

    if (suite.name.empty()) {
        return fmt::format("configuration: suite #{} has an empty name", index + 1);
    }

    const YAML::Node body = item.second;
    const std::string context = fmt::format("suite '{}'", suite.name);

    if (!body.IsMap()) {
        return fmt::format("{}: settings must be a mapping containing at least 'class'", context);
    }

    TRY(read_key(body, "path", suite.implementation_path, context));
    TRY(read_key(body, "class", suite.implementation_class, context));
    TRY(read_key(body, "max_score", suite.max_score, context));
    TRY(read_key(body, "timeout_sec", suite.timeout_sec, context));
    TRY(read_key(body, "ram_limit_mb", suite.ram_limit_mb, context));
    TRY(read_key(body, "file_size_limit_mb", suite.file_size_limit_mb, context));
    TRY(read_key(body, "num_proc_limit", suite.num_proc_limit, context));
    TRY(read_key(body, "num_open_files_limit", suite.num_open_files_limit, context));
    TRY(read_key(body, "stop_on_failure", suite.stop_on_failure, context));
    TRY(read_key(body, "skip", suite.skip, context));

    if (suite.implementation_class.empty()) {
        return fmt::format("{}: missing 'class'", context);
    }

    if (!std::isfinite(suite.max_score) || suite.max_score < 0) {
        return fmt::format("{}: 'max_score' must be a number >= 0 (got {})", context, suite.max_score);
    }

    TRY(ensure_positive(suite.timeout_sec, "timeout_sec", context));
    TRY(ensure_positive(suite.ram_limit_mb, "ram_limit_mb", context));
    TRY(ensure_positive(suite.file_size_limit_mb, "file_size_limit_mb", context));
    TRY(ensure_positive(suite.num_proc_limit, "num_proc_limit", context));
    TRY(ensure_positive(suite.num_open_files_limit, "num_open_files_limit", context));

    suite.params = YAML::Clone(body);

    return suite;
}

double GradingConfig::total_max_score() const {
    double total = 0;

    for (const SuiteConfig& suite : suites) {
        if (!suite.skip) {
            total += suite.max_score;
        }
    }

    return total;
}

} // namespace suitegrader
