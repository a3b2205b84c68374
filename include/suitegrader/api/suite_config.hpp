#pragma once

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace suitegrader {

/// One configured grading unit, as read from the ``suites`` list of the configuration file.
///
/// Read-only to everything but the configuration loader.
struct SuiteConfig
{
    static constexpr int DEFAULT_TIMEOUT_SEC = 30;
    static constexpr std::int64_t DEFAULT_RAM_LIMIT_MB = 512;
    static constexpr std::int64_t DEFAULT_FILE_SIZE_LIMIT_MB = 50;
    static constexpr std::int64_t DEFAULT_NUM_PROC_LIMIT = 100;
    static constexpr std::int64_t DEFAULT_NUM_OPEN_FILES_LIMIT = 100;

    /// Unique within a configuration
    std::string name;

    /// Shared library that registers ``implementation_class``.
    /// Empty means the class is compiled into the running program.
    std::string implementation_path;
    std::string implementation_class;

    double max_score = 0;

    int timeout_sec = DEFAULT_TIMEOUT_SEC;
    std::int64_t ram_limit_mb = DEFAULT_RAM_LIMIT_MB;
    std::int64_t file_size_limit_mb = DEFAULT_FILE_SIZE_LIMIT_MB;
    std::int64_t num_proc_limit = DEFAULT_NUM_PROC_LIMIT;
    std::int64_t num_open_files_limit = DEFAULT_NUM_OPEN_FILES_LIMIT;

    bool stop_on_failure = false;
    bool skip = false;

    /// The suite's full mapping, including keys the grader itself does not interpret
    YAML::Node params;

    /// Look up a suite parameter, falling back to ``default_value`` if absent.
    /// Throws ``YAML::Exception`` if the value cannot be converted to ``T``.
    template <typename T>
    T param_or(const std::string& key, const T& default_value) const {
        if (!params || !params.IsMap() || !params[key]) {
            return default_value;
        }

        return params[key].as<T>();
    }

    bool has_param(const std::string& key) const { return params && params.IsMap() && params[key]; }
};

} // namespace suitegrader
