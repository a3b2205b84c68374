#pragma once

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/api/suite_result.hpp>
#include <suitegrader/common/class_traits.hpp>
#include <suitegrader/logging.hpp>

#include <filesystem>
#include <string_view>
#include <utility>

namespace suitegrader {

/// Base class of every grading suite.
///
/// A suite is constructed and run inside its own resource-limited process, with the
/// submission's working directory as its current directory. Throwing from the
/// constructor or from ``run()`` marks the result as not successful.
class Suite : NonCopyable
{
public:
    Suite(std::filesystem::path work_path, int submission_id, SuiteConfig config, LoggerPtr logger)
        : work_path_{std::move(work_path)}
        , submission_id_{submission_id}
        , config_{std::move(config)}
        , logger_{std::move(logger)} {}

    virtual ~Suite() = default;

    virtual SuiteResult run() = 0;

    const std::filesystem::path& get_work_path() const { return work_path_; }

    int get_submission_id() const { return submission_id_; }

    const SuiteConfig& get_config() const { return config_; }

    std::string_view get_name() const { return config_.name; }

    const LoggerPtr& get_logger() const { return logger_; }

protected:
    /// A successful, zero-score result with this suite's max score filled in
    SuiteResult make_result() const {
        SuiteResult result;
        result.max_score = config_.max_score;
        return result;
    }

private:
    std::filesystem::path work_path_;
    int submission_id_;
    SuiteConfig config_;
    LoggerPtr logger_;
};

} // namespace suitegrader
