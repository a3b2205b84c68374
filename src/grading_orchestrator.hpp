#pragma once

#include "config/grading_config.hpp"
#include "registry/suite_registry.hpp"
#include "runner/isolated_runner.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/grading_report.hpp>
#include <suitegrader/logging.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace suitegrader {

/// Everything that identifies one grading run
struct GradingRequest
{
    /// Suites run with this as their current directory
    std::filesystem::path work_dir;

    int submission_id = -1;

    /// Extracted into ``work_dir`` before any suite runs
    std::optional<std::filesystem::path> archive;

    std::filesystem::path output_path = "output.txt";

    /// Defaults to ``ReportWriter::default_fallback``
    std::optional<std::filesystem::path> fallback_output;

    /// Also write the report as JSON here
    std::optional<std::filesystem::path> json_output;
};

/// Sequences the configured suites for one submission and folds their outcomes into a report.
///
/// Suites run one at a time in declaration order. A suite failure never escapes as an
/// exception; it becomes a failed section in the report.
class GradingOrchestrator
{
public:
    struct Outcome
    {
        GradingReport report;

        /// Where the report ended up, or why it could not be written anywhere
        Expected<std::filesystem::path, std::string> written_to;

        /// Set iff a JSON report was requested
        std::optional<Expected<void, std::string>> json_written;
    };

    GradingOrchestrator(GradingConfig config, LoggerPtr logger)
        : config_{std::move(config)}
        , logger_{std::move(logger)}
        , runner_{logger_} {}

    /// Produce the report without persisting it
    GradingReport grade(const GradingRequest& request) const;

    /// Produce the report and persist it exactly once, plus once as JSON if requested
    Outcome run(const GradingRequest& request) const;

    const GradingConfig& get_config() const { return config_; }

private:
    SuiteSection run_suite(SuiteRegistry& registry, const SuiteConfig& suite, const GradingRequest& request) const;

    GradingConfig config_;
    LoggerPtr logger_;
    IsolatedRunner runner_;
};

} // namespace suitegrader
