/// \file
/// Defines data classes to store the result of one grading run
#pragma once

#include <range/v3/algorithm/count_if.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace suitegrader {

/// One attempted suite, as it appears in the report
struct SuiteSection
{
    std::string name;

    double score{};
    double max_score{};

    /// Feedback written by the suite itself. Empty when the suite failed.
    std::vector<std::string> feedback_messages;

    /// Set iff the suite did not produce a successful result
    std::optional<std::string> failure_reason;

    bool failed() const noexcept { return failure_reason.has_value(); }
};

/// Result of grading one submission.
///
/// Created empty at the start of a run and only ever appended to, one
/// section per attempted suite in configuration order.
struct GradingReport
{
    int submission_id = -1;

    double total_score{};

    /// Includes suites never reached because of an early stop, excludes skipped suites
    double total_max_score{};

    std::chrono::microseconds elapsed_time{};

    std::vector<SuiteSection> sections;

    /// Suite-delimited report lines, excluding the header
    std::vector<std::string> feedback;

    /// Set when the run was aborted before any suite could run.
    /// Holds the complete report line, rendered right after the header.
    std::optional<std::string> fatal_error;

    /// Name of the suite whose failure ended the run
    std::optional<std::string> stopped_early_after;

    /// Append a section and its feedback lines. Adds the section's score to ``total_score``.
    void add_section(SuiteSection section);

    /// The full report: header lines followed by ``feedback``
    std::vector<std::string> render() const;

    int num_failed() const {
        return static_cast<int>(ranges::count_if(sections, [](const SuiteSection& sec) { return sec.failed(); }));
    }
};

} // namespace suitegrader
