#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace suitegrader {

/// Outcome of one suite's ``run()``.
///
/// ``success`` states whether the suite ran to completion, independent of how the
/// submission fared. A result with ``success == false`` always carries an ``error``.
struct SuiteResult
{
    bool success = true;
    double score = 0;
    double max_score = 0;

    /// Kept in insertion order
    std::vector<std::string> feedback_messages;

    std::optional<std::string> error;

    void add_feedback(std::string msg) { feedback_messages.push_back(std::move(msg)); }

    void set_score(double new_score) { score = new_score; }

    /// Mark the run as not having completed
    void fail(std::string msg) {
        success = false;
        error = std::move(msg);
    }
};

} // namespace suitegrader
