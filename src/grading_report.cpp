#include <suitegrader/grading_report.hpp>

#include "common/score_format.hpp"
#include "common/time.hpp"

#include <fmt/format.h>

#include <string>
#include <utility>
#include <vector>

namespace suitegrader {

void GradingReport::add_section(SuiteSection section) {
    if (section.failed()) {
        section.score = 0;
    }

    feedback.emplace_back();
    feedback.push_back(fmt::format("=== Suite: {} ===", section.name));

    if (section.failed()) {
        feedback.push_back(fmt::format("Suite failed: {}", *section.failure_reason));
    } else {
        feedback.insert(feedback.end(), section.feedback_messages.begin(), section.feedback_messages.end());
    }

    // A failed suite scores a plain 0, a completed one keeps its decimal point
    const auto score_str = section.failed() ? std::string{"0"} : format_score(section.score);
    feedback.push_back(fmt::format("Suite score: {} / {}", score_str, format_max_score(section.max_score)));

    total_score += section.score;

    sections.push_back(std::move(section));
}

std::vector<std::string> GradingReport::render() const {
    std::vector<std::string> lines;
    lines.reserve(feedback.size() + 4);

    lines.push_back(fmt::format("Submission ID: {}", submission_id));
    lines.push_back(
        fmt::format("Total score: {} / {}", format_score(total_score), format_max_score(total_max_score)));
    lines.push_back(fmt::format("Elapsed time: {}", format_elapsed(elapsed_time)));

    if (fatal_error) {
        lines.push_back(*fatal_error);
    }

    lines.insert(lines.end(), feedback.begin(), feedback.end());

    return lines;
}

} // namespace suitegrader
