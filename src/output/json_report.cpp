#include "output/json_report.hpp"

#include "output/file_sink.hpp"

#include <suitegrader/common/error_types.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/grading_report.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace suitegrader {

void to_json(nlohmann::json& json, const SuiteSection& section) {
    json = {{"name", section.name},
            {"score", section.score},
            {"max_score", section.max_score},
            {"feedback", section.feedback_messages},
            {"error", nullptr}};

    if (section.failure_reason) {
        json["error"] = *section.failure_reason;
    }
}

void to_json(nlohmann::json& json, const GradingReport& report) {
    json = {{"score", report.total_score},
            {"max_score", report.total_max_score},
            {"feedback", fmt::format("{}", fmt::join(report.feedback, "\n"))},
            {"error", report.fatal_error.value_or("")},
            {"submission_id", report.submission_id},
            {"elapsed_seconds", std::chrono::duration<double>{report.elapsed_time}.count()},
            {"stopped_early_after", nullptr},
            {"suites", report.sections}};

    if (report.stopped_early_after) {
        json["stopped_early_after"] = *report.stopped_early_after;
    }
}

Expected<void, std::string> write_json_report(const std::filesystem::path& path, const GradingReport& report) {
    constexpr int INDENT = 2;

    auto sink = TRY(FileSink::open(path));

    // Feedback is whatever the suites wrote; invalid UTF-8 is replaced rather than refused
    sink.write(nlohmann::json(report).dump(INDENT, ' ', false, nlohmann::json::error_handler_t::replace));
    sink.write("\n");

    return sink.close();
}

} // namespace suitegrader
