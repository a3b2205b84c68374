#include "grading_orchestrator.hpp"

#include "archive/archive_extractor.hpp"
#include "common/score_format.hpp"
#include "output/json_report.hpp"
#include "output/report_writer.hpp"
#include "registry/suite_registry.hpp"
#include "runner/isolated_runner.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/grading_report.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace suitegrader {

GradingReport GradingOrchestrator::grade(const GradingRequest& request) const {
    using std::chrono::steady_clock;

    const auto start_time = steady_clock::now();

    GradingReport report;
    report.submission_id = request.submission_id;
    report.total_max_score = config_.total_max_score();

    auto finalize = [&] {
        report.elapsed_time = std::chrono::duration_cast<std::chrono::microseconds>(steady_clock::now() - start_time);

        LOGGER_INFO(logger_, "Grading finished: {} / {} in {} suites ({} failed)", format_score(report.total_score),
                    format_max_score(report.total_max_score), report.sections.size(), report.num_failed());
    };

    LOGGER_INFO(logger_, "Grading submission {} in '{}'", request.submission_id, request.work_dir.string());

    if (request.archive) {
        LOGGER_INFO(logger_, "Extracting '{}'", request.archive->string());

        ArchiveExtractor extractor{config_.extract_options()};

        auto extracted = extractor.extract(*request.archive, request.work_dir);

        if (!extracted) {
            LOGGER_ERROR(logger_, "Submission extraction failed: {}", extracted.error().to_string());

            report.fatal_error = fmt::format("Submission extraction failed: {}", extracted.error().to_string());
            finalize();

            return report;
        }

        LOGGER_DEBUG(logger_, "Extracted {} files", extracted->size());
    }

    SuiteRegistry registry{config_.base_dir, logger_};
    registry.load(config_.suites);

    for (const auto& suite : config_.suites) {
        if (suite.skip) {
            LOGGER_INFO(logger_, "Skipping suite '{}'", suite.name);
            continue;
        }

        auto section = run_suite(registry, suite, request);
        const bool failed = section.failed();

        report.add_section(std::move(section));

        if (failed && suite.stop_on_failure) {
            LOGGER_WARN(logger_, "Suite '{}' failed, stopping further grading", suite.name);
            report.stopped_early_after = suite.name;
            break;
        }
    }

    finalize();

    return report;
}

SuiteSection GradingOrchestrator::run_suite(SuiteRegistry& registry, const SuiteConfig& suite,
                                            const GradingRequest& request) const {
    SuiteSection section{.name = suite.name,
                         .score = 0,
                         .max_score = suite.max_score,
                         .feedback_messages = {},
                         .failure_reason = std::nullopt};

    auto factory = registry.find(suite.name);

    if (!factory) {
        auto reason = registry.get_failure(suite.name).value_or("no implementation registered");
        section.failure_reason = fmt::format("Could not load suite implementation: {}", reason);
        return section;
    }

    LOGGER_INFO(logger_, "Running suite '{}'", suite.name);

    auto outcome = runner_.run(factory->get(), request.work_dir, request.submission_id, suite);

    if (!outcome) {
        const auto& failure = outcome.error();
        LOGGER_ERROR(logger_, "Suite '{}' did not complete ({}): {}", suite.name, failure.kind, failure.message);
        section.failure_reason = failure.message;
        return section;
    }

    auto& result = outcome.value();

    if (!result.success) {
        LOGGER_ERROR(logger_, "Suite '{}' failed: {}", suite.name, result.error.value_or(""));
        section.failure_reason = result.error.value_or("No error message provided");
        if (section.failure_reason->empty()) {
            section.failure_reason = "No error message provided";
        }
        return section;
    }

    LOGGER_INFO(logger_, "Suite '{}' scored {} / {}", suite.name, format_score(result.score),
                format_max_score(result.max_score));

    section.score = result.score;
    section.feedback_messages = std::move(result.feedback_messages);

    return section;
}

GradingOrchestrator::Outcome GradingOrchestrator::run(const GradingRequest& request) const {
    auto report = grade(request);

    ReportWriter writer{request.output_path, request.fallback_output, request.submission_id};
    auto written_to = writer.write(report.render());

    if (written_to) {
        LOGGER_INFO(logger_, "Report written to '{}'", written_to->string());
    } else {
        LOGGER_ERROR(logger_, "Report could not be written: {}", written_to.error());
    }

    std::optional<Expected<void, std::string>> json_written;

    if (request.json_output) {
        json_written = write_json_report(*request.json_output, report);

        if (*json_written) {
            LOGGER_INFO(logger_, "JSON report written to '{}'", request.json_output->string());
        } else {
            LOGGER_ERROR(logger_, "JSON report could not be written: {}", json_written->error());
        }
    }

    return Outcome{.report = std::move(report),
                   .written_to = std::move(written_to),
                   .json_written = std::move(json_written)};
}

} // namespace suitegrader
