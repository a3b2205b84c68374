#include "app/grader_app.hpp"

#include "config/grading_config.hpp"
#include "grading_orchestrator.hpp"
#include "output/json_report.hpp"
#include "output/report_writer.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <suitegrader/grading_report.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace suitegrader {

namespace {

/// Persist a report for a run that never reached the orchestrator
int write_degenerate_report(const ProgramOptions& opts, std::string fatal_error) {
    GradingReport report;
    report.submission_id = opts.submission_id;
    report.fatal_error = std::move(fatal_error);

    ReportWriter writer{opts.output_path, opts.fallback_output_path, opts.submission_id};
    const auto lines = report.render();

    if (opts.print_report) {
        StdoutSink sink;
        ReportWriter::write_lines(sink, lines);
    }

    bool all_written = true;

    if (auto written = writer.write(lines); !written) {
        LOG_ERROR("No report could be written: {}", written.error());
        all_written = false;
    }

    if (opts.json_output_path) {
        if (auto written = write_json_report(*opts.json_output_path, report); !written) {
            LOG_ERROR("JSON report could not be written: {}", written.error());
            all_written = false;
        }
    }

    return all_written ? GraderApp::EXIT_ABORTED : GraderApp::EXIT_NO_REPORT;
}

} // namespace

int GraderApp::run_impl() {
    const auto run_logger = make_run_logger(OPTS.submission_id);

    std::error_code err;
    std::filesystem::create_directories(OPTS.work_dir, err);

    if (err) {
        LOGGER_ERROR(run_logger, "Cannot create work directory '{}': {}", OPTS.work_dir.string(), err.message());
        return write_degenerate_report(OPTS, fmt::format("Cannot create work directory: {}", err.message()));
    }

    auto config = GradingConfig::load_file(OPTS.config_path);

    if (!config) {
        LOGGER_ERROR(run_logger, "Configuration error: {}", config.error());
        return write_degenerate_report(OPTS, fmt::format("Configuration error: {}", config.error()));
    }

    if (OPTS.max_unzip_mb) {
        config->max_unzip_size_mb = *OPTS.max_unzip_mb;
    }

    LOGGER_DEBUG(run_logger, "Loaded {} suites from '{}'", config->suites.size(), OPTS.config_path.string());

    GradingOrchestrator orchestrator{std::move(*config), run_logger};

    const GradingRequest request{.work_dir = std::filesystem::absolute(OPTS.work_dir),
                                 .submission_id = OPTS.submission_id,
                                 .archive = OPTS.submission_path,
                                 .output_path = OPTS.output_path,
                                 .fallback_output = OPTS.fallback_output_path,
                                 .json_output = OPTS.json_output_path};

    auto outcome = orchestrator.run(request);

    if (OPTS.print_report) {
        StdoutSink sink;
        ReportWriter::write_lines(sink, outcome.report.render());
    }

    if (!outcome.written_to || (outcome.json_written && !*outcome.json_written)) {
        return EXIT_NO_REPORT;
    }

    return outcome.report.fatal_error ? EXIT_ABORTED : EXIT_GRADED;
}

} // namespace suitegrader
