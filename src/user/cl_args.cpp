#include "user/cl_args.hpp"

#include "archive/archive_extractor.hpp"
#include "common/terminal_checks.hpp"
#include "user/program_options.hpp"

#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/version.hpp>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace suitegrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ SUITEGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("SuiteGrader v{}\nRuns the configured grading suites against a "
                                            "submission, each in its own resource-limited process.",
                                            SUITEGRADER_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("-c", "--config")
        .required()
        .metavar("FILE")
        .help("Grading configuration (YAML)");

    arg_parser_.add_argument("-w", "--work-dir")
        .required()
        .metavar("DIR")
        .help("Directory the submission is extracted into and the suites run in. Created if missing.");

    arg_parser_.add_argument("-s", "--submission")
        .metavar("FILE")
        .help("Submission zip archive. If omitted, grading runs on the work directory as is.");

    arg_parser_.add_argument("-i", "--id")
        .default_value(ProgramOptions::DEFAULT_SUBMISSION_ID)
        .metavar("N")
        .scan<'i', int>()
        .help("Submission identifier, echoed in the report");

    arg_parser_.add_argument("-o", "--output")
        .default_value(std::string{ProgramOptions::DEFAULT_OUTPUT_PATH})
        .metavar("FILE")
        .help("Report path. Overwritten if it exists.");

    arg_parser_.add_argument("--fallback-output")
        .metavar("FILE")
        .help("Where to write the report if --output cannot be written");

    arg_parser_.add_argument("--output-json")
        .metavar("FILE")
        .help("Also write the report as JSON. Overwritten if it exists.");

    arg_parser_.add_argument("--max-unzip-mb")
        .metavar("N")
        .action([](const std::string& opt) {
                const auto value = std::stoll(opt);

                if (value <= 0) {
                    throw std::invalid_argument(fmt::format("--max-unzip-mb must be positive, got {}", value));
                }

                if (static_cast<std::uint64_t>(value) > ExtractOptions::MAX_SIZE_MB) {
                    throw std::invalid_argument(
                        fmt::format("--max-unzip-mb must be at most {}, got {}", ExtractOptions::MAX_SIZE_MB, value));
                }

                return static_cast<std::uint64_t>(value);
        })
        .help("Override the extraction size budget from the configuration");

    arg_parser_.add_argument("-d", "--debug")
        .default_value(false)
        .implicit_value(true)
        .help("Enable debug logging");

    arg_parser_.add_argument("--print")
        .default_value(false)
        .implicit_value(true)
        .help("Also print the report to stdout");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", SUITEGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");
    // clang-format on
}

void CommandLineArgs::collect_options() {
    opts_buffer_.config_path = arg_parser_.get<std::string>("--config");
    opts_buffer_.work_dir = arg_parser_.get<std::string>("--work-dir");

    if (auto submission = arg_parser_.present<std::string>("--submission")) {
        opts_buffer_.submission_path = *submission;
    }

    opts_buffer_.submission_id = arg_parser_.get<int>("--id");
    opts_buffer_.output_path = arg_parser_.get<std::string>("--output");

    if (auto fallback = arg_parser_.present<std::string>("--fallback-output")) {
        opts_buffer_.fallback_output_path = *fallback;
    }

    if (auto json_output = arg_parser_.present<std::string>("--output-json")) {
        opts_buffer_.json_output_path = *json_output;
    }

    opts_buffer_.max_unzip_mb = arg_parser_.present<std::uint64_t>("--max-unzip-mb");

    opts_buffer_.debug = arg_parser_.get<bool>("--debug");
    opts_buffer_.print_report = arg_parser_.get<bool>("--print");
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
        collect_options();
    } catch (const std::exception& err) {
        return err.what();
    }

    TRY(opts_buffer_.validate());

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace suitegrader
