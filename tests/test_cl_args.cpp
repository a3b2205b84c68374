#include "catch2_custom.hpp"

#include "temp_dir.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <string>
#include <vector>

using suitegrader::CommandLineArgs;
using suitegrader::ProgramOptions;

namespace {

auto parse(std::vector<std::string> args) {
    args.insert(args.begin(), "/usr/bin/suitegrader");

    std::vector<const char*> argv;
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }

    CommandLineArgs cl_args{argv};
    return cl_args.parse();
}

} // namespace

TEST_CASE("Full command line") {
    TempDir tmp;
    const auto config = tmp.write_file("grading.yaml", "suites: []\n");
    const auto submission = tmp.write_file("submission.zip", "PK");

    auto opts = parse({"-c", config.string(), "-w", (tmp / "work").string(), "-s", submission.string(), "-i", "42",
                       "-o", (tmp / "out.txt").string(), "--fallback-output", (tmp / "fb.txt").string(),
                       "--output-json", (tmp / "out.json").string(), "--max-unzip-mb", "5", "-d", "--print"});

    REQUIRE(opts);
    REQUIRE(opts->config_path == config);
    REQUIRE(opts->work_dir == tmp / "work");
    REQUIRE(opts->submission_path == submission);
    REQUIRE(opts->submission_id == 42);
    REQUIRE(opts->output_path == tmp / "out.txt");
    REQUIRE(opts->fallback_output_path == tmp / "fb.txt");
    REQUIRE(opts->json_output_path == tmp / "out.json");
    REQUIRE(opts->max_unzip_mb == 5U);
    REQUIRE(opts->debug);
    REQUIRE(opts->print_report);
}

TEST_CASE("Defaults") {
    TempDir tmp;
    const auto config = tmp.write_file("grading.yaml", "suites: []\n");

    auto opts = parse({"--config", config.string(), "--work-dir", tmp.path().string()});

    REQUIRE(opts);
    REQUIRE(!opts->submission_path);
    REQUIRE(opts->submission_id == ProgramOptions::DEFAULT_SUBMISSION_ID);
    REQUIRE(opts->output_path == std::string{ProgramOptions::DEFAULT_OUTPUT_PATH});
    REQUIRE(!opts->fallback_output_path);
    REQUIRE(!opts->json_output_path);
    REQUIRE(!opts->max_unzip_mb);
    REQUIRE(!opts->debug);
    REQUIRE(!opts->print_report);
}

TEST_CASE("Invalid command lines") {
    using Catch::Matchers::ContainsSubstring;

    TempDir tmp;
    const auto config = tmp.write_file("grading.yaml", "suites: []\n");
    const auto work = tmp.path().string();

    SECTION("Missing required argument") {
        auto opts = parse({"-w", work});

        REQUIRE(!opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("required"));
    }

    SECTION("Configuration file does not exist") {
        auto opts = parse({"-c", (tmp / "missing.yaml").string(), "-w", work});

        REQUIRE(!opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("does not exist"));
    }

    SECTION("Work directory is a file") {
        auto opts = parse({"-c", config.string(), "-w", config.string()});

        REQUIRE(!opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("is not a directory"));
    }

    SECTION("Submission does not exist") {
        auto opts = parse({"-c", config.string(), "-w", work, "-s", (tmp / "nope.zip").string()});

        REQUIRE(!opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("Submission"));
    }

    SECTION("Non-positive extraction budget") {
        auto opts = parse({"-c", config.string(), "-w", work, "--max-unzip-mb", "0"});

        REQUIRE(!opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("must be positive"));
    }

    SECTION("Extraction budget too large to count in bytes") {
        auto opts = parse({"-c", config.string(), "-w", work, "--max-unzip-mb", "17592186044416"});

        REQUIRE(!opts);
        REQUIRE_THAT(opts.error(), ContainsSubstring("must be at most 17592186044415"));
    }

    SECTION("Non-numeric id") {
        auto opts = parse({"-c", config.string(), "-w", work, "-i", "abc"});

        REQUIRE(!opts);
    }
}
