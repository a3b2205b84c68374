#include "catch2_custom.hpp"

#include "builtin/command_suite.hpp"
#include "temp_dir.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/api/suite_result.hpp>
#include <suitegrader/logging.hpp>

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

using suitegrader::CommandSuite;
using suitegrader::SuiteConfig;
using suitegrader::SuiteResult;

namespace {

SuiteResult run_command_suite(const std::filesystem::path& work_dir, std::string_view params_yaml,
                              double max_score = 10) {
    SuiteConfig config;
    config.name = "command";
    config.implementation_class = "CommandSuite";
    config.max_score = max_score;
    config.timeout_sec = 5;
    config.params = YAML::Load(std::string{params_yaml});

    CommandSuite suite{work_dir, 1, config, spdlog::default_logger()};

    return suite.run();
}

} // namespace

TEST_CASE("Matching output and exit code earn full marks") {
    TempDir tmp;

    auto result = run_command_suite(tmp.path(), R"(
command: echo
args: [hello, world]
expected_stdout: "hello world"
)");

    REQUIRE(result.success);
    REQUIRE(result.score == 10);
    REQUIRE(result.feedback_messages == std::vector<std::string>{"'echo' passed"});
}

TEST_CASE("The command runs in the work directory") {
    TempDir tmp;
    tmp.write_file("answer.txt", "42\n");

    auto result = run_command_suite(tmp.path(), R"(
command: cat
args: [answer.txt]
expected_stdout: "42"
)");

    REQUIRE(result.success);
    REQUIRE(result.score == 10);
}

TEST_CASE("Mismatches score zero but still complete") {
    TempDir tmp;

    SECTION("Wrong output") {
        auto result = run_command_suite(tmp.path(), R"(
command: echo
args: [goodbye]
expected_stdout: hello
)");

        REQUIRE(result.success);
        REQUIRE(result.score == 0);
        REQUIRE(result.feedback_messages.size() == 1);
        REQUIRE_THAT(result.feedback_messages.at(0),
                     Catch::Matchers::ContainsSubstring("did not match") &&
                         Catch::Matchers::ContainsSubstring("goodbye"));
    }

    SECTION("Wrong exit code") {
        auto result = run_command_suite(tmp.path(), R"(
command: sh
args: [-c, "exit 4"]
expected_exit_code: 2
)");

        REQUIRE(result.success);
        REQUIRE(result.score == 0);
        REQUIRE(result.feedback_messages == std::vector<std::string>{"'sh' exited with code 4, expected 2"});
    }

    SECTION("Expected non-zero exit code") {
        auto result = run_command_suite(tmp.path(), R"(
command: sh
args: [-c, "exit 4"]
expected_exit_code: 4
)");

        REQUIRE(result.score == 10);
    }
}

TEST_CASE("A command outliving its own timeout is stopped before the suite's") {
    using namespace std::chrono_literals;
    TempDir tmp;

    const auto start = std::chrono::steady_clock::now();
    auto result = run_command_suite(tmp.path(), R"(
command: sleep
args: ["10"]
command_timeout_sec: 0.3
)");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.success);
    REQUIRE(result.score == 0);
    REQUIRE(result.feedback_messages.size() == 1);
    REQUIRE_THAT(result.feedback_messages.at(0),
                 Catch::Matchers::StartsWith("'sleep' did not finish within 0.3 seconds"));
    REQUIRE(elapsed < 3s);
}

TEST_CASE("Commands that cannot run fail the suite") {
    TempDir tmp;

    SECTION("Missing command parameter") {
        auto result = run_command_suite(tmp.path(), "args: [x]\n");

        REQUIRE(!result.success);
        REQUIRE(result.error == "Missing required parameter 'command'");
    }

    SECTION("Command timeout not below the suite timeout") {
        auto result = run_command_suite(tmp.path(), "command: 'true'\ncommand_timeout_sec: 5\n");

        REQUIRE(!result.success);
        REQUIRE_THAT(*result.error,
                     Catch::Matchers::StartsWith("Parameter 'command_timeout_sec' must be greater than 0 and less "
                                                 "than timeout_sec (5)"));
    }

    SECTION("Unknown executable") {
        auto result = run_command_suite(tmp.path(), "command: suitegrader-no-such-program\n");

        REQUIRE(!result.success);
        REQUIRE(result.error == "Command 'suitegrader-no-such-program' was not found or is not executable");
    }
}

TEST_CASE("Trailing whitespace is ignored when comparing output") {
    REQUIRE(CommandSuite::trim_trailing_whitespace("abc \n\t\r\n") == "abc");
    REQUIRE(CommandSuite::trim_trailing_whitespace("  leading kept") == "  leading kept");
    REQUIRE(CommandSuite::trim_trailing_whitespace(" \n ").empty());
    REQUIRE(CommandSuite::trim_trailing_whitespace("").empty());
}
