#include "builtin/command_suite.hpp"

#include "subprocess/subprocess.hpp"

#include <suitegrader/api/suite_macros.hpp>
#include <suitegrader/api/suite_result.hpp>
#include <suitegrader/common/error_types.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace suitegrader {

SUITEGRADER_SUITE(CommandSuite);

std::string_view CommandSuite::trim_trailing_whitespace(std::string_view str) {
    auto end = str.find_last_not_of(" \t\r\n\f\v");

    if (end == std::string_view::npos) {
        return {};
    }

    return str.substr(0, end + 1);
}

SuiteResult CommandSuite::run() {
    const auto& config = get_config();
    auto result = make_result();

    if (!config.has_param("command")) {
        result.fail("Missing required parameter 'command'");
        return result;
    }

    // Conversion errors propagate as YAML exceptions and fail the run
    const auto command = config.param_or<std::string>("command", "");
    const auto args = config.param_or<std::vector<std::string>>("args", {});
    const auto expected_exit_code = config.param_or<int>("expected_exit_code", 0);

    const auto command_timeout_sec = config.param_or<double>(
        "command_timeout_sec", config.timeout_sec * DEFAULT_COMMAND_TIMEOUT_FRACTION);

    if (!(command_timeout_sec > 0) || command_timeout_sec >= config.timeout_sec) {
        result.fail(fmt::format("Parameter 'command_timeout_sec' must be greater than 0 and less than timeout_sec "
                                "({}), got {}",
                                config.timeout_sec, command_timeout_sec));
        return result;
    }

    std::optional<std::string> expected_stdout;
    if (config.has_param("expected_stdout")) {
        expected_stdout = config.param_or<std::string>("expected_stdout", "");
    }

    LOGGER_DEBUG(get_logger(), "Running '{}' {}", command, args);

    Subprocess proc{command, args, get_work_path()};

    if (auto res = proc.start(); !res) {
        if (res.error() == ErrorKind::NotFound) {
            result.fail(fmt::format("Command '{}' was not found or is not executable", command));
        } else {
            result.fail(fmt::format("Command '{}' could not be started ({})", command, res.error()));
        }
        return result;
    }

    std::ignore = proc.close_stdin();

    const auto command_timeout =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::duration<double>{command_timeout_sec});

    auto exit_code = proc.wait_for_exit(command_timeout);

    if (!exit_code) {
        if (auto res = proc.kill(); !res) {
            LOGGER_WARN(get_logger(), "Could not kill '{}': {}", command, res.error());
        }
        result.add_feedback(
            fmt::format("'{}' did not finish within {} seconds ({})", command, command_timeout_sec, exit_code.error()));
        return result;
    }

    bool passed = true;

    if (const auto& status = proc.get_exit_status(); status && !status->exited_normally()) {
        result.add_feedback(fmt::format("'{}' {}", command, *status));
        passed = false;
    } else if (*exit_code != expected_exit_code) {
        result.add_feedback(
            fmt::format("'{}' exited with code {}, expected {}", command, *exit_code, expected_exit_code));
        passed = false;
    }

    if (expected_stdout) {
        auto actual = trim_trailing_whitespace(proc.get_full_stdout());
        auto expected = trim_trailing_whitespace(*expected_stdout);

        if (actual != expected) {
            result.add_feedback(fmt::format("Output of '{}' did not match.\nExpected:\n{}\nActual:\n{}", command,
                                            expected, actual));
            passed = false;
        }
    }

    if (passed) {
        result.add_feedback(fmt::format("'{}' passed", command));
        result.set_score(config.max_score);
    }

    return result;
}

} // namespace suitegrader
