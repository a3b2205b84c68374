#pragma once

#include <suitegrader/api/suite.hpp>
#include <suitegrader/api/suite_result.hpp>

#include <string>
#include <string_view>

namespace suitegrader {

/// Runs an external command in the work directory and checks how it went.
///
/// Parameters:
///   command            (required) executable, looked up in PATH unless it has a '/'
///   args               list of arguments
///   expected_stdout    compared after trimming trailing whitespace from both sides
///   expected_exit_code default 0
///   command_timeout_sec  how long the command may run, default 80% of timeout_sec.
///                        Must stay below timeout_sec so the suite can still report.
///
/// Full marks when everything checked matches, otherwise zero. The result is only
/// unsuccessful if the parameters are invalid or the command could not be started.
class CommandSuite : public Suite
{
public:
    using Suite::Suite;

    SuiteResult run() override;

    static constexpr double DEFAULT_COMMAND_TIMEOUT_FRACTION = 0.8;

    static std::string_view trim_trailing_whitespace(std::string_view str);
};

} // namespace suitegrader
