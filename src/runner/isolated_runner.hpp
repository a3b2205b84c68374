#pragma once

#include "subprocess/exit_status.hpp"

#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/api/suite_result.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/common/linux.hpp>
#include <suitegrader/logging.hpp>
#include <suitegrader/registrars/global_registrar.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <sys/types.h>

namespace suitegrader {

enum class SuiteFailureKind {
    TimedOut,            ///< Wall-clock timeout; the suite's process group was killed
    AbnormalTermination, ///< Non-zero exit status or killed by a signal
    LaunchFailed,        ///< The suite process could not be created
};

constexpr std::string_view to_string(SuiteFailureKind kind) {
    switch (kind) {
    case SuiteFailureKind::TimedOut:
        return "TimedOut";
    case SuiteFailureKind::AbnormalTermination:
        return "AbnormalTermination";
    case SuiteFailureKind::LaunchFailed:
        return "LaunchFailed";
    }
    return "<unknown>";
}

/// A suite run that did not produce a result
struct SuiteFailure
{
    SuiteFailureKind kind;
    double max_score;
    std::string message;

    std::optional<int> exit_code;
    std::optional<linux::Signal> signal;
};

/// Either a result or a failure, never both
using RunOutcome = Expected<SuiteResult, SuiteFailure>;

/// Runs one suite in a fresh, resource-limited, time-bounded child process.
///
/// The child moves into its own process group, closes every inherited descriptor except
/// stdio and the result pipe, applies the suite's resource limits, changes into the work
/// directory, and then constructs and runs the suite. The result travels back over a
/// pipe which the parent drains while waiting, so large results cannot deadlock.
class IsolatedRunner
{
public:
    /// Child exit statuses used by the runner itself. Setup and limit failures also send a
    /// setup error over the result pipe, which is what tells them apart from a suite's own exit.
    static constexpr int EXIT_SETUP_FAILED = 120;
    static constexpr int EXIT_LIMITS_FAILED = 121;
    static constexpr int EXIT_RESULT_WRITE_FAILED = 122;

    explicit IsolatedRunner(LoggerPtr logger, std::chrono::milliseconds poll_period = std::chrono::milliseconds{10})
        : logger_{std::move(logger)}
        , poll_period_{poll_period} {}

    RunOutcome run(const SuiteFactory& factory, const std::filesystem::path& work_path, int submission_id,
                   const SuiteConfig& config) const;

    /// Build the parent's view of a result from the raw bytes the child wrote.
    ///
    /// Missing fields default to a zero score and no feedback; a missing ``success`` flag
    /// (including an empty stream) is a failed run. The score is clamped into
    /// [0, max_score] and max_score always comes from ``config``.
    static SuiteResult finalize_result(std::string_view data, const SuiteConfig& config);

private:
    /// Never returns
    [[noreturn]] void run_child(const SuiteFactory& factory, const std::filesystem::path& work_path, int submission_id,
                                const SuiteConfig& config, int result_fd) const;

    RunOutcome supervise(pid_t pid, int result_fd, const SuiteConfig& config) const;

    RunOutcome classify_exit(const ExitStatus& status, std::string_view data, const SuiteConfig& config) const;

    void kill_group(pid_t pgid) const;

    LoggerPtr logger_;
    std::chrono::milliseconds poll_period_;
};

} // namespace suitegrader

template <>
struct fmt::formatter<::suitegrader::SuiteFailureKind> : fmt::formatter<std::string_view>
{
    auto format(::suitegrader::SuiteFailureKind from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(::suitegrader::to_string(from), ctx);
    }
};
