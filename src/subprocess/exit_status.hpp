#pragma once

#include <suitegrader/common/class_traits.hpp>
#include <suitegrader/common/error_types.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/common/linux.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <chrono>
#include <optional>
#include <string>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>

namespace suitegrader {

/// How a child process ended, as reported by waitid(2)
struct ExitStatus
{
    int type; // si_code; CLD_EXITED, CLD_KILLED or CLD_DUMPED

    std::optional<int> exit_code;
    std::optional<linux::Signal> signal;

    bool exited_normally() const { return exit_code.has_value(); }

    std::string to_string() const {
        if (exit_code) {
            return fmt::format("exited with code {}", *exit_code);
        }
        if (signal) {
            return fmt::format("was killed by signal {}", *signal);
        }
        return "ended for an unknown reason";
    }

    static ExitStatus parse(const siginfo_t& siginfo) {
        ExitStatus result{.type = siginfo.si_code, .exit_code = std::nullopt, .signal = std::nullopt};

        if (result.type == CLD_EXITED) {
            result.exit_code = gsl::narrow_cast<int>(siginfo.si_status);
        } else {
            result.signal = linux::Signal{siginfo.si_status};
        }

        return result;
    }

    /// Reap ``pid`` if it has exited, without blocking. ``std::nullopt`` if it is still running.
    static Result<std::optional<ExitStatus>> try_wait(pid_t pid) { return poll_exit(pid, WEXITED | WNOHANG); }

    /// Like ``try_wait``, but an exited ``pid`` is left a zombie. Its pid and process group id
    /// stay reserved until it is reaped with ``wait``.
    static Result<std::optional<ExitStatus>> try_peek(pid_t pid) {
        return poll_exit(pid, WEXITED | WNOHANG | WNOWAIT);
    }

    /// Block until ``pid`` exits
    static Result<ExitStatus> wait(pid_t pid) {
        auto waitid_res = TRYE(linux::waitid(P_PID, gsl::narrow_cast<id_t>(pid), WEXITED), SyscallFailure);

        return parse(waitid_res);
    }

    template <ChronoDuration Duration1, ChronoDuration Duration2 = std::chrono::milliseconds>
    static Result<ExitStatus> wait_with_timeout(pid_t pid, Duration1 timeout,
                                                Duration2 poll_period = std::chrono::milliseconds{1}) {
        using std::chrono::steady_clock;

        const auto start_time = steady_clock::now();

        // while elapsed time < timeout
        while (steady_clock::now() - start_time < timeout) {
            auto status = TRY(try_wait(pid));

            if (status) {
                return *status;
            }

            std::this_thread::sleep_for(poll_period);
        }

        LOG_DEBUG("waitid timed out after {}ms", std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
        return ErrorKind::TimedOut;
    }

private:
    static Result<std::optional<ExitStatus>> poll_exit(pid_t pid, int options) {
        auto waitid_res = TRYE(linux::waitid(P_PID, gsl::narrow_cast<id_t>(pid), options), SyscallFailure);

        // si_pid will only be 0 if waitid returned early from WNOHANG
        // see waitid(2)
        if (waitid_res.si_pid == 0) {
            return std::optional<ExitStatus>{};
        }

        return std::optional<ExitStatus>{parse(waitid_res)};
    }
};

} // namespace suitegrader

template <>
struct fmt::formatter<::suitegrader::ExitStatus> : fmt::formatter<std::string>
{
    auto format(const ::suitegrader::ExitStatus& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(from.to_string(), ctx);
    }
};
