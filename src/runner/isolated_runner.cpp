#include "runner/isolated_runner.hpp"

#include "runner/resource_limits.hpp"
#include "runner/result_channel.hpp"
#include "subprocess/exit_status.hpp"

#include <suitegrader/api/suite.hpp>
#include <suitegrader/api/suite_config.hpp>
#include <suitegrader/api/suite_result.hpp>
#include <suitegrader/common/linux.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace suitegrader {

namespace {

/// Descriptor the result pipe is moved to in the child
constexpr int RESULT_FD = 3;

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

SuiteFailure make_failure(SuiteFailureKind kind, const SuiteConfig& config, std::string message) {
    return SuiteFailure{.kind = kind,
                        .max_score = config.max_score,
                        .message = std::move(message),
                        .exit_code = std::nullopt,
                        .signal = std::nullopt};
}

void close_or_log(int fd) {
    if (auto res = linux::close(fd); !res) {
        LOG_WARN("Failed to close fd {}: {}", fd, res.error().message());
    }
}

/// Read whatever is available without blocking. Returns false once the write end is closed.
bool drain_available(int fd, std::string& out) {
    while (true) {
        auto revents = linux::poll(fd, POLLIN, 0);

        if (!revents || (*revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            return revents.has_value();
        }

        auto chunk = linux::read(fd, READ_CHUNK_SIZE);

        if (!chunk || chunk->empty()) {
            return false;
        }

        out += *chunk;
    }
}

} // namespace

RunOutcome IsolatedRunner::run(const SuiteFactory& factory, const std::filesystem::path& work_path, int submission_id,
                               const SuiteConfig& config) const {
    std::error_code err;
    const auto abs_work_path = std::filesystem::absolute(work_path, err);

    if (err) {
        return make_failure(SuiteFailureKind::LaunchFailed, config,
                            fmt::format("Suite '{}' could not be started: bad work path '{}': {}", config.name,
                                        work_path.string(), err.message()));
    }

    auto pipe = linux::pipe2(O_CLOEXEC);

    if (!pipe) {
        return make_failure(SuiteFailureKind::LaunchFailed, config,
                            fmt::format("Suite '{}' could not be started: pipe failed: {}", config.name,
                                        pipe.error().message()));
    }

    // Anything still buffered would otherwise be written twice
    std::fflush(nullptr);
    logger_->flush();

    auto fork_res = linux::fork();

    if (!fork_res) {
        close_or_log(pipe->read_fd);
        close_or_log(pipe->write_fd);
        return make_failure(SuiteFailureKind::LaunchFailed, config,
                            fmt::format("Suite '{}' could not be started: fork failed: {}", config.name,
                                        fork_res.error().message()));
    }

    // Child process
    if (fork_res->which == linux::Fork::Child) {
        run_child(factory, abs_work_path, submission_id, config, pipe->write_fd);
    }

    // Parent process
    const pid_t pid = fork_res->pid;
    close_or_log(pipe->write_fd);

    // Also done by the child; whichever runs first wins, so the group exists before we might kill it
    if (auto res = linux::setpgid(pid, pid); !res) {
        LOGGER_DEBUG(logger_, "setpgid from parent failed ({}); child already did it", res.error().message());
    }

    LOGGER_DEBUG(logger_, "Suite '{}' running as pid {} with limits {}", config.name, pid,
                 ResourceLimits::from_config(config).to_string());

    auto outcome = supervise(pid, pipe->read_fd, config);

    close_or_log(pipe->read_fd);

    return outcome;
}

void IsolatedRunner::run_child(const SuiteFactory& factory, const std::filesystem::path& work_path, int submission_id,
                               const SuiteConfig& config, int result_fd) const {
    // Where setup failures are reported; follows the pipe once it moves
    int report_fd = result_fd;

    auto fail_setup = [&](int exit_code, const std::string& reason) {
        LOGGER_ERROR(logger_, "Suite '{}': {}", config.name, reason);
        if (auto res = linux::write(report_fd, result_channel::encode_setup_error(reason)); !res) {
            LOGGER_ERROR(logger_, "Suite '{}': could not report the setup failure: {}", config.name,
                         res.error().message());
        }
        logger_->flush();
        _exit(exit_code);
    };

    if (auto res = linux::setpgid(0, 0); !res) {
        fail_setup(EXIT_SETUP_FAILED, fmt::format("setpgid failed: {}", res.error().message()));
    }

    auto devnull = linux::open("/dev/null", O_RDONLY);
    if (!devnull || !linux::dup2(*devnull, STDIN_FILENO)) {
        fail_setup(EXIT_SETUP_FAILED, "could not redirect stdin");
    }

    if (result_fd != RESULT_FD) {
        if (!linux::dup2(result_fd, RESULT_FD)) {
            fail_setup(EXIT_SETUP_FAILED, "could not move the result pipe");
        }
        report_fd = RESULT_FD;
    }

    // Everything but stdio and the result pipe
    if (auto res = linux::close_range(RESULT_FD + 1); !res) {
        fail_setup(EXIT_SETUP_FAILED, fmt::format("could not close inherited descriptors: {}", res.error().message()));
    }

    // Programs the suite executes must not hold the pipe open
    if (auto res = linux::fcntl(RESULT_FD, F_SETFD, FD_CLOEXEC); !res) {
        fail_setup(EXIT_SETUP_FAILED, fmt::format("could not mark the result pipe close-on-exec: {}",
                                                  res.error().message()));
    }

    if (auto res = ResourceLimits::from_config(config).apply(); !res) {
        fail_setup(EXIT_LIMITS_FAILED, res.error());
    }

    if (auto res = linux::chdir(work_path.string()); !res) {
        fail_setup(EXIT_SETUP_FAILED, fmt::format("cannot enter work directory '{}': {}", work_path.string(),
                                                  res.error().message()));
    }

    SuiteResult result;

    try {
        auto suite = factory(work_path, submission_id, config, logger_->clone(config.name));
        result = suite->run();
    } catch (const std::exception& ex) {
        result = SuiteResult{};
        result.fail(fmt::format("Suite raised an exception: {}", ex.what()));
    } catch (...) {
        result = SuiteResult{};
        result.fail("Suite raised an exception of unknown type");
    }

    result.max_score = config.max_score;

    std::cout.flush();
    std::fflush(nullptr);

    if (auto res = linux::write(RESULT_FD, result_channel::encode(result)); !res) {
        _exit(EXIT_RESULT_WRITE_FAILED);
    }

    spdlog::default_logger()->flush();
    _exit(0);
}

RunOutcome IsolatedRunner::supervise(pid_t pid, int result_fd, const SuiteConfig& config) const {
    using std::chrono::steady_clock;

    const auto timeout = std::chrono::seconds{config.timeout_sec};
    const auto deadline = steady_clock::now() + timeout;

    std::string data;
    bool pipe_open = true;

    while (true) {
        if (pipe_open) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now());
            auto wait_ms = std::clamp(remaining, std::chrono::milliseconds{0}, poll_period_);

            auto revents = linux::poll(result_fd, POLLIN, gsl::narrow_cast<int>(wait_ms.count()));

            if (!revents) {
                pipe_open = false;
            } else if ((*revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                auto chunk = linux::read(result_fd, READ_CHUNK_SIZE);

                if (!chunk || chunk->empty()) {
                    pipe_open = false;
                } else {
                    data += *chunk;
                }
            }
        } else {
            std::this_thread::sleep_for(poll_period_);
        }

        auto status = ExitStatus::try_peek(pid);

        if (!status) {
            LOGGER_ERROR(logger_, "Lost track of suite '{}' (pid {}): {}", config.name, pid, status.error());
            kill_group(pid);
            return make_failure(SuiteFailureKind::AbnormalTermination, config,
                                fmt::format("Suite '{}' could not be monitored", config.name));
        }

        if (status->has_value()) {
            if (pipe_open) {
                drain_available(result_fd, data);
            }

            // Anything the suite left running in its group goes too. The child is not reaped
            // yet, so the group id cannot belong to anyone else.
            kill_group(pid);

            if (auto reaped = ExitStatus::wait(pid); !reaped) {
                LOGGER_ERROR(logger_, "Failed to reap suite '{}' (pid {}): {}", config.name, pid, reaped.error());
            }

            return classify_exit(**status, data, config);
        }

        if (steady_clock::now() >= deadline) {
            LOGGER_WARN(logger_, "Suite '{}' timed out after {} seconds; killing process group {}", config.name,
                        config.timeout_sec, pid);

            kill_group(pid);

            if (auto reaped = ExitStatus::wait(pid); !reaped) {
                LOGGER_ERROR(logger_, "Failed to reap suite '{}' (pid {}): {}", config.name, pid, reaped.error());
            }

            return make_failure(SuiteFailureKind::TimedOut, config,
                                fmt::format("Suite '{}' timed out after {} seconds", config.name, config.timeout_sec));
        }
    }
}

RunOutcome IsolatedRunner::classify_exit(const ExitStatus& status, std::string_view data,
                                         const SuiteConfig& config) const {
    LOGGER_DEBUG(logger_, "Suite '{}' {} ({} result bytes)", config.name, status, data.size());

    if (status.exit_code == 0) {
        return finalize_result(data, config);
    }

    // The reserved exit codes alone are ambiguous; a suite may exit with them too
    const auto setup_error = result_channel::decode(data).setup_error;

    std::string message;

    if (setup_error && status.exit_code == EXIT_LIMITS_FAILED) {
        message = fmt::format("Suite '{}' could not apply its resource limits: {}", config.name, *setup_error);
    } else if (setup_error) {
        message = fmt::format("Suite '{}' could not set up its process: {}", config.name, *setup_error);
    } else if (status.exit_code) {
        message = fmt::format("Suite '{}' exited with code {}", config.name, *status.exit_code);
    } else if (status.signal && *status.signal == SIGXCPU) {
        message = fmt::format("Suite '{}' exceeded its CPU time limit of {} seconds", config.name, config.timeout_sec);
    } else {
        message = fmt::format("Suite '{}' {}", config.name, status);
    }

    auto failure = make_failure(SuiteFailureKind::AbnormalTermination, config, std::move(message));
    failure.exit_code = status.exit_code;
    failure.signal = status.signal;

    return failure;
}

void IsolatedRunner::kill_group(pid_t pgid) const {
    if (auto res = linux::kill(-pgid, SIGKILL); !res && res.error() != std::errc::no_such_process) {
        LOGGER_WARN(logger_, "Failed to kill process group {}: {}", pgid, res.error().message());
    }
}

SuiteResult IsolatedRunner::finalize_result(std::string_view data, const SuiteConfig& config) {
    const auto decoded = result_channel::decode(data);

    SuiteResult result;
    result.max_score = config.max_score;
    result.feedback_messages = decoded.feedback_messages;

    if (!decoded.success) {
        result.fail(data.empty() ? fmt::format("Suite '{}' produced no result", config.name)
                                 : fmt::format("Suite '{}' produced a malformed result", config.name));
        return result;
    }

    if (!*decoded.success) {
        result.fail(decoded.error.value_or(""));
        if (result.error->empty()) {
            result.error = "No error message provided";
        }
        return result;
    }

    double score = decoded.score.value_or(0.0);
    if (!std::isfinite(score)) {
        score = 0.0;
    }

    result.success = true;
    result.score = std::clamp(score, 0.0, config.max_score);

    return result;
}

} // namespace suitegrader
