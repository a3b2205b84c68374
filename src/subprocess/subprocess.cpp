#include "subprocess/subprocess.hpp"

#include "subprocess/exit_status.hpp"

#include <suitegrader/common/error_types.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/common/linux.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/ranges.h>
#include <gsl/util>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace suitegrader {

namespace {

constexpr linux::Pipe CLOSED_PIPE{.read_fd = -1, .write_fd = -1};

/// Exit status of a child that could not exec; the real reason travels over the error pipe
constexpr int EXIT_EXEC_FAILED = 127;

std::vector<std::string> current_environment() {
    std::vector<std::string> env;

    for (char** var = environ; var != nullptr && *var != nullptr; ++var) {
        env.emplace_back(*var);
    }

    return env;
}

void close_fd(int& fd) {
    if (fd == -1) {
        return;
    }

    if (auto res = linux::close(fd); !res) {
        LOG_WARN("Failed to close fd {}: {}", fd, res.error().message());
    }

    fd = -1;
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path cwd)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , cwd_{std::move(cwd)}
    , stdin_pipe_{CLOSED_PIPE}
    , stdout_pipe_{CLOSED_PIPE} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then initialization failed, or the object was moved from
    if (child_pid_ == 0) {
        return;
    }

    if (!exit_status_) {
        std::ignore = kill();
    }

    std::ignore = close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , cwd_{std::move(other.cwd_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , exit_status_{std::exchange(other.exit_status_, std::nullopt)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, CLOSED_PIPE)}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, CLOSED_PIPE)}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stdout_cursor_{std::exchange(other.stdout_cursor_, 0)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    cwd_ = std::move(rhs.cwd_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    exit_status_ = std::exchange(rhs.exit_status_, std::nullopt);
    stdin_pipe_ = std::exchange(rhs.stdin_pipe_, CLOSED_PIPE);
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, CLOSED_PIPE);
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stdout_cursor_ = std::exchange(rhs.stdout_cursor_, 0);

    return *this;
}

std::optional<std::filesystem::path> Subprocess::find_executable(std::string_view name) {
    auto is_executable = [](const std::filesystem::path& candidate) {
        std::error_code err;
        return std::filesystem::is_regular_file(candidate, err) && ::access(candidate.c_str(), X_OK) == 0;
    };

    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path path{name};
        if (!is_executable(path)) {
            return std::nullopt;
        }
        return path;
    }

    const char* path_env = std::getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
    std::string_view search_path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";

    while (true) {
        auto sep = search_path.find(':');
        auto dir = search_path.substr(0, sep);

        // An empty entry means the current directory
        auto candidate = (dir.empty() ? std::filesystem::path{"."} : std::filesystem::path{dir}) / name;

        if (is_executable(candidate)) {
            return candidate;
        }

        if (sep == std::string_view::npos) {
            break;
        }

        search_path.remove_prefix(sep + 1);
    }

    return std::nullopt;
}

Result<void> Subprocess::start() {
    auto resolved = find_executable(exec_);

    if (!resolved) {
        LOG_DEBUG("Executable '{}' not found", exec_);
        return ErrorKind::NotFound;
    }

    return create(resolved->string());
}

Result<int> Subprocess::wait_for_exit(std::chrono::microseconds timeout) {
    using std::chrono::steady_clock;
    using namespace std::chrono_literals;

    if (exit_status_) {
        return exit_status_->exit_code.value_or(-1);
    }

    if (child_pid_ == 0) {
        return ErrorKind::BadArgument;
    }

    const auto deadline = steady_clock::now() + timeout;

    while (true) {
        if (stdout_pipe_.read_fd != -1) {
            // Wakes up early when output arrives; the result only tells us to read
            std::ignore = linux::poll(stdout_pipe_.read_fd, POLLIN, 1);
            TRY(read_stdout_impl());
        } else {
            std::this_thread::sleep_for(1ms);
        }

        auto status = TRY(ExitStatus::try_wait(child_pid_));

        if (status) {
            exit_status_ = *status;
            // Whatever was written right before exiting
            TRY(read_stdout_impl());

            LOG_DEBUG("'{}' (pid {}) {}", exec_, child_pid_, *exit_status_);

            return exit_status_->exit_code.value_or(-1);
        }

        if (steady_clock::now() >= deadline) {
            return ErrorKind::TimedOut;
        }
    }
}

Result<void> Subprocess::kill() {
    if (child_pid_ == 0 || exit_status_) {
        return {};
    }

    std::ignore = close_stdin();

    if (auto res = linux::kill(child_pid_, SIGKILL); !res && res.error() != std::errc::no_such_process) {
        return ErrorKind::SyscallFailure;
    }

    exit_status_ = TRY(ExitStatus::wait(child_pid_));

    return {};
}

bool Subprocess::is_alive() const {
    if (child_pid_ == 0 || exit_status_) {
        return false;
    }

    return linux::kill(child_pid_, 0) != std::make_error_code(std::errc::no_such_process);
}

Result<std::string> Subprocess::read_stdout() {
    TRY(read_stdout_impl());

    // Cursor is still at the end of the buffer -> no data was read
    if (stdout_cursor_ == stdout_buffer_.size()) {
        return "";
    }

    auto res = stdout_buffer_.substr(stdout_cursor_);
    stdout_cursor_ = stdout_buffer_.size();

    return res;
}

const std::string& Subprocess::get_full_stdout() {
    std::ignore = read_stdout_impl();

    return stdout_buffer_;
}

Result<void> Subprocess::read_stdout_impl() {
    if (stdout_pipe_.read_fd == -1) {
        return {};
    }

    int num_bytes_avail = 0;

    TRYE(linux::ioctl(stdout_pipe_.read_fd, FIONREAD, &num_bytes_avail), SyscallFailure);

    if (num_bytes_avail <= 0) {
        return {};
    }

    LOG_TRACE("{} bytes available from stdout pipe", num_bytes_avail);

    std::string res = TRYE(linux::read(stdout_pipe_.read_fd, gsl::narrow_cast<std::size_t>(num_bytes_avail)),
                           SyscallFailure);

    stdout_buffer_ += res;

    return {};
}

Result<void> Subprocess::send_stdin(std::string_view str) {
    if (stdin_pipe_.write_fd == -1) {
        return ErrorKind::BadArgument;
    }

    TRYE(linux::write(stdin_pipe_.write_fd, str), SyscallFailure);

    return {};
}

Result<void> Subprocess::close_stdin() {
    close_fd(stdin_pipe_.write_fd);

    return {};
}

Result<void> Subprocess::close_pipes() {
    // Make sure all available data is read before pipes are closed
    std::ignore = read_stdout_impl();

    close_fd(stdin_pipe_.write_fd);
    close_fd(stdout_pipe_.read_fd);

    return {};
}

Result<void> Subprocess::create(const std::string& exec) {
    // All CLOEXEC: dup2 clears the flag on the child's stdio copies, and nothing leaks into
    // unrelated children
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stdin_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    auto error_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    auto fork_res = linux::fork();

    if (!fork_res) {
        close_fd(error_pipe.read_fd);
        close_fd(error_pipe.write_fd);
        std::ignore = close_pipes();
        close_fd(stdin_pipe_.read_fd);
        close_fd(stdout_pipe_.write_fd);
        return ErrorKind::SyscallFailure;
    }

    // Child process
    if (fork_res->which == linux::Fork::Child) {
        exec_child(exec, error_pipe.write_fd);
    }

    // Parent process
    child_pid_ = fork_res->pid;

    // Close the pipe ends being used in the child proc
    //  - write end for stdout
    //  - read end for stdin
    close_fd(stdin_pipe_.read_fd);
    close_fd(stdout_pipe_.write_fd);
    close_fd(error_pipe.write_fd);

    // Blocks until exec succeeds (EOF) or the child reports why it failed
    auto report = linux::read(error_pipe.read_fd, sizeof(int));
    close_fd(error_pipe.read_fd);

    if (report && report->size() == sizeof(int)) {
        int child_errno = 0;
        std::memcpy(&child_errno, report->data(), sizeof(int));

        LOG_DEBUG("exec of '{}' failed in child: {}", exec, get_err_msg(child_errno));

        exit_status_ = TRY(ExitStatus::wait(child_pid_));
        std::ignore = close_pipes();

        return (child_errno == ENOENT || child_errno == EACCES) ? ErrorKind::NotFound : ErrorKind::SyscallFailure;
    }

    // Make reading from stdout non-blocking
    int pre_flags = TRYE(linux::fcntl(stdout_pipe_.read_fd, F_GETFL), SyscallFailure);

    TRYE(linux::fcntl(stdout_pipe_.read_fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
         SyscallFailure);

    LOG_DEBUG("Started '{}' {} as pid {}", exec, args_, child_pid_);

    return {};
}

void Subprocess::exec_child(const std::string& exec, int error_fd) {
    auto report_and_exit = [error_fd](int err) {
        std::ignore = linux::write(error_fd, std::string_view{reinterpret_cast<const char*>(&err), sizeof(err)});
        _exit(EXIT_EXEC_FAILED);
    };

    if (auto res = linux::dup2(stdin_pipe_.read_fd, STDIN_FILENO); !res) {
        report_and_exit(res.error().value());
    }

    if (auto res = linux::dup2(stdout_pipe_.write_fd, STDOUT_FILENO); !res) {
        report_and_exit(res.error().value());
    }

    if (!cwd_.empty()) {
        if (auto res = linux::chdir(cwd_.string()); !res) {
            report_and_exit(res.error().value());
        }
    }

    std::error_code err = linux::execve(exec, args_, current_environment());

    report_and_exit(err.value());
    _exit(EXIT_EXEC_FAILED);
}

} // namespace suitegrader
