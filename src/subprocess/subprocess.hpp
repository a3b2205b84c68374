#pragma once

#include "subprocess/exit_status.hpp"

#include <suitegrader/common/class_traits.hpp>
#include <suitegrader/common/error_types.hpp>
#include <suitegrader/common/linux.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace suitegrader {

/// An external command with piped stdin and captured stdout.
///
/// stderr is inherited. The child gets the caller's environment.
class Subprocess : NonCopyable
{
public:
    /// ``exec`` is looked up in ``PATH`` unless it contains a '/'.
    /// An empty ``cwd`` keeps the caller's working directory.
    Subprocess(std::string exec, std::vector<std::string> args, std::filesystem::path cwd = {});

    /// Kills and reaps the child if it is still running
    ~Subprocess();

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    /// Fails with ``NotFound`` if the executable does not exist or cannot be executed
    Result<void> start();

    /// Block until the child exits, collecting its stdout meanwhile.
    ///
    /// Returns the exit code, or -1 if the child was killed by a signal.
    Result<int> wait_for_exit(std::chrono::microseconds timeout);

    /// Returns stdout produced since the previous call
    Result<std::string> read_stdout();

    const std::string& get_full_stdout();

    Result<void> send_stdin(std::string_view str);

    /// Closes stdin so the child sees EOF
    Result<void> close_stdin();

    Result<void> kill();

    bool is_alive() const;

    const std::optional<ExitStatus>& get_exit_status() const { return exit_status_; }

    pid_t get_pid() const { return child_pid_; }

    /// Resolve ``name`` the way execvp(3) would, without executing anything
    static std::optional<std::filesystem::path> find_executable(std::string_view name);

private:
    Result<void> create(const std::string& exec);
    [[noreturn]] void exec_child(const std::string& exec, int error_fd);
    Result<void> read_stdout_impl();
    Result<void> close_pipes();

    std::string exec_;
    std::vector<std::string> args_;
    std::filesystem::path cwd_;

    pid_t child_pid_{};
    std::optional<ExitStatus> exit_status_;

    linux::Pipe stdin_pipe_{};
    linux::Pipe stdout_pipe_{};

    std::string stdout_buffer_;
    std::size_t stdout_cursor_{};
};

} // namespace suitegrader
