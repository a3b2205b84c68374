#pragma once

#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/ioctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace suitegrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// Retries on EINTR and on short writes until all of ``data`` is written.
/// returns success/failure; logs failure at debug level
inline Expected<std::size_t> write(int fd, std::string_view data) {
    std::size_t total = 0;

    while (total < data.size()) {
        ssize_t res = ::write(fd, data.data() + total, data.size() - total);

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }
            auto err = make_error_code(errno);

            LOG_DEBUG("write failed: '{}'", err.message());
            return err;
        }

        total += static_cast<std::size_t>(res);
    }

    return total;
}

/// reads up to ``count`` bytes from a file descriptor. See read(2)
/// An empty string signals end of file.
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, std::size_t count) {
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err.message());
        return err;
    }

    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close({}) failed: '{}'", fd, err.message());
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill({}, {}) failed: '{}'", pid, sig, err.message());
        return err;
    }

    return {};
}

/// args and envp do NOT need to have an extra NULL element; this is added for you.
/// ``args`` excludes argv[0], which is set to ``exec``.
/// see execve(2). Only returns on failure.
inline std::error_code execve(const std::string& exec, const std::vector<std::string>& args,
                              const std::vector<std::string>& envp) {
    // Reason: execve requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 2, nullptr);
    std::vector<char*> cstr_envp_list(envp.size() + 1, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    cstr_arg_list.front() = const_cast<char*>(exec.c_str());
    ranges::transform(args, cstr_arg_list.begin() + 1, to_cstr);
    ranges::transform(envp, cstr_envp_list.begin(), to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::execve(exec.c_str(), cstr_arg_list.data(), cstr_envp_list.data());

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns success/failure; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open('{}') failed: '{}'", pathname, err.message());
        return err;
    }

    return res;
}

/// see dup2(2)
/// returns success/failure; logs failure at debug level
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);

        LOG_DEBUG("dup2 failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// see ioctl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> ioctl(int fd, unsigned long request, void* argp) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::ioctl(fd, request, argp);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("ioctl failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see close_range(2)
/// Falls back to closing each descriptor up to the RLIMIT_NOFILE soft limit
/// when the kernel does not provide the syscall.
inline Expected<> close_range(unsigned int first, unsigned int last = ~0U) {
    if (::close_range(first, last, 0) == 0) {
        return {};
    }

    if (errno != ENOSYS) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close_range({}, {}) failed: '{}'", first, last, err.message());
        return err;
    }

    struct rlimit rlim{};
    if (::getrlimit(RLIMIT_NOFILE, &rlim) == -1) {
        return make_error_code(errno);
    }

    for (rlim_t fd = first; fd < rlim.rlim_cur && fd <= last; ++fd) {
        ::close(static_cast<int>(fd));
    }

    return {};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return res;
}

/// see waitid(2)
/// With WNOHANG, a returned ``si_pid`` of 0 means the child has not changed state yet.
/// returns success/failure; logs failure at debug level
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options = WEXITED) {
    siginfo_t info{};

    int res = 0;
    do {
        res = ::waitid(idtype, id, &info, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err.message());

        return err;
    }

    return info;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return pipe;
}

/// see poll(2) for a single descriptor
/// returns the ``revents`` of the descriptor, 0 on timeout
inline Expected<short> poll(int fd, short events, int timeout_ms) {
    struct pollfd poll_struct = {.fd = fd, .events = events, .revents = 0};

    int res = ::poll(&poll_struct, 1, timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return static_cast<short>(0);
        }
        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return poll_struct.revents;
}

/// see setrlimit(2). Sets both the soft and hard limit to ``limit``.
/// returns success/failure; logs failure at debug level
inline Expected<> setrlimit(int resource, rlim_t limit) {
    const struct rlimit rlim = {.rlim_cur = limit, .rlim_max = limit};

    int res = ::setrlimit(resource, &rlim);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setrlimit({}, {}) failed: '{}'", resource, limit, err.message());

        return err;
    }

    return {};
}

/// see getrlimit(2)
inline Expected<struct rlimit> getrlimit(int resource) {
    struct rlimit rlim{};

    if (::getrlimit(resource, &rlim) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("getrlimit({}) failed: '{}'", resource, err.message());

        return err;
    }

    return rlim;
}

/// see setpgid(2)
/// returns success/failure; logs failure at debug level
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    if (::setpgid(pid, pgid) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid({}, {}) failed: '{}'", pid, pgid, err.message());

        return err;
    }

    return {};
}

/// see chdir(2)
/// returns success/failure; logs failure at debug level
inline Expected<> chdir(const std::string& path) {
    if (::chdir(path.c_str()) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("chdir('{}') failed: '{}'", path, err.message());

        return err;
    }

    return {};
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    std::string to_string() const {
        const char* abbrev = sigabbrev_np(signal_num_);
        const char* descr = sigdescr_np(signal_num_);

        if (abbrev == nullptr || descr == nullptr) {
            return fmt::format("signal {}", signal_num_);
        }

        return fmt::format("SIG{} ({})", abbrev, descr);
    }

private:
    int signal_num_;
};

} // namespace suitegrader::linux

template <>
struct fmt::formatter<::suitegrader::linux::Signal> : fmt::formatter<std::string>
{
    auto format(const ::suitegrader::linux::Signal& from, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(from.to_string(), ctx);
    }
};
