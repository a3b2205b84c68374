#include "common/terminal_checks.hpp"

#include <suitegrader/common/expected.hpp>
#include <suitegrader/common/linux.hpp>

#include <cstdio>

#include <sys/ioctl.h>
#include <unistd.h>

namespace suitegrader {

// Determine if the terminal attached
// Based on: https://github.com/gabime/spdlog
// Which is subsequently based on: https://github.com/agauniyal/rang/
bool in_terminal(FILE* file) noexcept {
    return ::isatty(fileno(file)) != 0;
}

Expected<winsize> terminal_size(FILE* file) noexcept {
    winsize size{};

    if (auto res = linux::ioctl(fileno(file), TIOCGWINSZ, &size); !res) {
        return res.error();
    }

    return size;
}

} // namespace suitegrader
