#pragma once

#include <suitegrader/common/expected.hpp>

#include <cstdio>

#include <sys/ioctl.h>

namespace suitegrader {

bool in_terminal(FILE* file) noexcept;

Expected<winsize> terminal_size(FILE* file) noexcept;

} // namespace suitegrader
