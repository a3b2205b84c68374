#pragma once

#include <fmt/format.h>

#include <chrono>
#include <string>

namespace suitegrader {

/// Formats a duration as ``H:MM:SS.ffffff``. Hours are not zero-padded and may exceed 24.
template <typename Rep, typename Period>
std::string format_elapsed(std::chrono::duration<Rep, Period> elapsed) {
    using namespace std::chrono;

    auto total_us = duration_cast<microseconds>(elapsed).count();
    if (total_us < 0) {
        total_us = 0;
    }

    constexpr long long US_PER_SEC = 1'000'000;

    const auto micros = total_us % US_PER_SEC;
    const auto total_secs = total_us / US_PER_SEC;

    return fmt::format("{}:{:02}:{:02}.{:06}", total_secs / 3600, (total_secs / 60) % 60, total_secs % 60, micros);
}

} // namespace suitegrader
