#pragma once

#include <fmt/format.h>

#include <cmath>
#include <string>

namespace suitegrader {

/// Shortest round-trip form, always with a decimal point or exponent (``20.0``, ``12.25``)
inline std::string format_score(double score) {
    std::string str = fmt::format("{}", score);

    if (str.find_first_of(".eEn") == std::string::npos) {
        str += ".0";
    }

    return str;
}

/// Whole numbers without a fractional part (``20``), anything else as ``format_score``
inline std::string format_max_score(double max_score) {
    constexpr double MAX_EXACT_INTEGER = 9007199254740992.0; // 2^53

    if (std::isfinite(max_score) && std::trunc(max_score) == max_score && std::abs(max_score) < MAX_EXACT_INTEGER) {
        return fmt::format("{}", static_cast<long long>(max_score));
    }

    return format_score(max_score);
}

} // namespace suitegrader
