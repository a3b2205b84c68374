#pragma once

#include <suitegrader/api/suite_result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace suitegrader {

/// Wire format carrying a ``SuiteResult`` from a suite process to the grader.
///
/// Little-endian. A 4 byte magic ``SGR1`` followed by tagged fields:
///   0x01 success   u8
///   0x02 score     f64
///   0x03 max_score f64
///   0x04 feedback  u32 length + bytes (repeated, in order)
///   0x05 error     u32 length + bytes
///   0x06 setup     u32 length + bytes; written instead of a result when the runner
///                  could not prepare the suite process
///   0xFF end
namespace result_channel {

inline constexpr std::string_view MAGIC = "SGR1";

enum class Tag : std::uint8_t {
    Success = 0x01,
    Score = 0x02,
    MaxScore = 0x03,
    Feedback = 0x04,
    Error = 0x05,
    SetupError = 0x06,
    End = 0xFF,
};

/// Fields as read off the wire; any of them may be missing
struct DecodedResult
{
    std::optional<bool> success;
    std::optional<double> score;
    std::optional<double> max_score;
    std::vector<std::string> feedback_messages;
    std::optional<std::string> error;

    /// Set only by the runner, never by a suite
    std::optional<std::string> setup_error;

    /// Whether the stream had a valid magic and ended with an end tag
    bool complete = false;
};

std::string encode(const SuiteResult& result);

std::string encode_setup_error(std::string_view reason);

/// Never fails. A truncated or malformed stream keeps the fields read before the damage,
/// with ``complete`` left false.
DecodedResult decode(std::string_view data);

} // namespace result_channel

} // namespace suitegrader
