/// \file
/// Machine-readable form of a grading report
#pragma once

#include <suitegrader/common/expected.hpp>
#include <suitegrader/grading_report.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>

namespace suitegrader {

/// ``{"name", "score", "max_score", "feedback": [...], "error"}``. ``error`` is null for a
/// completed suite.
void to_json(nlohmann::json& json, const SuiteSection& section);

/// Top level fields are read by the submission server:
///   score, max_score   run totals
///   feedback           report body, one line per entry joined with newlines
///   error              the fatal error line, empty if the run was not aborted
/// followed by submission_id, elapsed_seconds, stopped_early_after and suites.
void to_json(nlohmann::json& json, const GradingReport& report);

/// Write ``report`` as indented JSON to ``path``, replacing any existing file
Expected<void, std::string> write_json_report(const std::filesystem::path& path, const GradingReport& report);

} // namespace suitegrader
