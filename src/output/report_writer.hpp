#pragma once

#include "output/sink.hpp"

#include <suitegrader/common/expected.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace suitegrader {

/// Persists a rendered report, one newline-terminated line per entry.
///
/// If the primary path cannot be written the fallback is tried. The path that was
/// actually written is returned; if both fail the error names both reasons.
class ReportWriter
{
public:
    ReportWriter(std::filesystem::path primary, std::optional<std::filesystem::path> fallback, int submission_id)
        : primary_{std::move(primary)}
        , fallback_{fallback ? std::move(*fallback) : default_fallback(submission_id)} {}

    Expected<std::filesystem::path, std::string> write(const std::vector<std::string>& lines) const;

    /// ``<temp dir>/suitegrader-report-<id>.txt``
    static std::filesystem::path default_fallback(int submission_id);

    /// Writes ``lines`` to any sink, newline-terminated
    static void write_lines(Sink& sink, const std::vector<std::string>& lines);

    const std::filesystem::path& get_primary() const { return primary_; }

    const std::filesystem::path& get_fallback() const { return fallback_; }

private:
    static Expected<void, std::string> write_to(const std::filesystem::path& path,
                                                const std::vector<std::string>& lines);

    std::filesystem::path primary_;
    std::filesystem::path fallback_;
};

} // namespace suitegrader
