#include "output/report_writer.hpp"

#include "output/file_sink.hpp"
#include "output/sink.hpp"

#include <suitegrader/common/error_types.hpp>
#include <suitegrader/common/expected.hpp>
#include <suitegrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace suitegrader {

std::filesystem::path ReportWriter::default_fallback(int submission_id) {
    std::error_code err;
    auto tmp = std::filesystem::temp_directory_path(err);

    if (err) {
        tmp = "/tmp";
    }

    return tmp / fmt::format("suitegrader-report-{}.txt", submission_id);
}

void ReportWriter::write_lines(Sink& sink, const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        sink.write(line);
        sink.write("\n");
    }

    sink.flush();
}

Expected<void, std::string> ReportWriter::write_to(const std::filesystem::path& path,
                                                   const std::vector<std::string>& lines) {
    auto sink = TRY(FileSink::open(path));

    write_lines(sink, lines);

    return sink.close();
}

Expected<std::filesystem::path, std::string> ReportWriter::write(const std::vector<std::string>& lines) const {
    auto primary_res = write_to(primary_, lines);

    if (primary_res) {
        return primary_;
    }

    LOG_WARN("Could not write report to '{}' ({}); trying '{}'", primary_.string(), primary_res.error(),
             fallback_.string());

    auto fallback_res = write_to(fallback_, lines);

    if (fallback_res) {
        return fallback_;
    }

    LOG_ERROR("Could not write report to fallback '{}' either ({})", fallback_.string(), fallback_res.error());

    return {unexpected, fmt::format("primary '{}': {}; fallback '{}': {}", primary_.string(), primary_res.error(),
                                    fallback_.string(), fallback_res.error())};
}

} // namespace suitegrader
