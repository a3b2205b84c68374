#include "catch2_custom.hpp"

#include "output/file_sink.hpp"
#include "output/report_writer.hpp"
#include "output/sink.hpp"
#include "temp_dir.hpp"

#include <suitegrader/grading_report.hpp>

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

using suitegrader::FileSink;
using suitegrader::GradingReport;
using suitegrader::ReportWriter;
using suitegrader::SuiteSection;

namespace {

/// Collects everything written to it
class StringSink : public suitegrader::Sink
{
public:
    void write(std::string_view str) override { contents += str; }

    void flush() override { ++flushes; }

    std::string contents;
    int flushes = 0;
};

const std::vector<std::string> LINES{"Submission ID: 3", "Total score: 1.0 / 2", "", "last"};

} // namespace

TEST_CASE("Lines are newline terminated") {
    StringSink sink;

    ReportWriter::write_lines(sink, LINES);

    REQUIRE(sink.contents == "Submission ID: 3\nTotal score: 1.0 / 2\n\nlast\n");
    REQUIRE(sink.flushes == 1);
}

TEST_CASE("Report goes to the primary path when possible") {
    TempDir tmp;
    const auto primary = tmp / "nested/dir/output.txt";

    ReportWriter writer{primary, tmp / "fallback.txt", 3};
    auto written = writer.write(LINES);

    REQUIRE(written.value() == primary);
    REQUIRE(TempDir::read_file(primary) == "Submission ID: 3\nTotal score: 1.0 / 2\n\nlast\n");
    REQUIRE(!std::filesystem::exists(tmp / "fallback.txt"));
}

TEST_CASE("Existing reports are replaced") {
    TempDir tmp;
    const auto primary = tmp.write_file("output.txt", "a much longer stale report that must not survive\n");

    ReportWriter writer{primary, std::nullopt, 3};
    REQUIRE(writer.write({"fresh"}));

    REQUIRE(TempDir::read_file(primary) == "fresh\n");
}

TEST_CASE("Fallback is used when the primary cannot be written") {
    TempDir tmp;
    const auto blocked = tmp.make_dir("output.txt");
    const auto fallback = tmp / "fallback.txt";

    ReportWriter writer{blocked, fallback, 3};
    auto written = writer.write(LINES);

    REQUIRE(written.value() == fallback);
    REQUIRE(TempDir::read_file(fallback) == "Submission ID: 3\nTotal score: 1.0 / 2\n\nlast\n");
}

TEST_CASE("Both paths failing names both") {
    TempDir tmp;
    const auto blocked = tmp.make_dir("output.txt");
    const auto also_blocked = tmp.make_dir("fallback.txt");

    ReportWriter writer{blocked, also_blocked, 3};
    auto written = writer.write(LINES);

    REQUIRE(!written);
    REQUIRE_THAT(written.error(), Catch::Matchers::ContainsSubstring("primary '" + blocked.string()) &&
                                      Catch::Matchers::ContainsSubstring("fallback '" + also_blocked.string()));
}

TEST_CASE("Default fallback lives in the temp directory") {
    ReportWriter writer{"output.txt", std::nullopt, 42};

    REQUIRE(writer.get_fallback().filename() == "suitegrader-report-42.txt");
    REQUIRE(writer.get_fallback() == ReportWriter::default_fallback(42));
}

TEST_CASE("File sinks report close errors") {
    TempDir tmp;

    auto sink = FileSink::open(tmp / "sink.txt");
    REQUIRE(sink);

    sink->write("abc");
    REQUIRE(sink->close());
    REQUIRE(TempDir::read_file(tmp / "sink.txt") == "abc");

    auto dir_sink = FileSink::open(tmp.path());
    REQUIRE(!dir_sink);
}

TEST_CASE("Report rendering") {
    GradingReport report;
    report.submission_id = 12;
    report.total_max_score = 7.5;
    report.elapsed_time = std::chrono::microseconds{1'500'000};

    report.add_section(SuiteSection{.name = "ok",
                                    .score = 2.5,
                                    .max_score = 2.5,
                                    .feedback_messages = {"fine", "really"},
                                    .failure_reason = std::nullopt});
    report.add_section(SuiteSection{.name = "broken",
                                    .score = 4,
                                    .max_score = 5,
                                    .feedback_messages = {"dropped"},
                                    .failure_reason = "it broke"});

    REQUIRE(report.total_score == 2.5);
    REQUIRE(report.sections.at(1).score == 0);
    REQUIRE(report.num_failed() == 1);

    REQUIRE(report.render() == std::vector<std::string>{
                                   "Submission ID: 12",
                                   "Total score: 2.5 / 7.5",
                                   "Elapsed time: 0:00:01.500000",
                                   "",
                                   "=== Suite: ok ===",
                                   "fine",
                                   "really",
                                   "Suite score: 2.5 / 2.5",
                                   "",
                                   "=== Suite: broken ===",
                                   "Suite failed: it broke",
                                   "Suite score: 0 / 5",
                               });
}
