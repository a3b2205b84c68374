#include "catch2_custom.hpp"

#include "common/score_format.hpp"
#include "common/time.hpp"

#include <chrono>
#include <string>

using suitegrader::format_max_score;
using suitegrader::format_score;

TEST_CASE("Scores always show a fractional part") {
    REQUIRE(format_score(20) == "20.0");
    REQUIRE(format_score(0) == "0.0");
    REQUIRE(format_score(12.25) == "12.25");
    REQUIRE(format_score(0.1) == "0.1");
    REQUIRE(format_score(1e300) == "1e+300");
}

TEST_CASE("Whole maximum scores drop the fractional part") {
    REQUIRE(format_max_score(20) == "20");
    REQUIRE(format_max_score(0) == "0");
    REQUIRE(format_max_score(2.5) == "2.5");
}

TEST_CASE("Elapsed time formatting") {
    using namespace std::chrono_literals;

    REQUIRE(suitegrader::format_elapsed(0us) == "0:00:00.000000");
    REQUIRE(suitegrader::format_elapsed(1h + 2min + 3s + 45us) == "1:02:03.000045");
    REQUIRE(suitegrader::format_elapsed(59s + 999999us) == "0:00:59.999999");
}
