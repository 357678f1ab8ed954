#include <catch2/catch.hpp>

#include "speechtext/timestamp.h"

using speechtext::format_timestamp;

TEST_CASE("format_timestamp produces zero-padded HH:MM:SS.mmm", "[timestamp]") {
    CHECK(format_timestamp(0) == "00:00:00.000");
    CHECK(format_timestamp(60) == "00:01:00.000");
    CHECK(format_timestamp(3600) == "01:00:00.000");
    CHECK(format_timestamp(3723.456) == "01:02:03.456");
}

TEST_CASE("format_timestamp does not wrap hours", "[timestamp]") {
    CHECK(format_timestamp(100 * 3600) == "100:00:00.000");
    CHECK(format_timestamp(25 * 3600 + 1.5) == "25:00:01.500");
}

TEST_CASE("format_timestamp truncates milliseconds", "[timestamp]") {
    CHECK(format_timestamp(1.9999) == "00:00:01.999");
    CHECK(format_timestamp(0.0005) == "00:00:00.000");
    CHECK(format_timestamp(1.23) == "00:00:01.230");
    CHECK(format_timestamp(2.34) == "00:00:02.340");
}

TEST_CASE("format_timestamp clamps negative input to zero", "[timestamp]") {
    CHECK(format_timestamp(-0.5) == "00:00:00.000");
    CHECK(format_timestamp(-3600) == "00:00:00.000");
}
