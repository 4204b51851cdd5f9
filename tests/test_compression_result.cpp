/**
 * @file test_compression_result.cpp
 * @brief Unit tests for size statistics and their formatting.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../libpdfshrink/include/compression_result.hpp"

using namespace pdfshrink;
using Catch::Matchers::WithinAbs;

TEST_CASE("Ratio and savings", "[result]") {
    SECTION("shrunk file") {
        const auto r = make_result(10'000, 4'000);
        REQUIRE(r.input_size_bytes == 10'000);
        REQUIRE(r.output_size_bytes == 4'000);
        REQUIRE_THAT(r.ratio, WithinAbs(2.5, 1e-9));
        REQUIRE_THAT(r.percent_saved, WithinAbs(60.0, 1e-9));
    }

    SECTION("grown file gives negative savings") {
        const auto r = make_result(1'000, 1'250);
        REQUIRE_THAT(r.ratio, WithinAbs(0.8, 1e-9));
        REQUIRE_THAT(r.percent_saved, WithinAbs(-25.0, 1e-9));
    }

    SECTION("empty input") {
        const auto r = make_result(0, 100);
        REQUIRE(r.ratio == 0.0);
        REQUIRE(r.percent_saved == 0.0);
    }

    SECTION("duration is carried") {
        const auto r = make_result(2, 1, std::chrono::milliseconds{1500});
        REQUIRE(r.duration.count() == 1500);
    }
}

TEST_CASE("Console formatting", "[result]") {
    SECTION("megabytes") {
        REQUIRE(format_megabytes(10 * 1024 * 1024) == "10.00");
        REQUIRE(format_megabytes(0) == "0.00");
        REQUIRE(format_megabytes(1536 * 1024) == "1.50");
    }

    SECTION("ratio two decimals") {
        REQUIRE(format_ratio(2.5) == "2.50");
        REQUIRE(format_ratio(10.0 / 3.0) == "3.33");
    }

    SECTION("percent one decimal") {
        REQUIRE(format_percent(60.0) == "60.0");
        REQUIRE(format_percent(66.666) == "66.7");
        REQUIRE(format_percent(-25.0) == "-25.0");
    }

    SECTION("formatted result of a 10 MB input") {
        const uintmax_t in = 10 * 1024 * 1024;
        const uintmax_t out = 4 * 1024 * 1024;
        const auto r = make_result(in, out);
        REQUIRE(format_megabytes(r.input_size_bytes) == "10.00");
        REQUIRE(format_megabytes(r.output_size_bytes) == "4.00");
        REQUIRE(format_ratio(r.ratio) == "2.50");
        REQUIRE(format_percent(r.percent_saved) == "60.0");
    }
}
