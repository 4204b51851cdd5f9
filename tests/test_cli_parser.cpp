/**
 * @file test_cli_parser.cpp
 * @brief Tests for the CLI11 option wiring.
 */

#include <catch2/catch_test_macros.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <string>
#include "../pdfshrink_cli/src/cli/cli_parser.hpp"

namespace {

Settings parse(const std::string& command_line) {
    CLI::App app;
    Settings settings;
    setup_cli_parser(app, settings);
    app.parse(command_line, false);
    return settings;
}

} // namespace

TEST_CASE("Defaults", "[cli]") {
    unsetenv("PDFSHRINK_ENGINE");
    const auto s = parse("-i doc.pdf");
    REQUIRE(s.input == "doc.pdf");
    REQUIRE(s.output.empty());
    REQUIRE(s.level == "3");
    REQUIRE_FALSE(s.verbose);
    REQUIRE_FALSE(s.quiet);
    REQUIRE(s.log_level == "ERROR");
    REQUIRE(s.engine == "gs");
    REQUIRE(s.report_path.empty());
}

TEST_CASE("Short and long options", "[cli]") {
    SECTION("short") {
        const auto s = parse("-i in.pdf -o out.pdf -l 5 -v");
        REQUIRE(s.input == "in.pdf");
        REQUIRE(s.output == "out.pdf");
        REQUIRE(s.level == "5");
        REQUIRE(s.verbose);
    }

    SECTION("long") {
        const auto s = parse("--input in.pdf --output out.pdf --level 1 --verbose --quiet");
        REQUIRE(s.output == "out.pdf");
        REQUIRE(s.level == "1");
        REQUIRE(s.quiet);
    }

    SECTION("ambient options") {
        const auto s = parse("-i in.pdf --log-level debug --log-file run.log --report out.csv --engine gswin64c");
        REQUIRE(s.log_level == "DEBUG");
        REQUIRE(s.log_file == "run.log");
        REQUIRE(s.report_path == "out.csv");
        REQUIRE(s.engine == "gswin64c");
    }
}

TEST_CASE("Level text is left to the resolver", "[cli]") {
    const auto s = parse("-i in.pdf -l abc");
    REQUIRE(s.level == "abc");
    REQUIRE(s.raw_options().level == "abc");
}

TEST_CASE("Raw options mirror the settings", "[cli]") {
    const auto raw = parse("-i a.pdf -o b.pdf -l 2 -v").raw_options();
    REQUIRE(raw.input == "a.pdf");
    REQUIRE(raw.output == "b.pdf");
    REQUIRE(raw.level == "2");
    REQUIRE(raw.verbose);
}

TEST_CASE("Parse errors", "[cli]") {
    REQUIRE_THROWS_AS(parse(""), CLI::RequiredError);
    REQUIRE_THROWS_AS(parse("-i a.pdf --log-level LOUD"), CLI::ValidationError);
    REQUIRE_THROWS_AS(parse("-i a.pdf --bogus"), CLI::ExtrasError);
    REQUIRE_THROWS_AS(parse("-h"), CLI::CallForHelp);
    REQUIRE_THROWS_AS(parse("--version"), CLI::CallForVersion);
}

TEST_CASE("Engine from the environment", "[cli]") {
    setenv("PDFSHRINK_ENGINE", "/opt/gs/bin/gs", 1);
    const auto s = parse("-i a.pdf");
    unsetenv("PDFSHRINK_ENGINE");
    REQUIRE(s.engine == "/opt/gs/bin/gs");
}

TEST_CASE("Level help lists every profile", "[cli]") {
    CLI::App app;
    Settings settings;
    setup_cli_parser(app, settings);
    const std::string help = app.help();

    REQUIRE(help.find("whole number from 1") != std::string::npos);
    REQUIRE(help.find("1: prepress, 300 dpi, JPEG quality 95") != std::string::npos);
    REQUIRE(help.find("3: ebook, 110 dpi, JPEG quality 80") != std::string::npos);
    REQUIRE(help.find("5: screen, 72 dpi, JPEG quality 50") != std::string::npos);
}
