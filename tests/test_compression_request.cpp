/**
 * @file test_compression_request.cpp
 * @brief Unit tests for the Option Resolver.
 */

#include <catch2/catch_test_macros.hpp>
#include "../libpdfshrink/include/compression_request.hpp"
#include "../libpdfshrink/include/errors.hpp"
#include "test_support.hpp"

using namespace pdfshrink;
using test_support::TempDir;

namespace {

ErrorKind resolve_error(const RawOptions& raw) {
    try {
        (void)resolve_request(raw);
    } catch (const ShrinkError& e) {
        return e.kind();
    }
    FAIL("request was accepted");
    return ErrorKind::EngineFailure;
}

} // namespace

TEST_CASE("Derived output path", "[resolver]") {
    SECTION("with directory") {
        REQUIRE(derive_output_path("/data/docs/sample.pdf") == std::filesystem::path("/data/docs/sample-compressed.pdf"));
    }

    SECTION("bare file name") {
        REQUIRE(derive_output_path("sample.pdf") == std::filesystem::path("sample-compressed.pdf"));
    }

    SECTION("uppercase extension") {
        REQUIRE(derive_output_path("scans/Report.PDF") == std::filesystem::path("scans/Report-compressed.pdf"));
    }

    SECTION("dots in the stem") {
        REQUIRE(derive_output_path("v1.2.final.pdf") == std::filesystem::path("v1.2.final-compressed.pdf"));
    }
}

TEST_CASE("PDF suffix check", "[resolver]") {
    REQUIRE(has_pdf_extension("a.pdf"));
    REQUIRE(has_pdf_extension("dir/A.PDF"));
    REQUIRE(has_pdf_extension("mixed.PdF"));
    REQUIRE_FALSE(has_pdf_extension("a.pdf.txt"));
    REQUIRE_FALSE(has_pdf_extension("pdf"));
    REQUIRE_FALSE(has_pdf_extension("a.ps"));
}

TEST_CASE("Level parsing", "[resolver]") {
    SECTION("valid levels") {
        REQUIRE(parse_level("1") == 1);
        REQUIRE(parse_level("3") == 3);
        REQUIRE(parse_level("5") == 5);
        REQUIRE(parse_level("+4") == 4);
    }

    SECTION("rejected values") {
        for (const char* text : {"0", "6", "-1", "abc", "", "3abc", "2.5", " 3", "+"}) {
            try {
                (void)parse_level(text);
                FAIL("accepted '" << text << "'");
            } catch (const ShrinkError& e) {
                REQUIRE(e.kind() == ErrorKind::InvalidLevel);
            }
        }
    }
}

TEST_CASE("Resolve a valid request", "[resolver]") {
    TempDir dir;
    const auto input = test_support::write_file(dir / "sample.pdf", 128);

    SECTION("defaults") {
        RawOptions raw;
        raw.input = input.string();
        const auto request = resolve_request(raw);
        REQUIRE(request.input_path() == input);
        REQUIRE(request.output_path() == dir.path() / "sample-compressed.pdf");
        REQUIRE(request.output_derived());
        REQUIRE(request.level() == 3);
        REQUIRE_FALSE(request.verbose());
    }

    SECTION("explicit output, level and verbose") {
        RawOptions raw;
        raw.input = input.string();
        raw.output = (dir / "small.pdf").string();
        raw.level = "5";
        raw.verbose = true;
        const auto request = resolve_request(raw);
        REQUIRE(request.output_path() == dir.path() / "small.pdf");
        REQUIRE_FALSE(request.output_derived());
        REQUIRE(request.level() == 5);
        REQUIRE(request.verbose());
    }

    SECTION("uppercase extension accepted") {
        const auto upper = test_support::write_file(dir / "SCAN.PDF", 16);
        RawOptions raw;
        raw.input = upper.string();
        const auto request = resolve_request(raw);
        REQUIRE(request.output_path() == dir.path() / "SCAN-compressed.pdf");
    }
}

TEST_CASE("Resolver rejections", "[resolver]") {
    TempDir dir;

    SECTION("missing input") {
        RawOptions raw;
        raw.input = (dir / "absent.pdf").string();
        REQUIRE(resolve_error(raw) == ErrorKind::InputNotFound);
    }

    SECTION("empty input") {
        REQUIRE(resolve_error(RawOptions{}) == ErrorKind::InputNotFound);
    }

    SECTION("directory instead of file") {
        std::filesystem::create_directory(dir / "folder.pdf");
        RawOptions raw;
        raw.input = (dir / "folder.pdf").string();
        REQUIRE(resolve_error(raw) == ErrorKind::InputNotFound);
    }

    SECTION("missing input is reported before a bad level") {
        RawOptions raw;
        raw.input = (dir / "absent.pdf").string();
        raw.level = "9";
        REQUIRE(resolve_error(raw) == ErrorKind::InputNotFound);
    }

    SECTION("not a pdf") {
        const auto text = test_support::write_file(dir / "notes.txt", 10);
        RawOptions raw;
        raw.input = text.string();
        REQUIRE(resolve_error(raw) == ErrorKind::InvalidInputType);
    }

    SECTION("bad levels") {
        const auto input = test_support::write_file(dir / "ok.pdf", 10);
        for (const char* level : {"0", "6", "abc"}) {
            RawOptions raw;
            raw.input = input.string();
            raw.level = level;
            REQUIRE(resolve_error(raw) == ErrorKind::InvalidLevel);
        }
    }
}
