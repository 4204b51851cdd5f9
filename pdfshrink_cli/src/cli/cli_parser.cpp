#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include "../../../libpdfshrink/include/level_profile.hpp"

static std::string level_description() {
    std::string text = "Compression level, a whole number from 1 (lowest compression) to 5 (highest):";
    for (const auto& profile : pdfshrink::all_profiles()) {
        text += "\n  " + std::to_string(profile.level) + ": " + std::string(profile.quality_preset)
              + ", " + std::to_string(profile.resolution.color) + " dpi, JPEG quality "
              + std::to_string(profile.jpeg_quality);
    }
    return text;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Display help information.");
    app.set_version_flag("--version", PDFSHRINK_VERSION);

    app.add_option("-i,--input", settings.input,
                   "Input PDF file path.")
                   ->required()
                   ->type_name("<file>");

    app.add_option("-o,--output", settings.output,
                   "Output PDF file path (defaults to <input>-compressed.pdf).")
                   ->type_name("<file>");

    app.add_option("-l,--level", settings.level, level_description())
                   ->type_name("<1-5>")
                   ->capture_default_str();

    app.add_flag("-v,--verbose", settings.verbose,
                 "Show detailed processing information.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (status lines, progress bar).");

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->capture_default_str()
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to a file (default: no file logging).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    app.add_option("--engine", settings.engine,
                   "Ghostscript executable name or path.")
                   ->envname("PDFSHRINK_ENGINE")
                   ->capture_default_str();
}
