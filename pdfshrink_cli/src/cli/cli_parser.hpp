#ifndef PDFSHRINK_CLI_PARSER_HPP
#define PDFSHRINK_CLI_PARSER_HPP

#include <filesystem>
#include <string>
#include "../../../libpdfshrink/include/compression_request.hpp"

// forward declaration
namespace CLI { class App; }

inline constexpr const char* PDFSHRINK_VERSION = "1.0.0";

struct Settings {
    std::string input;
    std::string output;
    std::string level = "3";
    bool verbose = false;
    bool quiet = false;

    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path report_path;
    std::string engine = "gs";

    /// @return The values the Option Resolver validates.
    [[nodiscard]] pdfshrink::RawOptions raw_options() const {
        return {input, output, level, verbose};
    }
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 *
 * Only syntax is checked here; path and level validation belong to
 * pdfshrink::resolve_request() so they report the proper error kind.
 *
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //PDFSHRINK_CLI_PARSER_HPP
