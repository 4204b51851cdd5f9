#ifndef PDFSHRINK_REPORT_GENERATOR_HPP
#define PDFSHRINK_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include "../../../libpdfshrink/include/events.hpp"

// one line of the CSV report
struct Result {
    std::filesystem::path path;  // input file
    std::string mime;            // detected mime of the input
    int level{};                 // compression level, 0 if never resolved
    uintmax_t size_before{};     // input size in bytes
    uintmax_t size_after{};      // output size in bytes
    double ratio{};              // size_before / size_after
    double percent_saved{};      // (1 - after / before) * 100
    double seconds{};            // engine run time
    bool success{};              // verified output produced
    std::string error_msg;       // if !success, reason of failure
};

// status lines printed before the engine starts
void print_start_summary(const pdfshrink::CompressionStartEvent& e);

// output size and ratio printed after a verified success
void print_completion_summary(const pdfshrink::CompressionCompleteEvent& e);

// redraws the progress line on stderr; ends the line when finished
void print_progress_bar(unsigned percent, bool finished);

// writes a single-row CSV report; returns false if the file cannot be written
bool export_csv_report(const Result& result, const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif //PDFSHRINK_REPORT_GENERATOR_HPP
