#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libpdfshrink/include/compression_result.hpp"
#include "../../../libpdfshrink/include/logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace pdfshrink;

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

void print_start_summary(const CompressionStartEvent& e) {
    std::cout << BLUE << "Starting PDF compression..." << RESET << "\n"
              << GRAY << "Input: " << e.input.string() << "\n"
              << "Output: " << e.output.string() << "\n"
              << "Compression level: " << e.level << "\n"
              << "Input file size: " << format_megabytes(e.input_size) << " MB" << RESET
              << std::endl;
}

void print_completion_summary(const CompressionCompleteEvent& e) {
    const auto& r = e.result;
    std::cout << GREEN << "\nPDF compression completed successfully!" << RESET << "\n"
              << GRAY << "Output file size: " << format_megabytes(r.output_size_bytes) << " MB" << RESET << "\n"
              << BLUE << "Compression ratio: " << format_ratio(r.ratio) << "x ("
              << format_percent(r.percent_saved) << "% smaller)" << RESET
              << std::endl;
}

void print_progress_bar(const unsigned percent, const bool finished) {
    const unsigned term_width = get_terminal_width();
    // "Compressing |" + bar + "| 100% || 100/100"
    const unsigned bar_width = std::clamp(term_width > 40u ? term_width - 40u : 10u, 10u, 40u);
    const unsigned clamped = std::min(percent, 100u);
    const unsigned pos = bar_width * clamped / 100u;

    std::string bar;
    for (unsigned i = 0; i < bar_width; ++i) {
        bar += i < pos ? "█" : "░";
    }

    std::cerr << "\rCompressing |" << CYAN << bar << RESET << "| "
              << std::setw(3) << clamped << "% || " << clamped << "/100";
    if (finished) {
        std::cerr << "\n";
    }
    std::cerr << std::flush;
}

bool export_csv_report(const Result& r, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Cannot write report: " + output_path.string(), "report");
        return false;
    }

    out << "File,MIME,Level,Before(KB),After(KB),Ratio,Saved(%),Time(s),Result,Error\n";

    std::ostringstream ratio;
    std::ostringstream saved;
    std::ostringstream time;
    ratio << std::fixed << std::setprecision(2) << (r.success ? r.ratio : 0.0);
    saved << std::fixed << std::setprecision(1) << (r.success ? r.percent_saved : 0.0);
    time << std::fixed << std::setprecision(2) << r.seconds;

    out << csv_escape(r.path.filename().string()) << ","
        << csv_escape(r.mime) << ","
        << r.level << ","
        << (r.size_before / 1024) << ","
        << (r.size_after / 1024) << ","
        << ratio.str() << ","
        << saved.str() << ","
        << time.str() << ","
        << (r.success ? "OK" : "FAIL") << ","
        << csv_escape(r.error_msg) << "\n";

    return static_cast<bool>(out);
}
