#include "../../include/compression_request.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace fs = std::filesystem;

namespace pdfshrink {

bool has_pdf_extension(const fs::path& path) {
    std::string name = path.string();
    std::ranges::transform(name, name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name.ends_with(".pdf");
}

fs::path derive_output_path(const fs::path& input) {
    return input.parent_path() / (input.stem().string() + "-compressed.pdf");
}

int parse_level(const std::string_view text) {
    int level = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    if (first != last && *first == '+') {
        ++first;
    }
    const auto [ptr, ec] = std::from_chars(first, last, level);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw ShrinkError(ErrorKind::InvalidLevel,
                          "Compression level must be between 1 and 5 (got '" + std::string(text) + "')");
    }
    if (level < kMinLevel || level > kMaxLevel) {
        throw ShrinkError(ErrorKind::InvalidLevel,
                          "Compression level must be between 1 and 5 (got " + std::to_string(level) + ")");
    }
    return level;
}

CompressionRequest resolve_request(const RawOptions& raw) {
    const fs::path input(raw.input);

    std::error_code ec;
    if (raw.input.empty() || !fs::is_regular_file(input, ec)) {
        throw ShrinkError(ErrorKind::InputNotFound, "Input file not found: " + raw.input);
    }

    if (!has_pdf_extension(input)) {
        throw ShrinkError(ErrorKind::InvalidInputType, "Input file must be a PDF: " + raw.input);
    }

    fs::path output(raw.output);
    const bool derived = raw.output.empty();
    if (derived) {
        // the front end announces the derived path through output_derived()
        output = derive_output_path(input);
    }

    const int level = parse_level(raw.level);
    Logger::log(LogLevel::Debug, "Resolved request: " + input.string() + " -> " + output.string()
                + " (level " + std::to_string(level) + ")", "resolver");

    return {input, output, level, raw.verbose, derived};
}

} // namespace pdfshrink
