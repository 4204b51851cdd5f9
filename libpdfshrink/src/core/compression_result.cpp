#include "../../include/compression_result.hpp"
#include <iomanip>
#include <sstream>

namespace pdfshrink {

namespace {

std::string fixed(const double value, const int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

} // namespace

CompressionResult make_result(const uintmax_t input_size,
                              const uintmax_t output_size,
                              const std::chrono::milliseconds duration) {
    CompressionResult r;
    r.input_size_bytes = input_size;
    r.output_size_bytes = output_size;
    r.duration = duration;
    if (input_size > 0 && output_size > 0) {
        const auto in = static_cast<double>(input_size);
        const auto out = static_cast<double>(output_size);
        r.ratio = in / out;
        r.percent_saved = (1.0 - out / in) * 100.0;
    }
    return r;
}

std::string format_megabytes(const uintmax_t bytes) {
    return fixed(static_cast<double>(bytes) / 1024.0 / 1024.0, 2);
}

std::string format_ratio(const double ratio) {
    return fixed(ratio, 2);
}

std::string format_percent(const double percent) {
    return fixed(percent, 1);
}

} // namespace pdfshrink
