/**
 * @file compression_result.hpp
 * @brief Size statistics of a successful compression and their formatting.
 */

#ifndef PDFSHRINK_COMPRESSION_RESULT_HPP
#define PDFSHRINK_COMPRESSION_RESULT_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace pdfshrink {

/**
 * @brief Outcome of a verified, successful run. Never partially filled.
 */
struct CompressionResult {
    uintmax_t input_size_bytes = 0;
    uintmax_t output_size_bytes = 0;
    double ratio = 0.0;          ///< input / output
    double percent_saved = 0.0;  ///< (1 - output / input) * 100, negative if the file grew
    std::chrono::milliseconds duration{0}; ///< Engine wall-clock time
};

/**
 * @brief Compute ratio and savings from the two sizes.
 *
 * @p output_size must be nonzero (the orchestrator rejects empty output).
 * A zero @p input_size yields a ratio and savings of 0.
 */
CompressionResult make_result(uintmax_t input_size,
                              uintmax_t output_size,
                              std::chrono::milliseconds duration = std::chrono::milliseconds{0});

/// @return Size in MiB with two decimals, e.g. "10.00".
std::string format_megabytes(uintmax_t bytes);

/// @return Ratio with two decimals, e.g. "2.50".
std::string format_ratio(double ratio);

/// @return Percentage with one decimal, e.g. "60.0".
std::string format_percent(double percent);

} // namespace pdfshrink

#endif // PDFSHRINK_COMPRESSION_RESULT_HPP
