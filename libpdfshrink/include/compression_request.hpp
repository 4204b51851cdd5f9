/**
 * @file compression_request.hpp
 * @brief Option Resolver: turns raw command-line values into a validated,
 * immutable CompressionRequest.
 */

#ifndef PDFSHRINK_COMPRESSION_REQUEST_HPP
#define PDFSHRINK_COMPRESSION_REQUEST_HPP

#include "level_profile.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace pdfshrink {

/**
 * @brief Unvalidated values as they come from the command line.
 */
struct RawOptions {
    std::string input;
    std::string output;                               ///< Empty means "derive from input"
    std::string level = std::to_string(kDefaultLevel);
    bool verbose = false;
};

class CompressionRequest;

/**
 * @brief Validate @p raw and build a request.
 *
 * Checks, in order: the input exists and is a regular file, the input has
 * a case-insensitive .pdf suffix, the output path (derived when absent),
 * and the level. Only the existence check touches the filesystem.
 *
 * @throws ShrinkError with kind InputNotFound, InvalidInputType or InvalidLevel.
 */
CompressionRequest resolve_request(const RawOptions& raw);

/**
 * @brief A validated compression job. Only resolve_request() creates one.
 */
class CompressionRequest {
public:
    [[nodiscard]] const std::filesystem::path& input_path() const noexcept { return input_path_; }
    [[nodiscard]] const std::filesystem::path& output_path() const noexcept { return output_path_; }
    [[nodiscard]] int level() const noexcept { return level_; }
    [[nodiscard]] bool verbose() const noexcept { return verbose_; }
    /// @return true if the output path was derived from the input path.
    [[nodiscard]] bool output_derived() const noexcept { return output_derived_; }

private:
    CompressionRequest(std::filesystem::path input, std::filesystem::path output,
                       const int level, const bool verbose, const bool output_derived)
        : input_path_(std::move(input)), output_path_(std::move(output)),
          level_(level), verbose_(verbose), output_derived_(output_derived) {}

    friend CompressionRequest resolve_request(const RawOptions& raw);

    std::filesystem::path input_path_;
    std::filesystem::path output_path_;
    int level_;
    bool verbose_;
    bool output_derived_;
};

/// @return true if @p path ends in ".pdf", ignoring case.
bool has_pdf_extension(const std::filesystem::path& path);

/**
 * @brief Default destination: "<dir>/<stem>-compressed.pdf".
 *
 * An input without a directory component yields a bare file name.
 */
std::filesystem::path derive_output_path(const std::filesystem::path& input);

/**
 * @brief Parse a level string. The whole string must be a decimal integer.
 * @throws ShrinkError (InvalidLevel) on junk or out-of-range values.
 */
int parse_level(std::string_view text);

} // namespace pdfshrink

#endif // PDFSHRINK_COMPRESSION_REQUEST_HPP
