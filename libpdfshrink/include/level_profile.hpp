/**
 * @file level_profile.hpp
 * @brief Fixed Ghostscript configuration for each compression level.
 */

#ifndef PDFSHRINK_LEVEL_PROFILE_HPP
#define PDFSHRINK_LEVEL_PROFILE_HPP

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdfshrink {

inline constexpr int kMinLevel = 1;
inline constexpr int kMaxLevel = 5;
inline constexpr int kDefaultLevel = 3;

/**
 * @brief Resampling algorithm used when downsampling embedded images.
 */
enum class DownsampleType {
    Bicubic,
    Average,
    Subsample
};

/// @return The pdfwrite name of @p type ("Bicubic", "Average", "Subsample").
std::string_view downsample_type_name(DownsampleType type) noexcept;

/**
 * @brief Target resolution (DPI) per image color channel.
 */
struct ImageResolution {
    int color;
    int gray;
    int mono;
};

/**
 * @brief Downsampling algorithm per image color channel.
 */
struct DownsamplePolicy {
    DownsampleType color;
    DownsampleType gray;
    DownsampleType mono;
};

/**
 * @brief Font and structure optimizations reserved for the most
 * aggressive level.
 */
struct AggressiveOptions {
    bool embed_all_fonts = false;
    bool subset_fonts = true;
    bool compress_fonts = true;
    bool convert_cmyk_to_rgb = true;
    bool detect_duplicate_images = true;
    bool optimize = true;
};

/**
 * @brief One of the five compression profiles.
 *
 * Profiles are static and read-only; profile_for_level() returns a
 * reference into a constant table.
 */
struct LevelProfile {
    int level;
    std::string_view description;
    std::string_view quality_preset;    ///< -dPDFSETTINGS (prepress, printer, ebook, screen)
    std::string_view compatibility;     ///< -dCompatibilityLevel
    ImageResolution resolution;
    DownsamplePolicy downsample;
    bool auto_filter;                   ///< -dAutoFilterColorImages / -dAutoFilterGrayImages
    std::string_view image_filter;      ///< Encoder for color and gray images
    int jpeg_quality;                   ///< -dJPEGQ
    std::optional<AggressiveOptions> aggressive;
};

/**
 * @brief Look up the profile for a level.
 * @param level Compression level in [kMinLevel, kMaxLevel].
 * @return Reference to the static profile.
 * @throws ShrinkError (InvalidLevel) if @p level is out of range.
 */
const LevelProfile& profile_for_level(int level);

/// @return All five profiles, ordered by level.
const std::array<LevelProfile, kMaxLevel>& all_profiles() noexcept;

/**
 * @brief Arguments shared by every profile: pdfwrite device, no pausing,
 * quiet banners, batch exit and SAFER mode.
 */
std::vector<std::string> base_engine_arguments();

/// @brief Render the level-specific part of the argument vector.
std::vector<std::string> profile_arguments(const LevelProfile& profile);

/**
 * @brief Build the complete engine argument vector (without argv[0]).
 *
 * Order: base arguments, profile arguments, output file directive, input
 * path. The input path is always the last element.
 *
 * @param profile Selected level profile.
 * @param output_path Destination file; '%' is doubled because Ghostscript
 * treats it as a page-number template in -sOutputFile.
 * @param input_path Source PDF.
 */
std::vector<std::string> build_engine_arguments(const LevelProfile& profile,
                                                const std::filesystem::path& output_path,
                                                const std::filesystem::path& input_path);

} // namespace pdfshrink

#endif // PDFSHRINK_LEVEL_PROFILE_HPP
