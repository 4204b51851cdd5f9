#include "../../include/level_profile.hpp"
#include "../../include/errors.hpp"

namespace pdfshrink {

namespace {

constexpr std::string_view kDctEncode = "DCTEncode";

constexpr std::array<LevelProfile, kMaxLevel> kProfiles{{
    {1, "Light compression, highest quality", "prepress", "1.7",
     {300, 300, 300},
     {DownsampleType::Bicubic, DownsampleType::Bicubic, DownsampleType::Bicubic},
     false, kDctEncode, 95, std::nullopt},
    {2, "Medium compression, good quality", "printer", "1.6",
     {150, 150, 200},
     {DownsampleType::Bicubic, DownsampleType::Bicubic, DownsampleType::Bicubic},
     true, kDctEncode, 85, std::nullopt},
    {3, "Medium compression, reduced quality", "ebook", "1.5",
     {110, 110, 150},
     {DownsampleType::Average, DownsampleType::Average, DownsampleType::Bicubic},
     true, kDctEncode, 80, std::nullopt},
    {4, "High compression, reduced quality", "ebook", "1.5",
     {96, 96, 150},
     {DownsampleType::Average, DownsampleType::Average, DownsampleType::Subsample},
     true, kDctEncode, 75, std::nullopt},
    {5, "Maximum compression, lowest quality", "screen", "1.4",
     {72, 72, 72},
     {DownsampleType::Average, DownsampleType::Average, DownsampleType::Subsample},
     true, kDctEncode, 50, AggressiveOptions{}},
}};

std::string bool_arg(const std::string_view key, const bool value) {
    return "-d" + std::string(key) + "=" + (value ? "true" : "false");
}

std::string int_arg(const std::string_view key, const int value) {
    return "-d" + std::string(key) + "=" + std::to_string(value);
}

std::string name_arg(const std::string_view key, const std::string_view value) {
    return "-d" + std::string(key) + "=/" + std::string(value);
}

std::string escape_output_template(const std::string& path) {
    std::string escaped;
    escaped.reserve(path.size());
    for (const char c : path) {
        if (c == '%') {
            escaped.push_back('%');
        }
        escaped.push_back(c);
    }
    return escaped;
}

} // namespace

std::string_view downsample_type_name(const DownsampleType type) noexcept {
    switch (type) {
        case DownsampleType::Bicubic:   return "Bicubic";
        case DownsampleType::Average:   return "Average";
        case DownsampleType::Subsample: return "Subsample";
    }
    return "";
}

const LevelProfile& profile_for_level(const int level) {
    if (level < kMinLevel || level > kMaxLevel) {
        throw ShrinkError(ErrorKind::InvalidLevel,
                          "Compression level must be between 1 and 5 (got " + std::to_string(level) + ")");
    }
    return kProfiles[static_cast<std::size_t>(level - kMinLevel)];
}

const std::array<LevelProfile, kMaxLevel>& all_profiles() noexcept {
    return kProfiles;
}

std::vector<std::string> base_engine_arguments() {
    return {
        "-sDEVICE=pdfwrite",
        "-dNOPAUSE",
        "-dQUIET",
        "-dBATCH",
        "-dSAFER"
    };
}

std::vector<std::string> profile_arguments(const LevelProfile& profile) {
    std::vector<std::string> args;
    args.reserve(19);

    args.push_back(name_arg("PDFSETTINGS", profile.quality_preset));
    args.push_back("-dCompatibilityLevel=" + std::string(profile.compatibility));

    args.push_back(int_arg("ColorImageResolution", profile.resolution.color));
    args.push_back(int_arg("GrayImageResolution", profile.resolution.gray));
    args.push_back(int_arg("MonoImageResolution", profile.resolution.mono));

    args.push_back(name_arg("ColorImageDownsampleType", downsample_type_name(profile.downsample.color)));
    args.push_back(name_arg("GrayImageDownsampleType", downsample_type_name(profile.downsample.gray)));
    args.push_back(name_arg("MonoImageDownsampleType", downsample_type_name(profile.downsample.mono)));

    args.push_back(bool_arg("AutoFilterColorImages", profile.auto_filter));
    args.push_back(bool_arg("AutoFilterGrayImages", profile.auto_filter));
    args.push_back(name_arg("ColorImageFilter", profile.image_filter));
    args.push_back(name_arg("GrayImageFilter", profile.image_filter));
    args.push_back(int_arg("JPEGQ", profile.jpeg_quality));

    if (profile.aggressive) {
        const auto& extra = *profile.aggressive;
        args.push_back(bool_arg("EmbedAllFonts", extra.embed_all_fonts));
        args.push_back(bool_arg("SubsetFonts", extra.subset_fonts));
        args.push_back(bool_arg("CompressFonts", extra.compress_fonts));
        args.push_back(bool_arg("ConvertCMYKImagesToRGB", extra.convert_cmyk_to_rgb));
        args.push_back(bool_arg("DetectDuplicateImages", extra.detect_duplicate_images));
        args.push_back(bool_arg("Optimize", extra.optimize));
    }
    return args;
}

std::vector<std::string> build_engine_arguments(const LevelProfile& profile,
                                                const std::filesystem::path& output_path,
                                                const std::filesystem::path& input_path) {
    auto args = base_engine_arguments();
    const auto level_args = profile_arguments(profile);
    args.insert(args.end(), level_args.begin(), level_args.end());

    args.push_back("-sOutputFile=" + escape_output_template(output_path.string()));

    // a leading '-' would be read as a switch
    std::string input = input_path.string();
    if (input.starts_with('-')) {
        input = "./" + input;
    }
    args.push_back(std::move(input));
    return args;
}

} // namespace pdfshrink
