#ifndef PDFSHRINK_MIME_DETECTOR_HPP
#define PDFSHRINK_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace pdfshrink {

    /**
     * @brief Content-based file type detection through libmagic.
     *
     * Used for the MIME column of the CSV report; it never gates
     * processing.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         * @param path The filesystem path to the file.
         * @return The MIME type (e.g. "application/pdf"), or an empty
         * string if libmagic is unavailable or the file cannot be read.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace pdfshrink

#endif // PDFSHRINK_MIME_DETECTOR_HPP
