#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <magic.h>
#include <memory>

namespace pdfshrink {

namespace {

struct MagicCloser {
    void operator()(magic_set* cookie) const { magic_close(cookie); }
};

using MagicHandle = std::unique_ptr<magic_set, MagicCloser>;

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path) {
    const MagicHandle magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        Logger::log(LogLevel::Warning, "magic_open failed", "libmagic");
        return {};
    }
    if (magic_load(magic.get(), nullptr) != 0) {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + (err ? err : "unknown error"), "libmagic");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    if (!mime) {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Debug, "Cannot detect type of " + path.string() + ": " + (err ? err : "unknown error"),
                    "libmagic");
        return {};
    }
    return mime;
}

} // namespace pdfshrink
