#include "../../include/errors.hpp"

namespace pdfshrink {

std::string_view error_kind_name(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InputNotFound:      return "InputNotFound";
        case ErrorKind::InvalidInputType:   return "InvalidInputType";
        case ErrorKind::InvalidLevel:       return "InvalidLevel";
        case ErrorKind::EngineNotFound:     return "EngineNotFound";
        case ErrorKind::EngineStartFailure: return "EngineStartFailure";
        case ErrorKind::EngineFailure:      return "EngineFailure";
        case ErrorKind::OutputMissing:      return "OutputMissing";
    }
    return "Unknown";
}

EngineFailureError::EngineFailureError(const int exit_code, std::string stderr_text)
    : ShrinkError(ErrorKind::EngineFailure,
                  "Ghostscript exited with code " + std::to_string(exit_code) + ": " + stderr_text),
      exit_code_(exit_code),
      stderr_text_(std::move(stderr_text)) {}

} // namespace pdfshrink
