/**
 * @file errors.hpp
 * @brief Error taxonomy for a single compression invocation.
 *
 * Every failure is terminal: nothing is retried. All errors derive from
 * ShrinkError so the CLI can report them from one handler.
 */

#ifndef PDFSHRINK_ERRORS_HPP
#define PDFSHRINK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace pdfshrink {

/**
 * @brief Classifies why an invocation failed.
 */
enum class ErrorKind {
    InputNotFound,      ///< Input path missing or not a regular file
    InvalidInputType,   ///< Input lacks a .pdf suffix
    InvalidLevel,       ///< Level is not an integer in [1,5]
    EngineNotFound,     ///< Engine executable not resolvable through PATH
    EngineStartFailure, ///< Engine exists but could not be started
    EngineFailure,      ///< Engine ran and exited nonzero
    OutputMissing       ///< Engine reported success but produced no output
};

/// @return Stable name of @p kind, e.g. "EngineNotFound".
std::string_view error_kind_name(ErrorKind kind) noexcept;

class ShrinkError : public std::runtime_error {
public:
    ShrinkError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief The engine exited with a nonzero status.
 *
 * Carries the exit code (128 + signal number if the engine was killed)
 * and everything the engine wrote to standard error.
 */
class EngineFailureError final : public ShrinkError {
public:
    EngineFailureError(int exit_code, std::string stderr_text);

    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_text_; }

private:
    int exit_code_;
    std::string stderr_text_;
};

} // namespace pdfshrink

#endif // PDFSHRINK_ERRORS_HPP
