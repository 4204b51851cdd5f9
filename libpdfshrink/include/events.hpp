#ifndef PDFSHRINK_EVENTS_HPP
#define PDFSHRINK_EVENTS_HPP

#include "compression_result.hpp"
#include "engine_process.hpp"
#include "errors.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pdfshrink {

/**
 * @brief Events published by CompressionOrchestrator::run().
 *
 * Order for one run: CompressionStartEvent, EngineLaunchEvent, any number
 * of ProgressEvent / EngineOutputEvent, EngineExitEvent (only if the
 * engine started), a final ProgressEvent with finished set, then exactly
 * one of CompressionCompleteEvent or CompressionErrorEvent.
 */

struct CompressionStartEvent {
    std::filesystem::path input;  ///< Source PDF
    std::filesystem::path output; ///< Destination PDF
    int level = 0;
    uintmax_t input_size = 0;     ///< Input size in bytes
};

/**
 * @brief Emitted right before the engine is spawned.
 */
struct EngineLaunchEvent {
    std::string program;
    std::vector<std::string> args; ///< Arguments after argv[0]
};

/**
 * @brief A chunk of engine output. Only published for verbose requests.
 */
struct EngineOutputEvent {
    OutputStream stream = OutputStream::Stdout;
    std::string text;
};

/**
 * @brief Simulated progress. Published from the ticker thread while the
 * engine runs, and once more from the caller's thread when finished.
 */
struct ProgressEvent {
    unsigned percent = 0;
    bool finished = false; ///< No further progress events follow
};

struct EngineExitEvent {
    int exit_code = 0;
    std::chrono::milliseconds duration{0};
};

struct CompressionCompleteEvent {
    std::filesystem::path output;
    CompressionResult result;
};

struct CompressionErrorEvent {
    ErrorKind kind = ErrorKind::EngineFailure;
    std::string error_message;
};

} // namespace pdfshrink

#endif // PDFSHRINK_EVENTS_HPP
