/**
 * @file compression_orchestrator.hpp
 * @brief Runs one compression: level profile -> engine process -> verified
 * result.
 */

#ifndef PDFSHRINK_COMPRESSION_ORCHESTRATOR_HPP
#define PDFSHRINK_COMPRESSION_ORCHESTRATOR_HPP

#include "compression_request.hpp"
#include "compression_result.hpp"
#include "event_bus.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace pdfshrink {

/**
 * @brief Tunables of the orchestrator.
 */
struct OrchestratorConfig {
    std::string engine = "gs";                    ///< Executable name or path
    std::chrono::milliseconds tick_interval{200}; ///< Progress ticker period
    unsigned tick_step = 5;                       ///< Percent added per tick
    unsigned tick_ceiling = 99;                   ///< Highest simulated percent
};

/**
 * @brief Delegates compression of one PDF to Ghostscript.
 *
 * @details run() builds the argument vector for the request's level,
 * spawns the engine, drives the cosmetic progress ticker while it runs and
 * verifies the output once it exits. Lifecycle events go to the EventBus
 * given at construction (see events.hpp). Nothing is retried: the first
 * failure is thrown to the caller.
 */
class CompressionOrchestrator {
public:
    explicit CompressionOrchestrator(EventBus& bus, OrchestratorConfig config = {});

    /**
     * @brief Compress @p request.input_path() into @p request.output_path().
     * @return Size statistics of the verified output.
     * @throws ShrinkError EngineNotFound, EngineStartFailure, OutputMissing,
     * InputNotFound (input vanished after validation), or
     * EngineFailureError for a nonzero exit.
     */
    CompressionResult run(const CompressionRequest& request);

    /// @return argv of the engine invocation for @p request, argv[0] included.
    [[nodiscard]] std::vector<std::string> engine_command(const CompressionRequest& request) const;

    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

private:
    CompressionResult execute(const CompressionRequest& request);

    EventBus& bus_;
    OrchestratorConfig config_;
};

} // namespace pdfshrink

#endif // PDFSHRINK_COMPRESSION_ORCHESTRATOR_HPP
