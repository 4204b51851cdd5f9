/**
 * @file progress_ticker.hpp
 * @brief Timer-driven, cosmetic progress percentage.
 *
 * Ghostscript reports no machine-readable progress, so the percentage
 * shown while it runs is simulated: it advances by a fixed step on a fixed
 * interval, independent of what the engine is doing, and stops at a
 * ceiling below 100. Only complete() reaches 100, and the orchestrator
 * calls it only after the output has been verified.
 */

#ifndef PDFSHRINK_PROGRESS_TICKER_HPP
#define PDFSHRINK_PROGRESS_TICKER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace pdfshrink {

class ProgressTicker {
public:
    using TickHandler = std::function<void(unsigned percent)>;

    /**
     * @param interval Delay between two ticks.
     * @param step Percentage added per tick.
     * @param ceiling Highest value a tick may reach (< 100).
     * @param on_tick Called from the ticker thread with each new value.
     */
    ProgressTicker(std::chrono::milliseconds interval,
                   unsigned step,
                   unsigned ceiling,
                   TickHandler on_tick);

    /// Stops the ticker thread if still running.
    ~ProgressTicker();

    ProgressTicker(const ProgressTicker&) = delete;
    ProgressTicker& operator=(const ProgressTicker&) = delete;

    /// @brief Launch the ticker thread. Calling it twice has no effect.
    void start();

    /**
     * @brief Cancel the timer and join the thread. Idempotent.
     * The percentage keeps its last value.
     */
    void stop();

    /// @brief stop(), then set the percentage to 100.
    void complete();

    [[nodiscard]] unsigned percent() const noexcept { return percent_.load(); }

private:
    void run(const std::stop_token& stop);

    std::chrono::milliseconds interval_;
    unsigned step_;
    unsigned ceiling_;
    TickHandler on_tick_;

    std::atomic<unsigned> percent_{0};
    std::mutex mtx_;
    std::condition_variable_any cv_;
    std::jthread thread_; ///< Must stay the last member
};

} // namespace pdfshrink

#endif // PDFSHRINK_PROGRESS_TICKER_HPP
