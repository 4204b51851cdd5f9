#include "../../include/progress_ticker.hpp"
#include <algorithm>

namespace pdfshrink {

ProgressTicker::ProgressTicker(const std::chrono::milliseconds interval,
                               const unsigned step,
                               const unsigned ceiling,
                               TickHandler on_tick)
    : interval_(interval),
      step_(step),
      ceiling_(std::min(ceiling, 99u)),
      on_tick_(std::move(on_tick)) {}

ProgressTicker::~ProgressTicker() {
    stop();
}

void ProgressTicker::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread([this](const std::stop_token& st) { run(st); });
}

void ProgressTicker::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

void ProgressTicker::complete() {
    stop();
    percent_.store(100);
}

void ProgressTicker::run(const std::stop_token& stop) {
    std::unique_lock lock(mtx_);
    while (true) {
        // wakes early on request_stop()
        if (cv_.wait_for(lock, stop, interval_, [&stop] { return stop.stop_requested(); })) {
            return;
        }

        const unsigned current = percent_.load();
        const unsigned next = std::min(current + step_, ceiling_);
        if (next == current) {
            continue;
        }
        percent_.store(next);

        lock.unlock();
        if (on_tick_) {
            on_tick_(next);
        }
        lock.lock();
    }
}

} // namespace pdfshrink
