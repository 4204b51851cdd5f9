#ifndef PDFSHRINK_FILE_LOG_SINK_HPP
#define PDFSHRINK_FILE_LOG_SINK_HPP

#include "../../../libpdfshrink/include/log_sink.hpp"
#include "../../../libpdfshrink/include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>

// appends every message, with a local timestamp, to a log file
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);

        std::lock_guard lock(mtx_);
        out_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S ")
             << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // PDFSHRINK_FILE_LOG_SINK_HPP
