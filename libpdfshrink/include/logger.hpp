/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade.
 *
 * Every component of pdfshrink logs through Logger, which forwards the
 * message to each registered ILogSink. With no sinks installed, logging
 * is a no-op, which is what the library tests rely on.
 */

#ifndef PDFSHRINK_LOGGER_HPP
#define PDFSHRINK_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation; null is ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Remove every registered sink.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "pdfshrink").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "pdfshrink");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted by --log-level.
     *
     * Matching is case-insensitive; "WARN" and "WARNING" are both accepted.
     * @return The level, or std::nullopt for "NONE" and unknown names.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // PDFSHRINK_LOGGER_HPP
