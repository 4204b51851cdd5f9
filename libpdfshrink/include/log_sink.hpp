/**
 * @file log_sink.hpp
 * @brief Severity levels and the abstract sink used by Logger.
 */

#ifndef PDFSHRINK_LOG_SINK_HPP
#define PDFSHRINK_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages, ordered from least to most severe.
 */
enum class LogLevel {
    Debug,   ///< Engine arguments, state transitions
    Info,    ///< Normal operation (derived paths, sizes)
    Warning, ///< Unexpected but recoverable conditions
    Error    ///< Failures that end the invocation
};

/**
 * @brief Destination for log messages (console, file, ...).
 *
 * Sinks decide on their own whether a message passes their threshold.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one message.
     * @param level Severity of the message.
     * @param message The message text.
     * @param tag Component that produced the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // PDFSHRINK_LOG_SINK_HPP
