#ifndef CBZXL_LOG_SINK_HPP
#define CBZXL_LOG_SINK_HPP

#include <string_view>

namespace cbzxl {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-image and per-step diagnostics
    Info,    ///< Normal progress of a run (one line per archive decision)
    Warning, ///< Recoverable problems (a member left unconverted, a failed rename)
    Error    ///< An archive failed or the run cannot continue
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where a line ends up (console, append-only log
 * file, test capture). The Logger facade fans every message out to all
 * installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "Encoder").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace cbzxl

#endif // CBZXL_LOG_SINK_HPP
