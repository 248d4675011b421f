/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by the library and the CLI.
 *
 * Image workers log from several threads at once; every call is serialized
 * so a line written to a sink is never interleaved with another one.
 */

#ifndef CBZXL_LOGGER_HPP
#define CBZXL_LOGGER_HPP

#include "log_sink.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cbzxl {

class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Number of installed sinks.
     */
    static std::size_t sink_count();

    /**
     * @brief Log a message to all registered sinks.
     *
     * A sink that throws is reported on stderr and skipped for this message.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "cbzxl").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "cbzxl");

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
     * @brief Parses "DEBUG", "INFO", "WARNING"/"WARN"; anything else is Error.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace cbzxl

#endif // CBZXL_LOGGER_HPP
