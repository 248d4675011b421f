#ifndef CBZXL_CONSOLE_LOG_SINK_HPP
#define CBZXL_CONSOLE_LOG_SINK_HPP

#include "../../../libcbzxl/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints every message at or above log_level; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public cbzxl::ILogSink {
public:
    cbzxl::LogLevel log_level = cbzxl::LogLevel::Info;
    bool dry_run = false;

    void log(const cbzxl::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (static_cast<int>(level) < static_cast<int>(log_level)) return;

        const char* prefix = dry_run ? "[DRY-RUN] " : "";
        std::lock_guard lock(mtx_);
        switch (level) {
            case cbzxl::LogLevel::Debug:
                std::cout << prefix << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case cbzxl::LogLevel::Info:
                std::cout << prefix << message << std::endl;
                break;
            case cbzxl::LogLevel::Warning:
                std::cerr << YELLOW << prefix << "[WARN ][" << tag << "] " << message << RESET << std::endl;
                break;
            case cbzxl::LogLevel::Error:
                std::cerr << RED << prefix << "[ERROR][" << tag << "] " << message << RESET << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // CBZXL_CONSOLE_LOG_SINK_HPP
