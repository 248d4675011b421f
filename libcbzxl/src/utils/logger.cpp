#include "../../include/logger.hpp"
#include <cstdio>
#include <exception>

namespace cbzxl {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

std::size_t Logger::sink_count() {
    std::lock_guard lock(mtx_);
    return sinks_.size();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        // image workers log too; a sink that throws (full disk, closed stream) must not take one down
        try {
            sink->log(level, msg, tag);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[cbzxl] log sink failed: %s\n", e.what());
        }
    }
}

} // namespace cbzxl
