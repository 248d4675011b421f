#ifndef CBZXL_FILE_LOG_SINK_HPP
#define CBZXL_FILE_LOG_SINK_HPP

#include "../../../libcbzxl/include/file_utils.hpp"
#include "../../../libcbzxl/include/log_sink.hpp"
#include "../../../libcbzxl/include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

/**
 * @brief Append-only log file. Every line of a dry run starts with "[DRY-RUN] ".
 */
class FileLogSink final : public cbzxl::ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool dry_run = false, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc),
          prefix_(dry_run ? "[DRY-RUN] " : "") {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const cbzxl::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (!out_.is_open()) return;

        std::lock_guard lock(mtx_);
        out_ << prefix_ << cbzxl::current_timestamp() << " [" << cbzxl::Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::string prefix_;
    std::mutex mtx_;
};

#endif // CBZXL_FILE_LOG_SINK_HPP
