#include "report_generator.hpp"
#include "../utils/color.hpp"
#include "../../../libcbzxl/include/file_utils.hpp"
#include "../../../libcbzxl/include/logger.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

using namespace cbzxl;

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string gigabytes(const std::int64_t bytes) {
    return std::format("{:.3f} GB ({:.2f} MB)",
                       static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0),
                       static_cast<double>(bytes) / (1024.0 * 1024.0));
}

void print_run_summary(const RunStats& stats, const std::filesystem::path& log_file) {
    constexpr const char* tag = "summary";
    Logger::log(LogLevel::Info, stats.dry_run ? "Dry run complete" : "Done", tag);
    Logger::log(LogLevel::Info, std::format("   Archives found:          {}", stats.found), tag);
    Logger::log(LogLevel::Info, std::format("   Archives processed:      {}", stats.processed), tag);
    Logger::log(LogLevel::Info, std::format("   Archives converted:      {}", stats.converted), tag);
    Logger::log(LogLevel::Info, std::format("   Already processed:       {}", stats.skipped), tag);
    Logger::log(LogLevel::Info, std::format("   Archives flattened:      {}", stats.flattened), tag);
    Logger::log(LogLevel::Info, std::format("   Archives deleted:        {}", stats.deleted), tag);
    Logger::log(LogLevel::Info, std::format("   Archives failed:         {}", stats.failed), tag);
    Logger::log(LogLevel::Info, std::format("   Images converted:        {} ({} failed)",
                                            stats.images_converted, stats.images_failed), tag);
    if (stats.bytes_saved >= 0) {
        Logger::log(LogLevel::Info, std::string("   Space saved:             ") + format_bytes(stats.bytes_saved) +
                    (stats.dry_run ? " (estimated)" : ""), tag);
    } else {
        Logger::log(LogLevel::Info, "   Space increased:         " + format_bytes(-stats.bytes_saved), tag);
    }
    Logger::log(LogLevel::Info, std::format("   Elapsed:                 {:.1f}s", stats.elapsed.count()), tag);
    if (stats.interrupted) {
        Logger::log(LogLevel::Warning, "Run interrupted before every archive was processed", tag);
    }
    Logger::log(LogLevel::Info, "   Log file:                " + log_file.string(), tag);
}

void print_store_statistics(const StoreStatistics& stats, const bool use_colors) {
    const char* title = use_colors ? CYAN : "";
    const char* good = use_colors ? GREEN : "";
    const char* bad = use_colors ? RED : "";
    const char* reset = use_colors ? RESET : "";

    std::cout << "\n" << title << "--- Summary Statistics ---" << reset << "\n";
    std::cout << "Total Archives Recorded: " << stats.total_records << "\n";
    if (stats.bytes_saved >= 0) {
        std::cout << "Total Space Saved (Overall): " << good << gigabytes(stats.bytes_saved) << reset << "\n";
    } else {
        std::cout << "Total Space " << bad << "Increased" << reset << " by (Overall): "
                  << bad << gigabytes(-stats.bytes_saved) << reset << "\n";
    }
    std::cout << "Total Space Saved (converted archives with positive saving): "
              << good << gigabytes(stats.saved_by_converted) << reset << "\n";
    std::cout << "Original size: " << format_bytes(stats.total_original)
              << ", current size: " << format_bytes(stats.total_final) << "\n";

    const unsigned width = std::min(60u, get_terminal_width());
    const std::string rule(width, '-');
    const auto print_table = [&](const char* heading, const std::map<std::string, std::size_t>& rows) {
        std::cout << "\n" << title << heading << reset << "\n" << rule << "\n";
        for (const auto& [name, count] : rows) {
            std::cout << std::format("{:<40}{:>10}\n", name, count);
        }
    };
    print_table("--- Status ---", stats.by_status);
    print_table("--- Outcome ---", stats.by_outcome);

    std::cout << "\n" << title << "--- JXL vs. Other Image Types ---" << reset << "\n";
    std::cout << "Archives already JXL: " << stats.already_jxl << "\n";
    std::cout << "Archives with other image types: " << stats.other_formats << "\n";
    if (stats.other_formats > 0) {
        std::cout << std::format("Ratio (JXL : Other): {:.2f} : 1\n",
                                 static_cast<double>(stats.already_jxl) / static_cast<double>(stats.other_formats));
    } else if (stats.already_jxl > 0) {
        std::cout << "Ratio (JXL : Other): all JXL\n";
    } else {
        std::cout << "Ratio (JXL : Other): N/A\n";
    }
}

static std::string csv_quote(const std::string& s) {
    std::string out = "\"";
    for (const char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

bool export_csv_report(const std::vector<ArchiveRecord>& records, const std::filesystem::path& output_path) {
    std::ofstream out(output_path);
    if (!out) {
        Logger::log(LogLevel::Error, "Can't write report: " + output_path.string(), "report");
        return false;
    }

    out << "Path,Status,Outcome,Dominant,Before(KB),After(KB),Saved(KB),Saved(%),Images,JPG,PNG,Effort,"
           "Time(s),Timestamp,Encoder,Error\n";
    for (const auto& r : records) {
        out << csv_quote(r.path) << ","
            << status_to_string(r.status) << ","
            << r.outcome << ","
            << r.dominant_type << ","
            << (r.original_size / 1024) << ","
            << (r.final_size / 1024) << ","
            << (r.bytes_saved / 1024) << ","
            << std::format("{:.2f}", r.percent_saved) << ","
            << r.image_count << ","
            << r.jpg_count << ","
            << r.png_count << ","
            << r.effort << ","
            << std::format("{:.2f}", r.duration) << ","
            << r.timestamp << ","
            << csv_quote(r.tool_version) << ","
            << csv_quote(r.error_message.value_or("")) << "\n";
    }
    out.flush();
    if (!out) {
        Logger::log(LogLevel::Error, "Error writing report: " + output_path.string(), "report");
        return false;
    }
    Logger::log(LogLevel::Info, "Report written: " + output_path.string(), "report");
    return true;
}
