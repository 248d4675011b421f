#ifndef CBZXL_REPORT_GENERATOR_HPP
#define CBZXL_REPORT_GENERATOR_HPP

#include "../../../libcbzxl/include/pipeline.hpp"
#include "../../../libcbzxl/include/state_store.hpp"
#include "../../../libcbzxl/include/store_statistics.hpp"
#include <filesystem>
#include <vector>

/**
 * @brief Logs the end-of-run summary, so it lands in the log file as well.
 */
void print_run_summary(const cbzxl::RunStats& stats, const std::filesystem::path& log_file);

/**
 * @brief Prints the --stats report of the success store on stdout.
 */
void print_store_statistics(const cbzxl::StoreStatistics& stats, bool use_colors);

/**
 * @brief Writes every record to @p output_path as CSV.
 * @return false if the file can't be written.
 */
bool export_csv_report(const std::vector<cbzxl::ArchiveRecord>& records,
                       const std::filesystem::path& output_path);

unsigned get_terminal_width();

#endif // CBZXL_REPORT_GENERATOR_HPP
