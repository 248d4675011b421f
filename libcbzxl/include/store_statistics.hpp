/**
 * @file store_statistics.hpp
 * @brief Aggregates over the success store, as printed by --stats.
 */

#ifndef CBZXL_STORE_STATISTICS_HPP
#define CBZXL_STORE_STATISTICS_HPP

#include "state_store.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cbzxl {

struct StoreStatistics {
    std::size_t total_records = 0;
    std::map<std::string, std::size_t> by_status;   ///< "processed", "failed", "deleted"
    std::map<std::string, std::size_t> by_outcome;  ///< Outcome label; failures are not counted here
    std::int64_t total_original = 0;
    std::int64_t total_final = 0;
    std::int64_t bytes_saved = 0;                   ///< Over every row; negative means growth
    std::int64_t saved_by_converted = 0;            ///< Processed rows with a positive saving
    std::size_t already_jxl = 0;                    ///< Archives that were JPEG XL already
    std::size_t other_formats = 0;                  ///< No jpeg/png: other formats or nothing recognized
};

[[nodiscard]] StoreStatistics summarize_records(const std::vector<ArchiveRecord>& records);

} // namespace cbzxl

#endif // CBZXL_STORE_STATISTICS_HPP
