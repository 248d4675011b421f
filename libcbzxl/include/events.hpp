#ifndef CBZXL_EVENTS_HPP
#define CBZXL_EVENTS_HPP

#include "outcome.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace cbzxl {

/**
 * @brief Events published by the orchestrator, one archive at a time.
 *
 * Plain data carriers used with EventBus.
 */

/**
 * @brief Emitted before an archive is extracted.
 */
struct ArchiveStartEvent {
    std::string relative;   ///< Archive identity
    std::size_t index = 0;  ///< 1-based position in this run
    std::size_t total = 0;  ///< Archives selected for this run
};

/**
 * @brief Emitted when an archive is left alone because a record exists.
 */
struct ArchiveSkippedEvent {
    std::string relative;
    std::string reason;
};

/**
 * @brief Emitted when an archive reached a terminal state other than Failed.
 */
struct ArchiveCompleteEvent {
    std::string relative;
    ArchiveStatus status = ArchiveStatus::Processed;
    std::string outcome;            ///< outcome_label()
    std::uintmax_t original_size = 0;
    std::uintmax_t final_size = 0;
    std::int64_t bytes_saved = 0;
    bool repacked = false;
    bool flattened = false;
};

/**
 * @brief Emitted when an archive failed.
 */
struct ArchiveErrorEvent {
    std::string relative;
    std::string error_message;
};

} // namespace cbzxl

#endif // CBZXL_EVENTS_HPP
