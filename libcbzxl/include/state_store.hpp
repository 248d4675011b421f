/**
 * @file state_store.hpp
 * @brief Persisted per-archive records (SQLite).
 */

#ifndef CBZXL_STATE_STORE_HPP
#define CBZXL_STATE_STORE_HPP

#include "outcome.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

struct sqlite3;

namespace cbzxl {

/**
 * @brief One row of the success store, keyed by the archive's relative path.
 */
struct ArchiveRecord {
    std::string path;
    std::int64_t original_size = 0;
    std::int64_t final_size = 0;
    std::int64_t bytes_saved = 0;
    double percent_saved = 0.0;
    std::string timestamp;
    ArchiveStatus status = ArchiveStatus::Processed;
    std::string outcome;                  ///< outcome_label(), empty for failures
    std::string dominant_type = "N/A";
    int effort = 0;
    double duration = 0.0;                ///< Seconds
    int image_count = 0;
    int jpg_count = 0;
    int png_count = 0;
    std::string tool_version;
    std::optional<std::string> error_message;
};

/**
 * @brief One row of the failure store.
 */
struct FailureRecord {
    std::string path;
    std::string timestamp;
    double duration = 0.0;
    std::string error_message;
};

/**
 * @brief How the stores are opened.
 *
 * ReadOnly never creates, migrates or journals anything: a missing database
 * file or table reads as empty and every write throws. Dry runs and --stats
 * use it.
 */
enum class StoreMode {
    ReadWrite,
    ReadOnly
};

/**
 * @brief The success store ("converted_archives") and the failure store
 * ("failed_archives"), each in its own database file.
 *
 * Every write is an upsert, so there is exactly one current row per path.
 * All methods throw StateStoreError on SQLite failures.
 */
class ArchiveStateStore {
public:
    ArchiveStateStore(const std::filesystem::path& success_db,
                      const std::filesystem::path& failure_db,
                      StoreMode mode = StoreMode::ReadWrite);
    ~ArchiveStateStore();

    ArchiveStateStore(const ArchiveStateStore&) = delete;
    ArchiveStateStore& operator=(const ArchiveStateStore&) = delete;

    void upsert_processed(const ArchiveRecord& record);
    void upsert_failed(const std::string& path, double duration, const std::string& error);
    void remove_failed(const std::string& path);

    /// Paths whose current record has status "processed" or "deleted".
    [[nodiscard]] std::unordered_set<std::string> load_processed_paths() const;

    /// Paths of the failure store, sorted.
    [[nodiscard]] std::vector<std::string> load_failed_paths() const;

    [[nodiscard]] std::optional<ArchiveRecord> find_record(const std::string& path) const;
    [[nodiscard]] std::optional<FailureRecord> find_failure(const std::string& path) const;

    /// Every success-store row, ordered by path.
    [[nodiscard]] std::vector<ArchiveRecord> load_records() const;

    /**
     * @brief Deletes both database files (with their WAL side files).
     * @throws StateStoreError if a file exists and can't be removed.
     */
    static void reset(const std::filesystem::path& success_db, const std::filesystem::path& failure_db);

    [[nodiscard]] StoreMode mode() const noexcept { return mode_; }

private:
    void require_writable(const char* operation) const;

    StoreMode mode_;
    sqlite3* success_ = nullptr;
    sqlite3* failure_ = nullptr;
};

} // namespace cbzxl

#endif // CBZXL_STATE_STORE_HPP
