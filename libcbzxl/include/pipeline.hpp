/**
 * @file pipeline.hpp
 * @brief Per-archive conversion pipeline and run driver.
 *
 * Archives are handled one at a time: Extract -> Classify -> Convert ->
 * Flatten -> Repack -> Persist. Inside one archive the members are encoded
 * by the ThreadPool and their results drained from a ResultChannel by the
 * orchestrator thread, which alone sums the deltas.
 */

#ifndef CBZXL_PIPELINE_HPP
#define CBZXL_PIPELINE_HPP

#include "archive_scanner.hpp"
#include "content_classifier.hpp"
#include "event_bus.hpp"
#include "image_tools.hpp"
#include "jxl_encoder.hpp"
#include "mime_detector.hpp"
#include "outcome.hpp"
#include "run_config.hpp"
#include "state_store.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cbzxl {

/**
 * @brief Where an archive is in its lifecycle.
 *
 * Committed, Skipped, Failed and DeletedEmpty are terminal.
 */
enum class ArchiveState {
    Scanned,
    Skipped,
    Extracted,
    Classified,
    Converting,
    Flattening,
    Repacking,
    Committed,
    DeletedEmpty,
    Failed
};

[[nodiscard]] std::string_view state_to_string(ArchiveState state) noexcept;

/**
 * @brief What happened to one archive.
 */
struct ArchiveReport {
    std::string relative;
    ArchiveState state = ArchiveState::Scanned;
    std::optional<ConversionOutcome> outcome;   ///< Unset for Skipped and Failed
    ArchiveRecord record;                       ///< Row persisted (or that would be, in dry run)
    std::size_t images_converted = 0;
    std::size_t images_failed = 0;
    std::size_t images_skipped = 0;             ///< Not attempted (stop or budget); the archive stays unfinished
    bool flattened = false;
    bool repacked = false;
    std::string error;
};

/**
 * @brief Aggregate statistics of one run.
 */
struct RunStats {
    std::size_t found = 0;            ///< Archives under the root
    std::size_t selected = 0;         ///< Archives considered (all, or the failed ones)
    std::size_t processed = 0;        ///< Committed
    std::size_t skipped = 0;
    std::size_t converted = 0;        ///< Committed with at least one member converted
    std::size_t flattened = 0;
    std::size_t deleted = 0;
    std::size_t failed = 0;
    std::size_t images_converted = 0;
    std::size_t images_failed = 0;
    std::int64_t bytes_saved = 0;     ///< Negative when the corpus grew
    std::chrono::duration<double> elapsed{0};
    bool dry_run = false;
    bool interrupted = false;
};

/**
 * @brief Drives every selected archive through the pipeline.
 */
class PipelineOrchestrator {
public:
    /**
     * @param config Immutable run configuration.
     * @param detector Content sniffer shared by classification and encoding.
     * @param tools External encoder and colour tools.
     * @param store Success and failure stores; never written in dry run.
     * @param bus Receives the per-archive events.
     */
    PipelineOrchestrator(const RunConfig& config,
                         const IMimeDetector& detector,
                         const IImageTools& tools,
                         ArchiveStateStore& store,
                         EventBus& bus);

    /**
     * @brief Scans the input directory and processes every selected archive.
     * @throws std::runtime_error if the input directory can't be scanned.
     */
    RunStats run();

    /**
     * @brief Runs one archive through the pipeline and persists its record.
     *
     * Never throws: any failure ends in ArchiveState::Failed.
     */
    ArchiveReport process_archive(const ArchiveEntry& entry);

    /**
     * @brief Stops after the current archive; image tasks not yet started
     * are skipped. Safe to call from another thread.
     */
    void request_stop() noexcept;

    [[nodiscard]] bool is_stopped() const noexcept {
        return stop_flag_.load(std::memory_order_relaxed);
    }

private:
    /// Convert, flatten and repack an archive holding jpeg/png members.
    void handle_convertibles(const ArchiveEntry& entry,
                             const std::filesystem::path& tree_root,
                             const Classification& classification,
                             ArchiveReport& report);

    /// Encodes (or estimates) every convertible member; returns the summed delta.
    std::int64_t convert_members(const Classification& classification, ArchiveReport& report);

    void delete_empty(const ArchiveEntry& entry, ArchiveReport& report) const;

    void transition(ArchiveReport& report, ArchiveState next) const;
    void persist(const ArchiveReport& report);
    void persist_failure(const ArchiveReport& report);

    const RunConfig& config_;
    ArchiveStateStore& store_;
    EventBus& event_bus_;
    ContentClassifier classifier_;
    JxlEncoder encoder_;
    ThreadPool pool_;
    std::string tool_version_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace cbzxl

#endif // CBZXL_PIPELINE_HPP
