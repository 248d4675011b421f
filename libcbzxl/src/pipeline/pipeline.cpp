#include "../../include/pipeline.hpp"
#include "../../include/archive_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/flattener.hpp"
#include "../../include/logger.hpp"
#include "../../include/working_tree.hpp"
#include <algorithm>
#include <unordered_set>

namespace fs = std::filesystem;

namespace cbzxl {

static const char* pipeline_tag() {
    return "Pipeline";
}

std::string_view state_to_string(const ArchiveState state) noexcept {
    switch (state) {
        case ArchiveState::Scanned: return "Scanned";
        case ArchiveState::Skipped: return "Skipped";
        case ArchiveState::Extracted: return "Extracted";
        case ArchiveState::Classified: return "Classified";
        case ArchiveState::Converting: return "Converting";
        case ArchiveState::Flattening: return "Flattening";
        case ArchiveState::Repacking: return "Repacking";
        case ArchiveState::Committed: return "Committed";
        case ArchiveState::DeletedEmpty: return "DeletedEmpty";
        case ArchiveState::Failed: return "Failed";
    }
    return "Unknown";
}

PipelineOrchestrator::PipelineOrchestrator(const RunConfig& config,
                                           const IMimeDetector& detector,
                                           const IImageTools& tools,
                                           ArchiveStateStore& store,
                                           EventBus& bus)
    : config_(config),
      store_(store),
      event_bus_(bus),
      classifier_(detector, config.dry_run),
      encoder_(tools, detector, config.effort),
      pool_(config.threads),
      tool_version_(tools.version()) {
    Logger::log(LogLevel::Debug, "Encoder version: " + tool_version_ + ", " +
                std::to_string(pool_.size()) + " image workers", pipeline_tag());
}

void PipelineOrchestrator::request_stop() noexcept {
    stop_flag_.store(true, std::memory_order_relaxed);
}

void PipelineOrchestrator::transition(ArchiveReport& report, const ArchiveState next) const {
    Logger::log(LogLevel::Debug, report.relative + ": " + std::string(state_to_string(report.state)) + " -> " +
                std::string(state_to_string(next)), pipeline_tag());
    report.state = next;
}

RunStats PipelineOrchestrator::run() {
    RunStats stats;
    stats.dry_run = config_.dry_run;
    const auto start = std::chrono::steady_clock::now();

    const std::vector<ArchiveEntry> entries = ArchiveScanner::scan(config_.input_dir);
    stats.found = entries.size();

    std::vector<const ArchiveEntry*> selected;
    if (config_.reprocess_failed) {
        const std::vector<std::string> failed = store_.load_failed_paths();
        const std::unordered_set<std::string> wanted(failed.begin(), failed.end());
        std::unordered_set<std::string> present;
        for (const auto& e : entries) {
            if (wanted.contains(e.relative)) {
                selected.push_back(&e);
                present.insert(e.relative);
            }
        }
        for (const auto& path : failed) {
            if (!present.contains(path)) {
                Logger::log(LogLevel::Warning, "Previously failed archive not found: " + path, pipeline_tag());
            }
        }
        Logger::log(LogLevel::Info, "Reprocessing " + std::to_string(selected.size()) +
                    " previously failed archives", pipeline_tag());
    } else {
        std::unordered_set<std::string> done;
        if (!config_.recheck_all) {
            done = store_.load_processed_paths();
        }
        for (const auto& e : entries) {
            if (done.contains(e.relative)) {
                ++stats.skipped;
                Logger::log(LogLevel::Debug, "Skipping " + e.relative + " (already processed)", pipeline_tag());
                event_bus_.publish(ArchiveSkippedEvent{e.relative, "already processed"});
                continue;
            }
            selected.push_back(&e);
        }
        if (stats.skipped > 0) {
            Logger::log(LogLevel::Info, "Skipping " + std::to_string(stats.skipped) +
                        " already processed archives", pipeline_tag());
        }
    }
    stats.selected = selected.size();

    for (std::size_t i = 0; i < selected.size(); ++i) {
        if (is_stopped()) {
            Logger::log(LogLevel::Warning, "Interrupted, " + std::to_string(selected.size() - i) +
                        " archives left untouched", pipeline_tag());
            break;
        }
        const ArchiveEntry& entry = *selected[i];

        if (config_.reprocess_failed && !config_.dry_run) {
            try {
                store_.remove_failed(entry.relative);
            } catch (const StateStoreError& e) {
                Logger::log(LogLevel::Warning, "Can't clear failure record of " + entry.relative + ": " + e.what(),
                            pipeline_tag());
            }
        }

        event_bus_.publish(ArchiveStartEvent{entry.relative, i + 1, selected.size()});
        const ArchiveReport report = process_archive(entry);

        stats.images_converted += report.images_converted;
        stats.images_failed += report.images_failed;
        switch (report.state) {
            case ArchiveState::Committed:
                ++stats.processed;
                if (report.images_converted > 0) ++stats.converted;
                if (report.flattened) ++stats.flattened;
                stats.bytes_saved += report.record.bytes_saved;
                break;
            case ArchiveState::DeletedEmpty:
                ++stats.deleted;
                stats.bytes_saved += report.record.bytes_saved;
                break;
            case ArchiveState::Failed:
                ++stats.failed;
                break;
            default:
                break;
        }
    }

    stats.interrupted = is_stopped();
    stats.elapsed = std::chrono::steady_clock::now() - start;
    return stats;
}

ArchiveReport PipelineOrchestrator::process_archive(const ArchiveEntry& entry) {
    ArchiveReport report;
    report.relative = entry.relative;

    ArchiveRecord& record = report.record;
    record.path = entry.relative;
    record.original_size = static_cast<std::int64_t>(entry.size);
    record.final_size = record.original_size;
    record.effort = config_.effort;
    record.tool_version = tool_version_;

    const auto start = std::chrono::steady_clock::now();
    const auto elapsed_seconds = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    Logger::log(LogLevel::Debug, "Processing " + entry.relative + " (" +
                format_bytes(record.original_size) + ")", pipeline_tag());

    try {
        const WorkingTree tree(entry.path);
        ArchiveProcessor::extract(entry.path, tree.root());
        tree.remove_leftovers();
        transition(report, ArchiveState::Extracted);

        const Classification classification = classifier_.classify(tree.root());
        transition(report, ArchiveState::Classified);
        record.dominant_type = classification.dominant_type;
        record.image_count = static_cast<int>(classification.image_count());
        record.jpg_count = static_cast<int>(classification.jpg_count);
        record.png_count = static_cast<int>(classification.png_count);

        std::visit(overloaded{
            [&](const HasConvertibles&) {
                handle_convertibles(entry, tree.root(), classification, report);
            },
            [&](const outcome::AlreadyTargetFormat& o) {
                Logger::log(LogLevel::Info, "Already JPEG XL, nothing to convert", pipeline_tag());
                report.outcome = o;
            },
            [&](const outcome::OtherFormatsOnly& o) {
                Logger::log(LogLevel::Info, "No jpeg/png members, only other formats (mostly " +
                            o.majority_extension + ")", pipeline_tag());
                report.outcome = o;
            },
            [&](const outcome::NoImagesRecognized& o) {
                Logger::log(LogLevel::Info, "No images recognized", pipeline_tag());
                report.outcome = o;
                if (config_.delete_empty_archives) {
                    delete_empty(entry, report);
                }
            }
        }, classification.decision);

        record.outcome = std::string(outcome_label(*report.outcome));
        record.percent_saved = record.original_size > 0
            ? static_cast<double>(record.bytes_saved) * 100.0 / static_cast<double>(record.original_size)
            : 0.0;
        record.duration = elapsed_seconds();
        record.timestamp = current_timestamp();
        if (report.images_skipped > 0) {
            report.error = std::string(is_stopped() ? "interrupted" : "archive time budget exhausted") + ", " +
                           std::to_string(report.images_skipped) + " images not attempted";
            transition(report, ArchiveState::Failed);
        } else if (report.state != ArchiveState::DeletedEmpty) {
            transition(report, ArchiveState::Committed);
        }
    } catch (const std::exception& e) {
        report.error = e.what();
        report.outcome.reset();
        report.images_converted = 0;
        report.flattened = false;
        report.repacked = false;
        transition(report, ArchiveState::Failed);

        record.status = ArchiveStatus::Failed;
        record.outcome.clear();
        record.final_size = record.original_size;
        record.bytes_saved = 0;
        record.percent_saved = 0.0;
        record.error_message = report.error;
        record.duration = elapsed_seconds();
        record.timestamp = current_timestamp();

        Logger::log(LogLevel::Error, "Failed " + entry.relative + ": " + report.error, pipeline_tag());
        persist_failure(report);
        event_bus_.publish(ArchiveErrorEvent{entry.relative, report.error});
        return report;
    }

    // whatever was converted is already repacked; the next run picks up the rest
    if (report.state == ArchiveState::Failed) {
        record.status = ArchiveStatus::Failed;
        record.error_message = report.error;
        Logger::log(LogLevel::Warning, entry.relative + " left unfinished (" + report.error + "), will be retried",
                    pipeline_tag());
        persist_failure(report);
        event_bus_.publish(ArchiveErrorEvent{entry.relative, report.error});
        return report;
    }

    Logger::log(LogLevel::Info, entry.relative + ": " + record.outcome + ", " +
                format_bytes(record.original_size) + " -> " + format_bytes(record.final_size) +
                " (saved " + format_bytes(record.bytes_saved) + ")", pipeline_tag());
    persist(report);

    ArchiveCompleteEvent done;
    done.relative = entry.relative;
    done.status = record.status;
    done.outcome = record.outcome;
    done.original_size = static_cast<std::uintmax_t>(record.original_size);
    done.final_size = static_cast<std::uintmax_t>(record.final_size);
    done.bytes_saved = record.bytes_saved;
    done.repacked = report.repacked;
    done.flattened = report.flattened;
    event_bus_.publish(done);
    return report;
}

void PipelineOrchestrator::handle_convertibles(const ArchiveEntry& entry,
                                               const fs::path& tree_root,
                                               const Classification& classification,
                                               ArchiveReport& report) {
    ArchiveRecord& record = report.record;

    std::int64_t saved = 0;
    if (config_.convert) {
        transition(report, ArchiveState::Converting);
        saved = convert_members(classification, report);
    } else {
        Logger::log(LogLevel::Info, "Conversion disabled, " +
                    std::to_string(classification.jpg_count + classification.png_count) +
                    " jpeg/png members left as they are", pipeline_tag());
    }

    bool moved = false;
    if (config_.flatten && Flattener::has_subdirectories(tree_root)) {
        transition(report, ArchiveState::Flattening);
        const FlattenPlan plan = Flattener::plan(tree_root);
        if (config_.dry_run) {
            for (const auto& m : plan.moves) {
                Logger::log(LogLevel::Debug, "Would move " + relative_key(tree_root, m.from) + " -> " +
                            m.to.filename().string(), pipeline_tag());
            }
            if (!plan.empty()) {
                Logger::log(LogLevel::Info, "Would flatten " + std::to_string(plan.moves.size()) + " files",
                            pipeline_tag());
            }
            moved = !plan.empty();
        } else {
            moved = Flattener::apply(tree_root, plan);
        }
        report.flattened = moved;
    }

    if (report.images_converted > 0 || moved) {
        transition(report, ArchiveState::Repacking);
        if (config_.dry_run) {
            record.final_size = std::max<std::int64_t>(0, record.original_size - saved);
            Logger::log(LogLevel::Info, "Would repack " + entry.path.filename().string() +
                        " (estimated " + format_bytes(record.final_size) + ")", pipeline_tag());
        } else {
            ArchiveProcessor::repack(tree_root, entry.path, config_.backup);
            record.final_size = static_cast<std::int64_t>(safe_file_size(entry.path));
        }
        report.repacked = true;
    }

    record.bytes_saved = saved;
    if (report.images_converted == 0) {
        report.outcome = outcome::NoEligibleFormat{};
    } else if (saved > 0) {
        report.outcome = outcome::SavedSpace{saved};
    } else {
        report.outcome = outcome::NoSpaceSaved{saved};
    }
}

std::int64_t PipelineOrchestrator::convert_members(const Classification& classification, ArchiveReport& report) {
    std::vector<const ImageMember*> todo;
    for (const auto& m : classification.members) {
        if (m.category == ImageCategory::Convertible) {
            todo.push_back(&m);
        }
    }

    // each member gets its own output name before dispatch, so workers never race on one
    std::unordered_set<std::string> reserved;
    std::vector<fs::path> outputs;
    outputs.reserve(todo.size());
    for (const ImageMember* m : todo) {
        const fs::path dir = m->path.parent_path();
        const std::string name = make_unique_name(m->path.stem().string() + ".jxl", [&](const std::string& candidate) {
            const fs::path p = dir / candidate;
            std::error_code ec;
            return reserved.contains(p.string()) || fs::exists(p, ec);
        });
        reserved.insert((dir / name).string());
        outputs.push_back(dir / name);
    }

    std::int64_t saved = 0;

    if (config_.dry_run) {
        for (std::size_t i = 0; i < todo.size(); ++i) {
            const MemberResult r = JxlEncoder::estimate(*todo[i], outputs[i]);
            if (r.converted) {
                ++report.images_converted;
                saved += r.bytes_saved;
            }
        }
        Logger::log(LogLevel::Info, "Would convert " + std::to_string(report.images_converted) + " images, saving ~" +
                    format_bytes(saved), pipeline_tag());
        return saved;
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.archive_timeout;
    ResultChannel<MemberResult> channel;
    std::size_t dispatched = 0;

    try {
        for (std::size_t i = 0; i < todo.size(); ++i) {
            const ImageMember& member = *todo[i];
            const fs::path output = outputs[i];
            pool_.enqueue([this, &channel, &member, output, deadline](const std::stop_token& st) {
                MemberResult result;
                if (st.stop_requested() || is_stopped() || std::chrono::steady_clock::now() >= deadline) {
                    result.source = member.path;
                    result.output = output;
                    result.kind = member.kind;
                    result.original_size = member.size_before;
                    result.skipped = true;
                    channel.push(std::move(result));
                    return;
                }
                try {
                    result = encoder_.convert(member, output);
                } catch (const std::exception& e) {
                    result.source = member.path;
                    result.output = output;
                    result.kind = member.kind;
                    result.original_size = member.size_before;
                    result.error = e.what();
                    Logger::log(LogLevel::Error, "Conversion of " + member.path.filename().string() +
                                " failed: " + result.error, pipeline_tag());
                }
                channel.push(std::move(result));
            });
            ++dispatched;
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Can't dispatch image tasks: " + std::string(e.what()), pipeline_tag());
    }

    std::size_t skipped = 0;
    for (std::size_t n = 0; n < dispatched; ++n) {
        const MemberResult r = channel.pop();
        if (r.skipped) {
            ++skipped;
        } else if (r.converted) {
            ++report.images_converted;
            saved += r.bytes_saved;
        } else if (!r.error.empty() || r.timed_out) {
            ++report.images_failed;
        }
    }
    pool_.wait_idle();

    report.images_skipped = skipped;
    if (skipped > 0) {
        Logger::log(LogLevel::Warning, std::to_string(skipped) + " images not attempted (" +
                    (is_stopped() ? "interrupted" : "archive time budget exhausted") + ")", pipeline_tag());
    }
    Logger::log(LogLevel::Info, "Converted " + std::to_string(report.images_converted) + "/" +
                std::to_string(todo.size()) + " images, saved " + format_bytes(saved), pipeline_tag());
    return saved;
}

void PipelineOrchestrator::delete_empty(const ArchiveEntry& entry, ArchiveReport& report) const {
    if (config_.dry_run) {
        Logger::log(LogLevel::Info, "Would delete " + entry.path.filename().string() + " (no images)", pipeline_tag());
    } else {
        if (config_.backup) {
            ArchiveProcessor::backup_copy(entry.path);
        }
        std::error_code ec;
        fs::remove(entry.path, ec);
        if (ec) {
            throw ArchiveError("Can't delete " + entry.path.string() + ": " + ec.message());
        }
        Logger::log(LogLevel::Info, "Deleted " + entry.path.filename().string() + " (no images)", pipeline_tag());
    }
    report.record.status = ArchiveStatus::Deleted;
    report.record.final_size = 0;
    report.record.bytes_saved = report.record.original_size;
    transition(report, ArchiveState::DeletedEmpty);
}

void PipelineOrchestrator::persist(const ArchiveReport& report) {
    if (config_.dry_run) return;
    try {
        store_.upsert_processed(report.record);
        store_.remove_failed(report.relative);
    } catch (const StateStoreError& e) {
        Logger::log(LogLevel::Error, "Can't record " + report.relative + ": " + e.what(), pipeline_tag());
    }
}

void PipelineOrchestrator::persist_failure(const ArchiveReport& report) {
    if (config_.dry_run) return;
    try {
        store_.upsert_failed(report.relative, report.record.duration, report.error);
        store_.upsert_processed(report.record);
    } catch (const StateStoreError& e) {
        Logger::log(LogLevel::Error, "Can't record failure of " + report.relative + ": " + e.what(), pipeline_tag());
    }
}

} // namespace cbzxl
