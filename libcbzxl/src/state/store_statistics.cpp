#include "../../include/store_statistics.hpp"

namespace cbzxl {

StoreStatistics summarize_records(const std::vector<ArchiveRecord>& records) {
    StoreStatistics s;
    s.total_records = records.size();

    const std::string already = std::string(outcome_label(outcome::AlreadyTargetFormat{}));
    const std::string other = std::string(outcome_label(outcome::OtherFormatsOnly{}));
    const std::string no_eligible = std::string(outcome_label(outcome::NoEligibleFormat{}));
    const std::string none = std::string(outcome_label(outcome::NoImagesRecognized{}));

    for (const auto& r : records) {
        ++s.by_status[std::string(status_to_string(r.status))];
        s.total_original += r.original_size;
        s.total_final += r.final_size;
        s.bytes_saved += r.bytes_saved;

        if (r.status == ArchiveStatus::Failed) {
            continue;
        }
        if (!r.outcome.empty()) {
            ++s.by_outcome[r.outcome];
        }
        if (r.status == ArchiveStatus::Processed && r.bytes_saved > 0) {
            s.saved_by_converted += r.bytes_saved;
        }
        if (r.outcome == already) {
            ++s.already_jxl;
        } else if (r.outcome == other || r.outcome == no_eligible || r.outcome == none) {
            ++s.other_formats;
        }
    }
    return s;
}

} // namespace cbzxl
