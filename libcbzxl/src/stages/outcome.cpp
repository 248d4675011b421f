#include "../../include/outcome.hpp"
#include <stdexcept>

namespace cbzxl {

std::string_view outcome_label(const ConversionOutcome& outcome) {
    return std::visit(overloaded{
        [](const outcome::SavedSpace&) -> std::string_view { return "PROCESSED_SAVED_SPACE"; },
        [](const outcome::NoSpaceSaved&) -> std::string_view { return "PROCESSED_NO_SPACE_SAVED"; },
        [](const outcome::AlreadyTargetFormat&) -> std::string_view { return "ALREADY_JXL_NO_CONVERTIBLES"; },
        [](const outcome::NoEligibleFormat&) -> std::string_view { return "NO_JPG_PNG_FOUND"; },
        [](const outcome::OtherFormatsOnly&) -> std::string_view { return "CONTAIN_OTHER_FORMATS"; },
        [](const outcome::NoImagesRecognized&) -> std::string_view { return "NO_IMAGES_RECOGNIZED"; },
    }, outcome);
}

std::string_view status_to_string(const ArchiveStatus status) noexcept {
    switch (status) {
        case ArchiveStatus::Processed: return "processed";
        case ArchiveStatus::Failed:    return "failed";
        case ArchiveStatus::Deleted:   return "deleted";
    }
    return "failed";
}

ArchiveStatus status_from_string(const std::string_view text) {
    if (text == "processed") return ArchiveStatus::Processed;
    if (text == "failed")    return ArchiveStatus::Failed;
    if (text == "deleted")   return ArchiveStatus::Deleted;
    throw std::invalid_argument("unknown archive status: " + std::string(text));
}

} // namespace cbzxl
