/**
 * @file content_classifier.hpp
 * @brief Sniffs every member of a working tree and decides what the archive needs.
 */

#ifndef CBZXL_CONTENT_CLASSIFIER_HPP
#define CBZXL_CONTENT_CLASSIFIER_HPP

#include "image_type.hpp"
#include "mime_detector.hpp"
#include "outcome.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cbzxl {

/**
 * @brief One file of a working tree, as seen by the classifier.
 */
struct ImageMember {
    std::filesystem::path path;             ///< Current location (after any extension fix)
    std::string mime;                       ///< Sniffed MIME type
    ImageKind kind = ImageKind::Unknown;
    ImageCategory category = ImageCategory::Unrecognized;
    std::uintmax_t size_before = 0;
    std::optional<std::uintmax_t> size_after; ///< Set once an encode was attempted
};

/// Classifier verdict: convert, or one of the outcomes that needs no encoding.
struct HasConvertibles {};

using ClassifierDecision = std::variant<HasConvertibles,
                                        outcome::AlreadyTargetFormat,
                                        outcome::OtherFormatsOnly,
                                        outcome::NoImagesRecognized>;

struct Classification {
    std::vector<ImageMember> members;   ///< Every non-metadata file, natural order
    std::size_t jpg_count = 0;
    std::size_t png_count = 0;
    std::size_t target_count = 0;
    std::size_t other_count = 0;
    std::size_t unrecognized_count = 0;
    std::size_t renamed_count = 0;      ///< Extension fixes applied (or planned in dry run)
    std::string dominant_type = "N/A";
    ClassifierDecision decision = outcome::NoImagesRecognized{};

    [[nodiscard]] std::size_t image_count() const noexcept {
        return jpg_count + png_count + target_count + other_count;
    }
};

/**
 * @brief Buckets working-tree members by sniffed content type.
 */
class ContentClassifier {
public:
    /**
     * @param detector Content sniffer.
     * @param dry_run When true, extension fixes are only planned and logged.
     */
    ContentClassifier(const IMimeDetector& detector, bool dry_run);

    /**
     * @brief Classifies every file under @p tree_root.
     *
     * Members whose extension disagrees with their content are renamed to
     * the canonical extension (collisions resolved with a numeric suffix).
     * Never throws: unreadable members count as unrecognized.
     */
    [[nodiscard]] Classification classify(const std::filesystem::path& tree_root) const;

    /// "JPG", "PNG", "Mixed" (equal and nonzero) or "N/A".
    [[nodiscard]] static std::string dominant_type(std::size_t jpg_count, std::size_t png_count);

private:
    [[nodiscard]] ImageKind sniff(const std::filesystem::path& path, std::string& mime) const;

    const IMimeDetector& detector_;
    bool dry_run_;
};

} // namespace cbzxl

#endif // CBZXL_CONTENT_CLASSIFIER_HPP
