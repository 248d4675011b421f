/**
 * @file outcome.hpp
 * @brief Archive-level conversion outcome.
 *
 * The outcome is a closed set of alternatives held in a std::variant, so
 * every consumer visits all of them; adding an alternative breaks the build
 * of any std::visit that forgot it.
 */

#ifndef CBZXL_OUTCOME_HPP
#define CBZXL_OUTCOME_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cbzxl {

namespace outcome {

/// At least one member was converted and the archive shrank.
struct SavedSpace {
    std::int64_t bytes_saved = 0;
};

/// Members were converted but the sum of their deltas is not positive.
struct NoSpaceSaved {
    std::int64_t bytes_saved = 0;
};

/// Every recognized image is already JPEG XL.
struct AlreadyTargetFormat {};

/// jpeg/png members were found but none of them could be converted.
struct NoEligibleFormat {};

/// Only other known image formats (webp, avif, gif, ...) are present.
struct OtherFormatsOnly {
    std::string majority_extension; ///< Most common extension among them, for the log
};

/// Nothing inside the archive was recognized as an image.
struct NoImagesRecognized {};

} // namespace outcome

using ConversionOutcome = std::variant<outcome::SavedSpace,
                                       outcome::NoSpaceSaved,
                                       outcome::AlreadyTargetFormat,
                                       outcome::NoEligibleFormat,
                                       outcome::OtherFormatsOnly,
                                       outcome::NoImagesRecognized>;

/// Helper to build a visitor out of lambdas.
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

/// Label persisted in the success store ("PROCESSED_SAVED_SPACE", ...).
[[nodiscard]] std::string_view outcome_label(const ConversionOutcome& outcome);

/**
 * @brief Persisted status of an archive record.
 */
enum class ArchiveStatus {
    Processed,
    Failed,
    Deleted
};

[[nodiscard]] std::string_view status_to_string(ArchiveStatus status) noexcept;
[[nodiscard]] ArchiveStatus status_from_string(std::string_view text);

} // namespace cbzxl

#endif // CBZXL_OUTCOME_HPP
