/**
 * @file jxl_encoder.hpp
 * @brief Converts one jpeg/png member to JPEG XL and measures the gain.
 */

#ifndef CBZXL_JXL_ENCODER_HPP
#define CBZXL_JXL_ENCODER_HPP

#include "color_normalizer.hpp"
#include "content_classifier.hpp"
#include "image_tools.hpp"
#include "mime_detector.hpp"
#include <cstdint>
#include <filesystem>
#include <string>

namespace cbzxl {

/**
 * @brief Outcome of a single encoder invocation.
 */
struct EncodeAttempt {
    bool ok = false;
    std::filesystem::path produced;  ///< Output path (may not exist on failure)
    std::string error;               ///< Encoder stderr, or a short reason
    bool timed_out = false;
};

/**
 * @brief Result of converting one member; returned by image workers.
 */
struct MemberResult {
    std::filesystem::path source;
    std::filesystem::path output;
    ImageKind kind = ImageKind::Unknown;
    std::uintmax_t original_size = 0;
    std::uintmax_t encoded_size = 0;
    std::int64_t bytes_saved = 0;   ///< original - encoded when converted, else 0
    bool converted = false;         ///< Source replaced by the JPEG XL output
    bool timed_out = false;
    bool skipped = false;           ///< Never attempted (interrupt or archive budget)
    std::string error;
};

class JxlEncoder {
public:
    /// Substring of the cjxl error that triggers the retry without reconstruction data.
    static constexpr const char* kReconstructionError = "bitstream reconstruction data could not be created";

    /// Dry-run estimate of the saved fraction per source format.
    static constexpr double kEstimatedJpegGain = 0.20;
    static constexpr double kEstimatedPngGain = 0.35;

    JxlEncoder(const IImageTools& tools, const IMimeDetector& detector, int effort);

    /**
     * @brief Runs the encoder once.
     * @param allow_reconstruction false adds the flag disabling JPEG reconstruction data.
     */
    [[nodiscard]] EncodeAttempt encode(const std::filesystem::path& input,
                                       const std::filesystem::path& output,
                                       bool allow_reconstruction) const;

    /**
     * @brief Full per-member conversion: MIME recheck, colour fixes, encode,
     * one retry on the reconstruction error, and replacement of the source.
     *
     * The JPEG XL output is kept only when strictly smaller than the source.
     * Never throws for encoder problems; they end up in MemberResult::error.
     */
    [[nodiscard]] MemberResult convert(const ImageMember& member,
                                       const std::filesystem::path& output) const;

    /// What convert() would save, without touching the file.
    [[nodiscard]] static MemberResult estimate(const ImageMember& member,
                                               const std::filesystem::path& output);

private:
    const IImageTools& tools_;
    const IMimeDetector& detector_;
    ColorNormalizer normalizer_;
    int effort_;
};

} // namespace cbzxl

#endif // CBZXL_JXL_ENCODER_HPP
