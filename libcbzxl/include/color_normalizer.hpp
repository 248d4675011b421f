#ifndef CBZXL_COLOR_NORMALIZER_HPP
#define CBZXL_COLOR_NORMALIZER_HPP

#include "image_tools.hpp"
#include "image_type.hpp"
#include <filesystem>

namespace cbzxl {

/**
 * @brief Best-effort colour fixes applied right before encoding.
 *
 * PNG: embedded profiles are stripped (malformed grayscale ICC profiles make
 * the encoder fail). JPEG: CMYK images are converted to sRGB in place.
 * Failures are logged as warnings; the caller encodes regardless.
 */
class ColorNormalizer {
public:
    explicit ColorNormalizer(const IImageTools& tools) : tools_(tools) {}

    /**
     * @return true if every applicable fix succeeded (or none applied).
     */
    bool normalize(const std::filesystem::path& path, ImageKind kind) const;

private:
    const IImageTools& tools_;
};

} // namespace cbzxl

#endif // CBZXL_COLOR_NORMALIZER_HPP
