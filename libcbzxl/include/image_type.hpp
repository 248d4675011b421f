/**
 * @file image_type.hpp
 * @brief Image kinds recognized inside an archive and how they map to
 * MIME types, extensions and conversion categories.
 */

#ifndef CBZXL_IMAGE_TYPE_HPP
#define CBZXL_IMAGE_TYPE_HPP

#include <string_view>

namespace cbzxl {

enum class ImageKind {
    Jpeg,
    Png,
    Jxl,
    Webp,
    Avif,
    Gif,
    Tiff,
    Bmp,
    Unknown
};

/**
 * @brief What the pipeline does with a member of a given kind.
 */
enum class ImageCategory {
    Convertible,  ///< jpeg / png, re-encoded to JPEG XL
    Target,       ///< already JPEG XL
    OtherKnown,   ///< webp, avif, gif, tiff, bmp: recognized, left alone
    Unrecognized  ///< anything else (metadata, text, unknown binaries)
};

/// Maps a sniffed MIME type ("image/jpeg") to a kind; Unknown when not an image we know.
[[nodiscard]] ImageKind kind_from_mime(std::string_view mime);

/// Maps a file extension (".JPEG", ".png", with the dot) to a kind, case-insensitive.
[[nodiscard]] ImageKind kind_from_extension(std::string_view ext);

[[nodiscard]] ImageCategory category_of(ImageKind kind) noexcept;

/// Extension written when a member is renamed to match its content (".jpg" for Jpeg).
[[nodiscard]] std::string_view canonical_extension(ImageKind kind) noexcept;

/// True if @p ext is an acceptable extension for @p kind (".jpeg" is fine for Jpeg).
[[nodiscard]] bool extension_matches(ImageKind kind, std::string_view ext);

[[nodiscard]] std::string_view kind_to_string(ImageKind kind) noexcept;

} // namespace cbzxl

#endif // CBZXL_IMAGE_TYPE_HPP
