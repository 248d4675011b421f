#include "../../include/image_type.hpp"
#include "../../include/file_utils.hpp"
#include <string>
#include <unordered_map>

namespace cbzxl {

namespace {

const std::unordered_map<std::string_view, ImageKind> mime_to_kind = {
    { "image/jpeg",       ImageKind::Jpeg },
    { "image/pjpeg",      ImageKind::Jpeg },
    { "image/png",        ImageKind::Png },
    { "image/jxl",        ImageKind::Jxl },
    { "image/webp",       ImageKind::Webp },
    { "image/avif",       ImageKind::Avif },
    { "image/gif",        ImageKind::Gif },
    { "image/tiff",       ImageKind::Tiff },
    { "image/bmp",        ImageKind::Bmp },
    { "image/x-ms-bmp",   ImageKind::Bmp },
    { "image/x-bmp",      ImageKind::Bmp },
};

const std::unordered_map<std::string_view, ImageKind> ext_to_kind = {
    { ".jpg",  ImageKind::Jpeg },
    { ".jpeg", ImageKind::Jpeg },
    { ".png",  ImageKind::Png },
    { ".jxl",  ImageKind::Jxl },
    { ".webp", ImageKind::Webp },
    { ".avif", ImageKind::Avif },
    { ".gif",  ImageKind::Gif },
    { ".tif",  ImageKind::Tiff },
    { ".tiff", ImageKind::Tiff },
    { ".bmp",  ImageKind::Bmp },
};

} // namespace

ImageKind kind_from_mime(const std::string_view mime) {
    const auto it = mime_to_kind.find(mime);
    return it != mime_to_kind.end() ? it->second : ImageKind::Unknown;
}

ImageKind kind_from_extension(const std::string_view ext) {
    const std::string lower = to_lower_copy(std::string(ext));
    const auto it = ext_to_kind.find(lower);
    return it != ext_to_kind.end() ? it->second : ImageKind::Unknown;
}

ImageCategory category_of(const ImageKind kind) noexcept {
    switch (kind) {
        case ImageKind::Jpeg:
        case ImageKind::Png:
            return ImageCategory::Convertible;
        case ImageKind::Jxl:
            return ImageCategory::Target;
        case ImageKind::Webp:
        case ImageKind::Avif:
        case ImageKind::Gif:
        case ImageKind::Tiff:
        case ImageKind::Bmp:
            return ImageCategory::OtherKnown;
        case ImageKind::Unknown:
            break;
    }
    return ImageCategory::Unrecognized;
}

std::string_view canonical_extension(const ImageKind kind) noexcept {
    switch (kind) {
        case ImageKind::Jpeg: return ".jpg";
        case ImageKind::Png:  return ".png";
        case ImageKind::Jxl:  return ".jxl";
        case ImageKind::Webp: return ".webp";
        case ImageKind::Avif: return ".avif";
        case ImageKind::Gif:  return ".gif";
        case ImageKind::Tiff: return ".tiff";
        case ImageKind::Bmp:  return ".bmp";
        case ImageKind::Unknown: break;
    }
    return "";
}

bool extension_matches(const ImageKind kind, const std::string_view ext) {
    if (kind == ImageKind::Unknown) return true;
    return kind_from_extension(ext) == kind;
}

std::string_view kind_to_string(const ImageKind kind) noexcept {
    switch (kind) {
        case ImageKind::Jpeg: return "jpeg";
        case ImageKind::Png:  return "png";
        case ImageKind::Jxl:  return "jxl";
        case ImageKind::Webp: return "webp";
        case ImageKind::Avif: return "avif";
        case ImageKind::Gif:  return "gif";
        case ImageKind::Tiff: return "tiff";
        case ImageKind::Bmp:  return "bmp";
        case ImageKind::Unknown: break;
    }
    return "unknown";
}

} // namespace cbzxl
