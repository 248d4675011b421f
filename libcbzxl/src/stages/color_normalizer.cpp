#include "../../include/color_normalizer.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace cbzxl {

static std::string trimmed(std::string s) {
    const auto first = s.find_first_not_of(" \t\r\n'");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n'");
    return s.substr(first, last - first + 1);
}

static std::string failure_text(const ProcessResult& r) {
    if (!r.launched) return "could not start";
    if (r.timed_out) return "timed out";
    return "exit " + std::to_string(r.exit_code) + (r.err.empty() ? "" : ": " + trimmed(r.err));
}

bool ColorNormalizer::normalize(const std::filesystem::path& path, const ImageKind kind) const {
    const std::string name = path.filename().string();

    if (kind == ImageKind::Png) {
        const auto r = tools_.strip_color_profile(path);
        if (!r.ok()) {
            Logger::log(LogLevel::Warning, "Can't strip colour profile of " + name + " (" + failure_text(r) + ")",
                        "ColorNormalizer");
            return false;
        }
        return true;
    }

    if (kind == ImageKind::Jpeg) {
        const auto probe = tools_.detect_colorspace(path);
        if (!probe.ok()) {
            Logger::log(LogLevel::Warning, "Can't read colorspace of " + name + " (" + failure_text(probe) + ")",
                        "ColorNormalizer");
            return false;
        }
        if (trimmed(probe.out) != "CMYK") return true;

        const auto r = tools_.convert_colorspace_to_srgb(path);
        if (!r.ok()) {
            Logger::log(LogLevel::Warning, "Can't convert CMYK image " + name + " to sRGB (" + failure_text(r) + ")",
                        "ColorNormalizer");
            return false;
        }
        Logger::log(LogLevel::Debug, "Converted CMYK image to sRGB: " + name, "ColorNormalizer");
    }
    return true;
}

} // namespace cbzxl
