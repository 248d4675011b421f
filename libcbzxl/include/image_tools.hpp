/**
 * @file image_tools.hpp
 * @brief External image capabilities: JPEG XL encoder and ImageMagick helpers.
 */

#ifndef CBZXL_IMAGE_TOOLS_HPP
#define CBZXL_IMAGE_TOOLS_HPP

#include "process_runner.hpp"
#include "run_config.hpp"
#include <chrono>
#include <filesystem>
#include <string>

namespace cbzxl {

/**
 * @brief Interface over the external programs the pipeline delegates to.
 *
 * Implementations must be safe to call from several image workers at once.
 * Every call is bounded by a timeout and reports failures through the
 * returned ProcessResult instead of throwing.
 */
class IImageTools {
public:
    virtual ~IImageTools() = default;

    /**
     * @brief Encodes @p input into a JPEG XL file at @p output.
     * @param effort Encoder effort, 0-10.
     * @param allow_reconstruction When false, JPEG bitstream reconstruction
     * data is explicitly disabled.
     */
    [[nodiscard]] virtual ProcessResult encode(const std::filesystem::path& input,
                                               const std::filesystem::path& output,
                                               int effort,
                                               bool allow_reconstruction) const = 0;

    /// Prints the colorspace name (e.g. "sRGB", "CMYK", "Gray") on stdout.
    [[nodiscard]] virtual ProcessResult detect_colorspace(const std::filesystem::path& path) const = 0;

    /// Strips embedded profiles (ICC, EXIF, ...) in place.
    [[nodiscard]] virtual ProcessResult strip_color_profile(const std::filesystem::path& path) const = 0;

    /// Converts the image to sRGB in place.
    [[nodiscard]] virtual ProcessResult convert_colorspace_to_srgb(const std::filesystem::path& path) const = 0;

    /// Encoder version fingerprint stored with every archive record.
    [[nodiscard]] virtual std::string version() const = 0;
};

/**
 * @brief IImageTools backed by `cjxl` and ImageMagick's `magick`.
 */
class CommandLineImageTools final : public IImageTools {
public:
    explicit CommandLineImageTools(const RunConfig& config);

    /**
     * @brief Checks that every required program is reachable through PATH.
     * @throws ToolMissingError naming all the missing programs.
     */
    static void verify_available();

    [[nodiscard]] ProcessResult encode(const std::filesystem::path& input,
                                       const std::filesystem::path& output,
                                       int effort,
                                       bool allow_reconstruction) const override;
    [[nodiscard]] ProcessResult detect_colorspace(const std::filesystem::path& path) const override;
    [[nodiscard]] ProcessResult strip_color_profile(const std::filesystem::path& path) const override;
    [[nodiscard]] ProcessResult convert_colorspace_to_srgb(const std::filesystem::path& path) const override;
    [[nodiscard]] std::string version() const override;

private:
    std::chrono::milliseconds tool_timeout_;
    std::chrono::milliseconds encode_timeout_;
};

} // namespace cbzxl

#endif // CBZXL_IMAGE_TOOLS_HPP
