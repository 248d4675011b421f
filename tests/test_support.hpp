#ifndef CBZXL_TEST_SUPPORT_HPP
#define CBZXL_TEST_SUPPORT_HPP

#include "image_tools.hpp"
#include "mime_detector.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace cbzxl::test {

/// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

// file bodies with the right magic numbers, padded to @p size bytes
std::string jpeg_bytes(std::size_t size);
std::string png_bytes(std::size_t size);
std::string jxl_bytes(std::size_t size);
std::string webp_bytes(std::size_t size);
std::string gif_bytes(std::size_t size);
std::string text_bytes(std::size_t size);

void write_file(const std::filesystem::path& path, const std::string& content);
std::string read_file(const std::filesystem::path& path);

/// Sorted relative paths of every regular file below @p root.
std::vector<std::string> list_tree(const std::filesystem::path& root);

/**
 * @brief Sniffs by magic number, like libmagic would for these bodies.
 */
class FakeMimeDetector final : public IMimeDetector {
public:
    [[nodiscard]] std::string detect(const std::filesystem::path& path) const override;

    /// Report JPEG XL files as application/octet-stream (old magic databases).
    bool jxl_as_octet_stream = false;
    mutable std::atomic<int> calls{0};
};

/**
 * @brief Scriptable stand-in for cjxl and ImageMagick.
 *
 * encode() writes a JPEG XL body of ratio * input size.
 */
class FakeImageTools final : public IImageTools {
public:
    [[nodiscard]] ProcessResult encode(const std::filesystem::path& input,
                                       const std::filesystem::path& output,
                                       int effort,
                                       bool allow_reconstruction) const override;
    [[nodiscard]] ProcessResult detect_colorspace(const std::filesystem::path& path) const override;
    [[nodiscard]] ProcessResult strip_color_profile(const std::filesystem::path& path) const override;
    [[nodiscard]] ProcessResult convert_colorspace_to_srgb(const std::filesystem::path& path) const override;
    [[nodiscard]] std::string version() const override { return "cjxl fake v0.11"; }

    double ratio = 0.5;
    std::string colorspace = "sRGB";
    bool strip_fails = false;
    bool write_partial_on_failure = true;
    std::set<std::string> reconstruction_error_names;  ///< Fail with allow_reconstruction=true
    std::set<std::string> timeout_names;
    std::set<std::string> failing_names;
    std::set<std::string> empty_output_names;

    mutable std::atomic<int> encode_calls{0};
    mutable std::atomic<int> retry_calls{0};       ///< Calls with allow_reconstruction=false
    mutable std::atomic<int> strip_calls{0};
    mutable std::atomic<int> colorspace_calls{0};
    mutable std::atomic<int> srgb_calls{0};

    [[nodiscard]] std::vector<int> efforts_seen() const;

private:
    mutable std::mutex mtx_;
    mutable std::vector<int> efforts_;
};

} // namespace cbzxl::test

#endif // CBZXL_TEST_SUPPORT_HPP
