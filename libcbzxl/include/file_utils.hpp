#ifndef CBZXL_FILE_UTILS_HPP
#define CBZXL_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace cbzxl {

    std::string to_lower_copy(std::string s);

    /**
     * @brief Random decimal suffix for temporary file and directory names.
     * The generator is thread-local.
     */
    std::string random_suffix();

    /**
     * @brief Creates a unique temporary directory for processing.
     *
     * Creates "{temp}/cbzxl-{prefix}/{prefix}_{stem}_{random}".
     *
     * @param input_path The input file path (used for its stem).
     * @param prefix A short prefix (e.g. "tree").
     * @return Path of the created directory, or an empty path on failure.
     */
    std::filesystem::path make_temp_dir_for(const std::filesystem::path &input_path,
                                            const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /// File size, or 0 when the file is missing or unreadable.
    std::uintmax_t safe_file_size(const std::filesystem::path &path) noexcept;

    /**
     * @brief Platform metadata files that never count as content
     * (.DS_Store, Thumbs.db, desktop.ini, AppleDouble "._*" files).
     */
    bool is_metadata_marker(const std::filesystem::path &path);

    /// Numeric-aware ordering, so "page2" sorts before "page10".
    bool natural_less(const std::string &a, const std::string &b);

    /// Path of @p p relative to @p root, with '/' separators.
    std::string relative_key(const std::filesystem::path &root, const std::filesystem::path &p);

    /**
     * @brief Returns @p filename, or "stem_N.ext" with the smallest N >= 1
     * for which @p taken returns false.
     */
    std::string make_unique_name(const std::string &filename,
                                 const std::function<bool(const std::string &)> &taken);

    /// Human-readable size ("1.50 MB"); negative values keep their sign.
    std::string format_bytes(std::int64_t bytes);

    /// Local time as "YYYY-MM-DD HH:MM:SS".
    std::string current_timestamp();

} // namespace cbzxl

#endif // CBZXL_FILE_UTILS_HPP
