#ifndef CBZXL_ARCHIVE_SCANNER_HPP
#define CBZXL_ARCHIVE_SCANNER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cbzxl {

/**
 * @brief One archive found under the scan root.
 */
struct ArchiveEntry {
    std::filesystem::path path;   ///< Absolute path on disk
    std::string relative;         ///< Identity: path relative to the root, '/' separated
    std::uintmax_t size = 0;
    std::filesystem::file_time_type mtime{};
};

class ArchiveScanner {
public:
    /**
     * @brief Every ".cbz" (any case) below @p root, in natural order of
     * the relative path.
     * @throws std::runtime_error if @p root is not a readable directory.
     */
    [[nodiscard]] static std::vector<ArchiveEntry> scan(const std::filesystem::path& root);

    [[nodiscard]] static bool is_archive(const std::filesystem::path& p);
};

} // namespace cbzxl

#endif // CBZXL_ARCHIVE_SCANNER_HPP
