/**
 * @file archive_processor.hpp
 * @brief Extraction and atomic repacking of comic archives (libarchive).
 */

#ifndef CBZXL_ARCHIVE_PROCESSOR_HPP
#define CBZXL_ARCHIVE_PROCESSOR_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace cbzxl {

/**
 * @brief Reads any archive format libarchive understands and always writes zip.
 *
 * @details A .cbz that is really a rar or 7z container is still extracted;
 * once repacked it becomes a proper deflate zip.
 */
class ArchiveProcessor {
public:
    /**
     * @brief Extracts every regular file of @p archive below @p dest_dir.
     *
     * Entries escaping @p dest_dir (absolute paths, "..") and links are
     * skipped with a warning.
     * @throws ArchiveError if the archive is unreadable or corrupt.
     */
    static void extract(const std::filesystem::path& archive, const std::filesystem::path& dest_dir);

    /**
     * @brief Writes a deflate zip containing every regular file of
     * @p src_dir, entries in natural order of their relative path.
     * @throws ArchiveError on any write failure (the partial file is removed).
     */
    static void write_zip(const std::filesystem::path& src_dir, const std::filesystem::path& out_path);

    /**
     * @brief Rebuilds @p original from @p tree_root and swaps it in place.
     *
     * The new archive is written to a temporary file in the same directory
     * and renamed over the original, so the original is never truncated.
     * @param backup Copy the original to "<name>.bak" before the swap.
     * @throws ArchiveError on failure; the original is left untouched.
     */
    static void repack(const std::filesystem::path& tree_root,
                       const std::filesystem::path& original,
                       bool backup);

    /**
     * @brief Copies @p archive to "<archive>.bak", overwriting an older backup.
     * @throws ArchiveError on failure.
     */
    static std::filesystem::path backup_copy(const std::filesystem::path& archive);

    /**
     * @brief Names of the regular-file entries of @p archive, in archive order.
     * @throws ArchiveError if the archive is unreadable.
     */
    [[nodiscard]] static std::vector<std::string> list_entries(const std::filesystem::path& archive);
};

} // namespace cbzxl

#endif // CBZXL_ARCHIVE_PROCESSOR_HPP
