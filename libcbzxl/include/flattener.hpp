/**
 * @file flattener.hpp
 * @brief Collapses nested directories of a working tree into its root.
 */

#ifndef CBZXL_FLATTENER_HPP
#define CBZXL_FLATTENER_HPP

#include <filesystem>
#include <vector>

namespace cbzxl {

struct FlattenMove {
    std::filesystem::path from;
    std::filesystem::path to;
};

/**
 * @brief Moves computed by Flattener::plan, in the order they are applied.
 */
struct FlattenPlan {
    std::vector<FlattenMove> moves;

    [[nodiscard]] bool empty() const noexcept { return moves.empty(); }
};

/**
 * @brief Flattens a working tree.
 *
 * Every non-metadata file below the root moves to the root. A name already
 * taken at the root (by a file, a directory or an earlier move) gets
 * "_1", "_2", ... before its extension. Files are taken in natural order of
 * their relative path, so the same tree always yields the same names.
 * Directories left holding only platform metadata markers are removed.
 */
class Flattener {
public:
    [[nodiscard]] static bool has_subdirectories(const std::filesystem::path& root);

    /// Computes the moves without touching the tree.
    [[nodiscard]] static FlattenPlan plan(const std::filesystem::path& root);

    /**
     * @brief Applies @p plan, then prunes emptied directories.
     *
     * A move that fails is logged and skipped.
     * @return true if at least one file was moved.
     */
    static bool apply(const std::filesystem::path& root, const FlattenPlan& plan);

    /// plan() + apply().
    static bool flatten(const std::filesystem::path& root);

    /**
     * @brief Removes every subdirectory of @p root that contains nothing but
     * metadata markers (recursively).
     */
    static void prune_empty_directories(const std::filesystem::path& root);
};

} // namespace cbzxl

#endif // CBZXL_FLATTENER_HPP
