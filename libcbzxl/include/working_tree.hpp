/**
 * @file working_tree.hpp
 * @brief Scoped extraction directory for one archive.
 */

#ifndef CBZXL_WORKING_TREE_HPP
#define CBZXL_WORKING_TREE_HPP

#include <filesystem>

namespace cbzxl {

/**
 * @brief Owns a fresh temporary directory; removes it on destruction,
 * whatever path the archive took through the pipeline.
 */
class WorkingTree {
public:
    /**
     * @param archive The archive this tree is created for (names the directory).
     * @throws ArchiveError if the directory can't be created.
     */
    explicit WorkingTree(const std::filesystem::path& archive);
    ~WorkingTree();

    WorkingTree(const WorkingTree&) = delete;
    WorkingTree& operator=(const WorkingTree&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// Removes stale "*.converted" leftovers of an interrupted run; returns how many.
    std::size_t remove_leftovers() const;

private:
    std::filesystem::path root_;
};

} // namespace cbzxl

#endif // CBZXL_WORKING_TREE_HPP
