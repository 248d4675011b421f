#include "../../include/working_tree.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <vector>

namespace fs = std::filesystem;

namespace cbzxl {

WorkingTree::WorkingTree(const fs::path& archive)
    : root_(make_temp_dir_for(archive, "tree")) {
    if (root_.empty()) {
        throw ArchiveError("Can't create working directory for " + archive.filename().string());
    }
}

WorkingTree::~WorkingTree() {
    cleanup_temp_dir(root_, "WorkingTree");
}

std::size_t WorkingTree::remove_leftovers() const {
    std::vector<fs::path> stale;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root_, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code ec2;
        if (it->is_regular_file(ec2) && it->path().extension() == ".converted") {
            stale.push_back(it->path());
        }
    }

    std::size_t removed = 0;
    for (const auto& p : stale) {
        std::error_code rec;
        if (fs::remove(p, rec)) {
            ++removed;
            Logger::log(LogLevel::Debug, "Removed leftover " + p.filename().string(), "WorkingTree");
        } else if (rec) {
            Logger::log(LogLevel::Warning, "Can't remove leftover " + p.string() + ": " + rec.message(), "WorkingTree");
        }
    }
    return removed;
}

} // namespace cbzxl
