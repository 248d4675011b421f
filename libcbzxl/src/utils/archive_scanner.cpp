#include "../../include/archive_scanner.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cbzxl {

bool ArchiveScanner::is_archive(const fs::path& p) {
    const std::string name = p.filename().string();
    // hidden repack temporaries (".name.cbz.cbzxl-123.tmp") and AppleDouble files
    if (name.starts_with(".")) {
        return false;
    }
    return to_lower_copy(p.extension().string()) == ".cbz";
}

std::vector<ArchiveEntry> ArchiveScanner::scan(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        const std::string msg = "Input directory not found: " + root.string();
        Logger::log(LogLevel::Error, msg, "scanner");
        throw std::runtime_error(msg);
    }

    std::vector<ArchiveEntry> result;
    std::size_t unreadable = 0;

    // one directory_iterator per directory, so an unreadable subtree only costs that subtree
    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        const fs::path dir = pending.back();
        pending.pop_back();

        fs::directory_iterator it(dir, ec);
        if (ec) {
            if (dir == root) {
                const std::string msg = "Can't read " + root.string() + ": " + ec.message();
                Logger::log(LogLevel::Error, msg, "scanner");
                throw std::runtime_error(msg);
            }
            Logger::log(LogLevel::Warning, "Skipping unreadable directory " + dir.string() + ": " + ec.message(),
                        "scanner");
            ++unreadable;
            ec.clear();
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            std::error_code fec;
            if (it->is_directory(fec) && !it->is_symlink(fec)) {
                pending.push_back(it->path());
                continue;
            }
            if (!it->is_regular_file(fec) || !is_archive(it->path())) {
                continue;
            }
            ArchiveEntry entry;
            entry.path = it->path();
            entry.relative = relative_key(root, it->path());
            entry.size = safe_file_size(it->path());
            entry.mtime = fs::last_write_time(it->path(), fec);
            result.push_back(std::move(entry));
        }
        if (ec) {
            Logger::log(LogLevel::Warning, "Listing of " + dir.string() + " stopped early: " + ec.message(),
                        "scanner");
            ++unreadable;
            ec.clear();
        }
    }

    std::sort(result.begin(), result.end(), [](const ArchiveEntry& a, const ArchiveEntry& b) {
        return natural_less(a.relative, b.relative);
    });

    Logger::log(LogLevel::Info, "Scanner collected " + std::to_string(result.size()) + " archives" +
                (unreadable > 0 ? " (" + std::to_string(unreadable) + " directories unreadable)" : ""), "scanner");
    return result;
}

} // namespace cbzxl
