#include "../../include/flattener.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace cbzxl {

static const char* flattener_tag() {
    return "Flattener";
}

// returns true if dir ended up removed
static bool prune_directory(const fs::path& dir) {
    std::error_code ec;
    std::vector<fs::path> subdirs;
    std::vector<fs::path> markers;
    bool has_content = false;

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::error_code sec;
        if (entry.is_directory(sec) && !entry.is_symlink(sec)) {
            subdirs.push_back(entry.path());
        } else if (is_metadata_marker(entry.path())) {
            markers.push_back(entry.path());
        } else {
            has_content = true;
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't list " + dir.string() + ": " + ec.message(), flattener_tag());
        return false;
    }

    for (const auto& sub : subdirs) {
        if (!prune_directory(sub)) has_content = true;
    }
    if (has_content) return false;

    for (const auto& marker : markers) {
        fs::remove(marker, ec);
    }
    fs::remove(dir, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't remove directory " + dir.string() + ": " + ec.message(), flattener_tag());
        return false;
    }
    return true;
}

bool Flattener::has_subdirectories(const fs::path& root) {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        std::error_code sec;
        if (entry.is_directory(sec)) return true;
    }
    return false;
}

FlattenPlan Flattener::plan(const fs::path& root) {
    FlattenPlan result;
    std::set<std::string> taken;
    std::vector<fs::path> nested;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        taken.insert(entry.path().filename().string());
    }

    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (it.depth() == 0 || !it->is_regular_file(fec)) continue;
        if (is_metadata_marker(it->path())) continue;
        nested.push_back(it->path());
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Incomplete listing of " + root.string() + ": " + ec.message(), flattener_tag());
    }

    std::sort(nested.begin(), nested.end(), [&](const fs::path& a, const fs::path& b) {
        return natural_less(relative_key(root, a), relative_key(root, b));
    });

    for (const auto& file : nested) {
        const std::string name = make_unique_name(file.filename().string(), [&](const std::string& n) {
            return taken.contains(n);
        });
        taken.insert(name);
        result.moves.push_back({file, root / name});
    }
    return result;
}

bool Flattener::apply(const fs::path& root, const FlattenPlan& plan) {
    bool moved_any = false;
    for (const auto& move : plan.moves) {
        std::error_code ec;
        fs::rename(move.from, move.to, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't move " + relative_key(root, move.from) + " to root: " + ec.message(),
                        flattener_tag());
            continue;
        }
        if (move.from.filename() != move.to.filename()) {
            Logger::log(LogLevel::Debug, "Name collision: " + relative_key(root, move.from) + " -> " +
                        move.to.filename().string(), flattener_tag());
        }
        moved_any = true;
    }
    prune_empty_directories(root);
    return moved_any;
}

bool Flattener::flatten(const fs::path& root) {
    return apply(root, plan(root));
}

void Flattener::prune_empty_directories(const fs::path& root) {
    std::error_code ec;
    std::vector<fs::path> subdirs;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        std::error_code sec;
        if (entry.is_directory(sec) && !entry.is_symlink(sec)) subdirs.push_back(entry.path());
    }
    for (const auto& sub : subdirs) {
        prune_directory(sub);
    }
}

} // namespace cbzxl
