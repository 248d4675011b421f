#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cbzxl {

    namespace {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        thread_local std::uniform_int_distribution<unsigned long long> dist;
    }

    std::string to_lower_copy(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }

    std::string random_suffix() {
        return std::to_string(dist(rng));
    }

    fs::path make_temp_dir_for(const fs::path& input_path, const std::string& prefix) {
        const auto base_tmp = fs::temp_directory_path() / ("cbzxl-" + prefix);

        std::error_code ec;
        fs::create_directories(base_tmp, ec);

        const std::string dir_name = prefix + "_" + input_path.stem().string() + "_" + random_suffix();
        auto dir = base_tmp / dir_name;

        fs::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            return {};
        }
        return dir;
    }

    void cleanup_temp_dir(const fs::path& dir, const std::string_view tag) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

    std::uintmax_t safe_file_size(const fs::path& path) noexcept {
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }

    bool is_metadata_marker(const fs::path& path) {
        const std::string name = to_lower_copy(path.filename().string());
        return name == ".ds_store" || name == "thumbs.db" || name == "desktop.ini" || name.starts_with("._");
    }

    bool natural_less(const std::string& sa, const std::string& sb) {
        size_t i = 0, j = 0;
        while (i < sa.size() && j < sb.size()) {
            if (std::isdigit(static_cast<unsigned char>(sa[i])) && std::isdigit(static_cast<unsigned char>(sb[j]))) {
                size_t ia = i, jb = j;
                while (ia < sa.size() && std::isdigit(static_cast<unsigned char>(sa[ia]))) ++ia;
                while (jb < sb.size() && std::isdigit(static_cast<unsigned char>(sb[jb]))) ++jb;
                auto strip_leading = [](const std::string& s) -> std::string {
                    size_t k = 0;
                    while (k + 1 < s.size() && s[k] == '0') ++k;
                    return s.substr(k);
                };
                const std::string as = strip_leading(sa.substr(i, ia - i));
                const std::string bs = strip_leading(sb.substr(j, jb - j));
                if (as.size() != bs.size()) return as.size() < bs.size();
                if (as != bs) return as < bs;
                i = ia; j = jb;
            } else {
                if (sa[i] != sb[j]) return sa[i] < sb[j];
                ++i; ++j;
            }
        }
        if (sa.size() - i != sb.size() - j) return sa.size() - i < sb.size() - j;
        return sa < sb;
    }

    std::string relative_key(const fs::path& root, const fs::path& p) {
        std::error_code ec;
        const auto rel = fs::relative(p, root, ec);
        std::string s = rel.generic_string();
        return (ec || s.empty()) ? p.filename().generic_string() : s;
    }

    std::string make_unique_name(const std::string& filename,
                                 const std::function<bool(const std::string&)>& taken) {
        if (!taken(filename)) return filename;

        const fs::path as_path(filename);
        const std::string stem = as_path.stem().string();
        const std::string ext = as_path.extension().string();
        for (unsigned n = 1;; ++n) {
            std::string candidate = stem + "_" + std::to_string(n) + ext;
            if (!taken(candidate)) return candidate;
        }
    }

    std::string format_bytes(const std::int64_t bytes) {
        static constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};
        double value = std::fabs(static_cast<double>(bytes));
        size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size()) {
            value /= 1024.0;
            ++unit;
        }
        std::ostringstream oss;
        if (bytes < 0) oss << '-';
        oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << ' ' << kUnits[unit];
        return oss.str();
    }

    std::string current_timestamp() {
        const std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);
        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

} // namespace cbzxl
