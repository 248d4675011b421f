#include "../../include/content_classifier.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <map>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace cbzxl {

static const char* classifier_tag() {
    return "Classifier";
}

// older magic databases report JPEG XL as application/octet-stream
static bool has_jxl_signature(const fs::path& path) {
    static constexpr std::array<unsigned char, 12> kContainer = {
        0x00, 0x00, 0x00, 0x0C, 'J', 'X', 'L', ' ', 0x0D, 0x0A, 0x87, 0x0A
    };
    std::ifstream in(path, std::ios::binary);
    std::array<unsigned char, 12> head{};
    in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    const auto got = static_cast<size_t>(in.gcount());
    if (got >= 2 && head[0] == 0xFF && head[1] == 0x0A) return true;
    return got == head.size() && head == kContainer;
}

ContentClassifier::ContentClassifier(const IMimeDetector& detector, const bool dry_run)
    : detector_(detector), dry_run_(dry_run) {}

ImageKind ContentClassifier::sniff(const fs::path& path, std::string& mime) const {
    mime = detector_.detect(path);
    const ImageKind kind = kind_from_mime(mime);
    if (kind == ImageKind::Unknown && (mime.empty() || mime == "application/octet-stream")) {
        if (has_jxl_signature(path)) {
            mime = "image/jxl";
            return ImageKind::Jxl;
        }
    }
    return kind;
}

std::string ContentClassifier::dominant_type(const std::size_t jpg_count, const std::size_t png_count) {
    if (jpg_count > png_count) return "JPG";
    if (png_count > jpg_count) return "PNG";
    if (jpg_count > 0) return "Mixed";
    return "N/A";
}

Classification ContentClassifier::classify(const fs::path& tree_root) const {
    Classification result;

    std::vector<fs::path> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(tree_root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec) && !is_metadata_marker(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Incomplete listing of " + tree_root.string() + ": " + ec.message(),
                    classifier_tag());
    }
    std::sort(files.begin(), files.end(), [&](const fs::path& a, const fs::path& b) {
        return natural_less(relative_key(tree_root, a), relative_key(tree_root, b));
    });

    // names present in each directory, kept up to date so dry-run renames see each other
    std::map<fs::path, std::set<std::string>> names_by_dir;
    auto names_in = [&](const fs::path& dir) -> std::set<std::string>& {
        auto [it, inserted] = names_by_dir.try_emplace(dir);
        if (inserted) {
            std::error_code dec;
            for (const auto& entry : fs::directory_iterator(dir, dec)) {
                it->second.insert(entry.path().filename().string());
            }
        }
        return it->second;
    };

    std::map<std::string, std::size_t> other_extensions;

    for (const auto& file : files) {
        ImageMember member;
        member.path = file;
        try {
            member.size_before = safe_file_size(file);
            member.kind = sniff(file, member.mime);
            member.category = category_of(member.kind);

            if (member.kind != ImageKind::Unknown &&
                !extension_matches(member.kind, file.extension().string())) {
                auto& names = names_in(file.parent_path());
                const std::string wanted = file.stem().string() + std::string(canonical_extension(member.kind));
                const std::string target = make_unique_name(wanted, [&](const std::string& n) {
                    return names.contains(n);
                });
                const fs::path target_path = file.parent_path() / target;

                std::error_code rec;
                if (!dry_run_) {
                    fs::rename(file, target_path, rec);
                }
                if (rec) {
                    Logger::log(LogLevel::Warning, "Can't correct extension of " + file.filename().string() +
                                " (" + rec.message() + ")", classifier_tag());
                } else {
                    Logger::log(LogLevel::Info, std::string(dry_run_ ? "Would correct" : "Corrected") +
                                " extension: " + file.filename().string() + " -> " + target, classifier_tag());
                    names.erase(file.filename().string());
                    names.insert(target);
                    member.path = target_path;
                    ++result.renamed_count;
                }
            }
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warning, "Can't classify " + file.filename().string() + ": " + e.what(),
                        classifier_tag());
            member.kind = ImageKind::Unknown;
            member.category = ImageCategory::Unrecognized;
        }

        switch (member.category) {
            case ImageCategory::Convertible:
                if (member.kind == ImageKind::Jpeg) ++result.jpg_count;
                else ++result.png_count;
                break;
            case ImageCategory::Target:
                ++result.target_count;
                break;
            case ImageCategory::OtherKnown:
                ++result.other_count;
                ++other_extensions[std::string(canonical_extension(member.kind))];
                break;
            case ImageCategory::Unrecognized:
                ++result.unrecognized_count;
                Logger::log(LogLevel::Debug, "Unrecognized member (" +
                            (member.mime.empty() ? std::string("unknown") : member.mime) + "): " +
                            relative_key(tree_root, member.path), classifier_tag());
                break;
        }
        result.members.push_back(std::move(member));
    }

    result.dominant_type = dominant_type(result.jpg_count, result.png_count);

    if (result.jpg_count + result.png_count > 0) {
        result.decision = HasConvertibles{};
    } else if (result.other_count > 0) {
        std::string majority;
        std::size_t best = 0;
        for (const auto& [ext, count] : other_extensions) {
            if (count > best) {
                best = count;
                majority = ext;
            }
        }
        result.decision = outcome::OtherFormatsOnly{majority};
    } else if (result.target_count > 0) {
        result.decision = outcome::AlreadyTargetFormat{};
    } else {
        result.decision = outcome::NoImagesRecognized{};
    }

    Logger::log(LogLevel::Debug,
                "Classified " + std::to_string(result.members.size()) + " members: " +
                std::to_string(result.jpg_count) + " jpg, " + std::to_string(result.png_count) + " png, " +
                std::to_string(result.target_count) + " jxl, " + std::to_string(result.other_count) + " other, " +
                std::to_string(result.unrecognized_count) + " unrecognized",
                classifier_tag());
    return result;
}

} // namespace cbzxl
