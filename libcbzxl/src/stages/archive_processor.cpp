#include "../../include/archive_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace cbzxl {

static const char* processor_tag() {
    return "ArchiveProcessor";
}

static std::string archive_error_text(archive* a) {
    const char* err = archive_error_string(a);
    return err ? err : "unknown libarchive error";
}

// sanitize a candidate archive entry path to avoid zip-slip
static bool sanitize_archive_entry_path(const std::string& entry_name, const fs::path& dest_dir, fs::path& out_path) {
    if (entry_name.empty()) return false;
    if (entry_name.find('\0') != std::string::npos) return false;

    std::string s = entry_name;
    for (auto& c : s) { if (c == '\\') c = '/'; }
    while (!s.empty() && s.front() == '/') s.erase(s.begin());
    if (s.empty()) return false;

    const fs::path candidate = dest_dir / fs::path(s).relative_path();
    const auto normalized = candidate.lexically_normal();
    const auto base = dest_dir.lexically_normal();

    const auto rel = normalized.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..") return false;

    out_path = normalized;
    return true;
}

void ArchiveProcessor::extract(const fs::path& archive_path, const fs::path& dest_dir) {
    archive* a = archive_read_new();
    if (!a) throw ArchiveError("archive_read_new failed");
    archive_entry* entry = nullptr;

    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);
    archive_read_set_options(a, "hdrcharset=UTF-8");

    int r = archive_read_open_filename(a, archive_path.c_str(), 10240);
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_error_text(a), processor_tag());
    }
    if (r < ARCHIVE_WARN) {
        const std::string msg = "Can't open archive: " + archive_error_text(a);
        archive_read_free(a);
        throw ArchiveError(msg);
    }

    std::vector<char> buffer(64 * 1024);
    size_t extracted = 0;

    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_error_text(a), processor_tag());
        }
        const char* current = archive_entry_pathname(entry);
        if (!current) {
            archive_read_data_skip(a);
            continue;
        }

        const auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            archive_read_data_skip(a);
            continue;
        }
        if (type != AE_IFREG) {
            Logger::log(LogLevel::Warning, "Skipping non-regular entry: " + std::string(current), processor_tag());
            archive_read_data_skip(a);
            continue;
        }

        fs::path out_path;
        if (!sanitize_archive_entry_path(current, dest_dir, out_path)) {
            Logger::log(LogLevel::Warning, "Skipping suspicious archive entry (path traversal): " + std::string(current),
                        processor_tag());
            archive_read_data_skip(a);
            continue;
        }

        std::error_code ec;
        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            const std::string msg = "Can't create folder for " + out_path.string() + ": " + ec.message();
            archive_read_free(a);
            throw ArchiveError(msg);
        }

        std::ofstream ofs(out_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            archive_read_free(a);
            throw ArchiveError("Can't open file in write mode: " + out_path.string());
        }

        la_ssize_t size_read = 0;
        while ((size_read = archive_read_data(a, buffer.data(), buffer.size())) > 0) {
            ofs.write(buffer.data(), static_cast<std::streamsize>(size_read));
        }
        ofs.close();

        if (size_read < 0) {
            const std::string msg = "Error reading " + std::string(current) + ": " + archive_error_text(a);
            archive_read_free(a);
            throw ArchiveError(msg);
        }
        if (!ofs) {
            archive_read_free(a);
            throw ArchiveError("Error writing " + out_path.string());
        }
        ++extracted;
    }

    if (r != ARCHIVE_EOF) {
        const std::string msg = "Error during iteration: " + archive_error_text(a);
        archive_read_free(a);
        throw ArchiveError(msg);
    }

    archive_read_free(a);
    Logger::log(LogLevel::Debug, "Extracted " + std::to_string(extracted) + " files from " +
                archive_path.filename().string(), processor_tag());
}

void ArchiveProcessor::write_zip(const fs::path& src_dir, const fs::path& out_path) {
    std::vector<fs::path> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(src_dir, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code ec2;
        if (it->is_regular_file(ec2) && !it->is_symlink(ec2)) {
            files.push_back(it->path());
        }
    }
    if (ec) throw ArchiveError("Can't list " + src_dir.string() + ": " + ec.message());

    std::sort(files.begin(), files.end(), [&](const fs::path& a, const fs::path& b) {
        return natural_less(relative_key(src_dir, a), relative_key(src_dir, b));
    });

    archive* a = archive_write_new();
    if (!a) throw ArchiveError("archive_write_new failed");

    auto fail = [&](const std::string& msg) {
        archive_write_free(a);
        std::error_code rec;
        fs::remove(out_path, rec);
        throw ArchiveError(msg);
    };

    int r = archive_write_set_format_zip(a);
    if (r == ARCHIVE_OK) {
        archive_write_set_format_option(a, "zip", "compression", "deflate");
        archive_write_set_format_option(a, "zip", "compression-level", "9");
    } else {
        fail("Setting zip format failed: " + archive_error_text(a));
    }

    r = archive_write_open_filename(a, out_path.c_str());
    if (r != ARCHIVE_OK) {
        fail("archive_write_open_filename: " + archive_error_text(a));
    }

    std::vector<char> buffer(64 * 1024);

    for (const auto& p : files) {
        const std::string rel = relative_key(src_dir, p);

        archive_entry* entry = archive_entry_new();
        if (!entry) fail("archive_entry_new failed");

        archive_entry_set_pathname(entry, rel.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_size(entry, static_cast<la_int64_t>(safe_file_size(p)));

        std::error_code tec;
        const auto mtime = fs::last_write_time(p, tec);
        if (!tec) {
            const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                mtime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
            archive_entry_set_mtime(entry, std::chrono::system_clock::to_time_t(sys), 0);
        }

        r = archive_write_header(a, entry);
        if (r == ARCHIVE_WARN) {
            Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_error_text(a), processor_tag());
        }
        if (r < ARCHIVE_WARN) {
            archive_entry_free(entry);
            fail("archive_write_header: " + archive_error_text(a) + " for " + rel);
        }
        archive_entry_free(entry);

        std::ifstream ifs(p, std::ios::binary);
        if (!ifs) fail("Can't open file for reading: " + p.string());
        while (ifs) {
            ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize got = ifs.gcount();
            if (got > 0 && archive_write_data(a, buffer.data(), static_cast<size_t>(got)) < 0) {
                fail("archive_write_data: " + archive_error_text(a));
            }
        }
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        fail("archive_write_close: " + archive_error_text(a));
    }
    archive_write_free(a);
}

fs::path ArchiveProcessor::backup_copy(const fs::path& archive) {
    fs::path bak = archive;
    bak += ".bak";
    std::error_code ec;
    fs::copy_file(archive, bak, fs::copy_options::overwrite_existing, ec);
    if (ec) throw ArchiveError("Can't create backup " + bak.string() + ": " + ec.message());
    Logger::log(LogLevel::Info, "Backup written: " + bak.filename().string(), processor_tag());
    return bak;
}

void ArchiveProcessor::repack(const fs::path& tree_root, const fs::path& original, const bool backup) {
    // same directory as the original so the final rename never crosses filesystems
    const fs::path tmp_archive = original.parent_path() /
                                 ("." + original.filename().string() + ".cbzxl-" + random_suffix() + ".tmp");

    Logger::log(LogLevel::Debug, "Recreating archive: " + tmp_archive.string(), processor_tag());
    write_zip(tree_root, tmp_archive);

    std::error_code ec;
    if (backup) {
        try {
            backup_copy(original);
        } catch (const ArchiveError&) {
            fs::remove(tmp_archive, ec);
            throw;
        }
    }

    fs::rename(tmp_archive, original, ec);
    if (ec) {
        const std::string msg = "Can't replace " + original.filename().string() + ": " + ec.message();
        std::error_code rec;
        fs::remove(tmp_archive, rec);
        throw ArchiveError(msg);
    }
    Logger::log(LogLevel::Debug, "Replaced " + original.filename().string(), processor_tag());
}

std::vector<std::string> ArchiveProcessor::list_entries(const fs::path& archive_path) {
    archive* a = archive_read_new();
    if (!a) throw ArchiveError("archive_read_new failed");
    archive_read_support_filter_all(a);
    archive_read_support_format_all(a);

    if (archive_read_open_filename(a, archive_path.c_str(), 10240) < ARCHIVE_WARN) {
        const std::string msg = "Can't open archive: " + archive_error_text(a);
        archive_read_free(a);
        throw ArchiveError(msg);
    }

    std::vector<std::string> names;
    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (archive_entry_filetype(entry) == AE_IFREG && archive_entry_pathname(entry)) {
            names.emplace_back(archive_entry_pathname(entry));
        }
        archive_read_data_skip(a);
    }
    if (r != ARCHIVE_EOF) {
        const std::string msg = "Error during iteration: " + archive_error_text(a);
        archive_read_free(a);
        throw ArchiveError(msg);
    }
    archive_read_free(a);
    return names;
}

} // namespace cbzxl
