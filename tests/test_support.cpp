#include "test_support.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cbzxl::test {

TempDir::TempDir()
    : path_(fs::temp_directory_path() / ("cbzxl-test-" + random_suffix())) {
    fs::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

static std::string padded(std::string head, const std::size_t size) {
    if (head.size() < size) head.append(size - head.size(), 'x');
    return head;
}

std::string jpeg_bytes(const std::size_t size) {
    return padded(std::string("\xFF\xD8\xFF\xE0", 4) + "JFIF", size);
}

std::string png_bytes(const std::size_t size) {
    return padded(std::string("\x89PNG\r\n\x1A\n", 8), size);
}

std::string jxl_bytes(const std::size_t size) {
    return padded(std::string("\xFF\x0A", 2), size);
}

std::string webp_bytes(const std::size_t size) {
    return padded(std::string("RIFF\x10\x00\x00\x00WEBPVP8 ", 16), size);
}

std::string gif_bytes(const std::size_t size) {
    return padded("GIF89a", size);
}

std::string text_bytes(const std::size_t size) {
    return padded("plain text ", size);
}

void write_file(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("can't write " + path.string());
    out << content;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> list_tree(const fs::path& root) {
    std::vector<std::string> files;
    for (const auto& e : fs::recursive_directory_iterator(root)) {
        if (e.is_regular_file()) files.push_back(relative_key(root, e.path()));
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string FakeMimeDetector::detect(const fs::path& path) const {
    ++calls;
    const std::string head = read_file(path).substr(0, 16);
    if (head.starts_with(std::string("\xFF\xD8\xFF", 3))) return "image/jpeg";
    if (head.starts_with(std::string("\x89PNG", 4))) return "image/png";
    if (head.starts_with(std::string("\xFF\x0A", 2))) {
        return jxl_as_octet_stream ? "application/octet-stream" : "image/jxl";
    }
    if (head.starts_with("RIFF") && head.size() >= 12 && head.substr(8, 4) == "WEBP") return "image/webp";
    if (head.starts_with("GIF8")) return "image/gif";
    if (head.empty()) return "application/x-empty";
    return "text/plain";
}

ProcessResult FakeImageTools::encode(const fs::path& input,
                                     const fs::path& output,
                                     const int effort,
                                     const bool allow_reconstruction) const {
    ++encode_calls;
    if (!allow_reconstruction) ++retry_calls;
    {
        std::lock_guard lock(mtx_);
        efforts_.push_back(effort);
    }

    ProcessResult r;
    r.launched = true;
    const std::string name = input.filename().string();

    if (timeout_names.contains(name)) {
        if (write_partial_on_failure) write_file(output, jxl_bytes(3));
        r.timed_out = true;
        r.exit_code = 128 + 9;
        return r;
    }
    if (failing_names.contains(name)) {
        if (write_partial_on_failure) write_file(output, jxl_bytes(3));
        r.exit_code = 1;
        r.err = "JPEG XL encoding failed";
        return r;
    }
    if (allow_reconstruction && reconstruction_error_names.contains(name)) {
        if (write_partial_on_failure) write_file(output, jxl_bytes(3));
        r.exit_code = 1;
        r.err = "JPEG bitstream reconstruction data could not be created. Possibly there is too much tail data.";
        return r;
    }
    if (empty_output_names.contains(name)) {
        write_file(output, "");
        r.exit_code = 0;
        return r;
    }

    const auto size = static_cast<std::size_t>(static_cast<double>(safe_file_size(input)) * ratio);
    write_file(output, jxl_bytes(std::max<std::size_t>(size, 2)));
    r.exit_code = 0;
    return r;
}

ProcessResult FakeImageTools::detect_colorspace(const fs::path&) const {
    ++colorspace_calls;
    ProcessResult r;
    r.launched = true;
    r.exit_code = 0;
    r.out = colorspace + "\n";
    return r;
}

ProcessResult FakeImageTools::strip_color_profile(const fs::path&) const {
    ++strip_calls;
    ProcessResult r;
    r.launched = true;
    r.exit_code = strip_fails ? 1 : 0;
    if (strip_fails) r.err = "mogrify: improper image header";
    return r;
}

ProcessResult FakeImageTools::convert_colorspace_to_srgb(const fs::path&) const {
    ++srgb_calls;
    ProcessResult r;
    r.launched = true;
    r.exit_code = 0;
    return r;
}

std::vector<int> FakeImageTools::efforts_seen() const {
    std::lock_guard lock(mtx_);
    return efforts_;
}

} // namespace cbzxl::test
