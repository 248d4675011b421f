#include "../../include/image_tools.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <array>
#include <string_view>

namespace fs = std::filesystem;

namespace cbzxl {

namespace {

constexpr std::string_view kEncoder = "cjxl";
constexpr std::string_view kMagick = "magick";
constexpr std::array<std::string_view, 2> kRequiredTools = {kEncoder, kMagick};

} // namespace

CommandLineImageTools::CommandLineImageTools(const RunConfig& config)
    : tool_timeout_(config.tool_timeout),
      encode_timeout_(config.encode_timeout) {}

void CommandLineImageTools::verify_available() {
    std::string missing;
    for (const auto tool : kRequiredTools) {
        if (auto found = find_executable(tool)) {
            Logger::log(LogLevel::Debug, std::string(tool) + " found at " + found->string(), "tools");
        } else {
            if (!missing.empty()) missing += ", ";
            missing += tool;
        }
    }
    if (!missing.empty()) {
        throw ToolMissingError("Required tools not found in PATH: " + missing);
    }
}

ProcessResult CommandLineImageTools::encode(const fs::path& input,
                                            const fs::path& output,
                                            const int effort,
                                            const bool allow_reconstruction) const {
    // -d 0: mathematically lossless
    std::vector<std::string> args = {
        std::string(kEncoder), "-d", "0", "--effort=" + std::to_string(effort)
    };
    if (!allow_reconstruction) {
        args.emplace_back("--allow_jpeg_reconstruction=0");
    }
    args.push_back(input.string());
    args.push_back(output.string());
    return run_process(args, encode_timeout_);
}

ProcessResult CommandLineImageTools::detect_colorspace(const fs::path& path) const {
    return run_process({std::string(kMagick), "identify", "-format", "%[colorspace]", path.string()},
                       tool_timeout_);
}

ProcessResult CommandLineImageTools::strip_color_profile(const fs::path& path) const {
    return run_process({std::string(kMagick), "mogrify", "-strip", path.string()}, tool_timeout_);
}

ProcessResult CommandLineImageTools::convert_colorspace_to_srgb(const fs::path& path) const {
    return run_process({std::string(kMagick), path.string(), "-colorspace", "sRGB", path.string()},
                       tool_timeout_);
}

std::string CommandLineImageTools::version() const {
    const auto result = run_process({std::string(kEncoder), "--version"}, tool_timeout_);
    const std::string& text = result.out.empty() ? result.err : result.out;
    const auto eol = text.find('\n');
    std::string first_line = text.substr(0, eol);
    if (!result.ok() || first_line.empty()) {
        Logger::log(LogLevel::Warning, "Could not read encoder version", "tools");
        return "unknown";
    }
    return first_line;
}

} // namespace cbzxl
