#include "../../include/jxl_encoder.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cmath>
#include <system_error>

namespace fs = std::filesystem;

namespace cbzxl {

static const char* encoder_tag() {
    return "Encoder";
}

static void remove_artifact(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
}

JxlEncoder::JxlEncoder(const IImageTools& tools, const IMimeDetector& detector, const int effort)
    : tools_(tools), detector_(detector), normalizer_(tools), effort_(effort) {}

EncodeAttempt JxlEncoder::encode(const fs::path& input,
                                 const fs::path& output,
                                 const bool allow_reconstruction) const {
    EncodeAttempt attempt;
    attempt.produced = output;

    const auto r = tools_.encode(input, output, effort_, allow_reconstruction);
    attempt.timed_out = r.timed_out;
    if (!r.launched) {
        attempt.error = "encoder could not be started";
        return attempt;
    }
    if (r.timed_out) {
        attempt.error = "encoder timed out";
        return attempt;
    }
    std::error_code ec;
    attempt.ok = r.exit_code == 0 && fs::exists(output, ec);
    if (!attempt.ok) {
        attempt.error = r.err.empty() ? "encoder exited with code " + std::to_string(r.exit_code) : r.err;
    }
    return attempt;
}

MemberResult JxlEncoder::convert(const ImageMember& member, const fs::path& output) const {
    MemberResult result;
    result.source = member.path;
    result.output = output;
    const std::string name = member.path.filename().string();

    // the member may have changed since classification
    const ImageKind kind = kind_from_mime(detector_.detect(member.path));
    result.kind = kind;
    if (kind != ImageKind::Jpeg && kind != ImageKind::Png) {
        Logger::log(LogLevel::Warning, "Skipping " + name + ": no longer a jpeg/png", encoder_tag());
        result.error = "not a jpeg/png";
        return result;
    }

    result.original_size = safe_file_size(member.path);
    normalizer_.normalize(member.path, kind);

    EncodeAttempt attempt = encode(member.path, output, true);
    if (!attempt.ok && !attempt.timed_out &&
        to_lower_copy(attempt.error).find(kReconstructionError) != std::string::npos) {
        Logger::log(LogLevel::Info, "Retrying " + name + " without JPEG reconstruction data", encoder_tag());
        remove_artifact(output);
        attempt = encode(member.path, output, false);
    }

    if (attempt.timed_out) {
        remove_artifact(output);
        result.timed_out = true;
        result.error = attempt.error;
        Logger::log(LogLevel::Warning, "Encoding timed out, left unconverted: " + name, encoder_tag());
        return result;
    }

    result.encoded_size = attempt.ok ? safe_file_size(output) : 0;
    if (!attempt.ok || result.encoded_size == 0) {
        remove_artifact(output);
        result.error = attempt.ok ? "encoder produced an empty file" : attempt.error;
        Logger::log(LogLevel::Error, "Failed to convert " + name + ": " + result.error, encoder_tag());
        return result;
    }

    if (result.encoded_size >= result.original_size) {
        remove_artifact(output);
        Logger::log(LogLevel::Debug, "No gain for " + name + " (" + std::to_string(result.original_size) +
                    " -> " + std::to_string(result.encoded_size) + " bytes), original kept", encoder_tag());
        return result;
    }

    std::error_code ec;
    fs::remove(member.path, ec);
    if (ec) {
        remove_artifact(output);
        result.error = "can't remove source: " + ec.message();
        Logger::log(LogLevel::Error, "Failed to replace " + name + ": " + result.error, encoder_tag());
        return result;
    }

    result.converted = true;
    result.bytes_saved = static_cast<std::int64_t>(result.original_size) -
                         static_cast<std::int64_t>(result.encoded_size);
    Logger::log(LogLevel::Debug, "Converted " + name + " -> " + output.filename().string() + " (saved " +
                format_bytes(result.bytes_saved) + ")", encoder_tag());
    return result;
}

MemberResult JxlEncoder::estimate(const ImageMember& member, const fs::path& output) {
    MemberResult result;
    result.source = member.path;
    result.output = output;
    result.kind = member.kind;
    result.original_size = member.size_before;

    const double gain = member.kind == ImageKind::Jpeg ? kEstimatedJpegGain : kEstimatedPngGain;
    result.bytes_saved = static_cast<std::int64_t>(std::llround(static_cast<double>(member.size_before) * gain));
    result.encoded_size = member.size_before - static_cast<std::uintmax_t>(result.bytes_saved);
    result.converted = member.size_before > 0;
    if (!result.converted) result.bytes_saved = 0;

    Logger::log(LogLevel::Debug, "Would convert " + member.path.filename().string() + " -> " +
                output.filename().string() + " (estimated saving " + format_bytes(result.bytes_saved) + ")",
                encoder_tag());
    return result;
}

} // namespace cbzxl
