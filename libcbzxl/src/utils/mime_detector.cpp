#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

namespace cbzxl {

namespace {

const char* magic_error_text(magic_t handle) {
    const char* err = magic_error(handle);
    return err ? err : "unknown error";
}

struct MagicCookie {
    magic_t handle = nullptr;
    bool loaded = false;

    MagicCookie() {
        handle = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
        if (!handle) return;
        if (magic_load(handle, nullptr) != 0) {
            Logger::log(LogLevel::Error, std::string("magic_load failed: ") + magic_error_text(handle), "libmagic");
            return;
        }
        loaded = true;
    }

    ~MagicCookie() {
        if (handle) magic_close(handle);
    }

    MagicCookie(const MagicCookie&) = delete;
    MagicCookie& operator=(const MagicCookie&) = delete;
};

MagicCookie& thread_cookie() {
    thread_local MagicCookie cookie;
    return cookie;
}

} // namespace

std::string MimeDetector::detect(const std::filesystem::path& path) const {
    auto& cookie = thread_cookie();
    if (!cookie.loaded) return {};
    const char* mime = magic_file(cookie.handle, path.string().c_str());
    if (!mime) {
        Logger::log(LogLevel::Debug, "libmagic could not identify " + path.filename().string() + ": " +
                    magic_error_text(cookie.handle), "libmagic");
        return {};
    }
    return mime;
}

void MimeDetector::verify_available() {
    if (!thread_cookie().loaded) {
        throw ToolMissingError("libmagic database could not be loaded (content type detection unavailable)");
    }
}

} // namespace cbzxl
