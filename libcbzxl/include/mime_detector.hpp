#ifndef CBZXL_MIME_DETECTOR_HPP
#define CBZXL_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace cbzxl {

    /**
     * @brief Content-type sniffing capability.
     *
     * Classification relies on the bytes of a file, never on its name.
     * Implementations must be callable concurrently from image workers.
     */
    class IMimeDetector {
    public:
        virtual ~IMimeDetector() = default;

        /**
         * @brief Detect the MIME type of a file.
         * @return e.g. "image/jpeg"; an empty string when detection fails.
         */
        [[nodiscard]] virtual std::string detect(const std::filesystem::path& path) const = 0;
    };

    /**
     * @brief IMimeDetector backed by libmagic.
     *
     * Each thread lazily opens and keeps its own magic cookie, since a
     * cookie must not be shared between threads.
     */
    class MimeDetector final : public IMimeDetector {
    public:
        [[nodiscard]] std::string detect(const std::filesystem::path& path) const override;

        /**
         * @brief Opens libmagic and loads its database once.
         * @throws ToolMissingError if the magic database cannot be loaded.
         */
        static void verify_available();
    };

} // namespace cbzxl

#endif // CBZXL_MIME_DETECTOR_HPP
