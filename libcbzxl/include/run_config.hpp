/**
 * @file run_config.hpp
 * @brief Immutable per-run configuration.
 */

#ifndef CBZXL_RUN_CONFIG_HPP
#define CBZXL_RUN_CONFIG_HPP

#include <chrono>
#include <filesystem>

namespace cbzxl {

/**
 * @brief All knobs of a conversion run.
 *
 * Built once by the CLI from the parsed options and handed by const
 * reference to every component; nothing mutates it while a run is active.
 */
struct RunConfig {
    std::filesystem::path input_dir{"."};                        ///< Scan root; record keys are relative to it
    std::filesystem::path success_db{"converted_archives.db"};   ///< Success store
    std::filesystem::path failure_db{"failed_archives.db"};      ///< Failure store

    int effort = 8;           ///< cjxl effort, 0-10
    unsigned threads = 10;    ///< Image worker pool width

    bool dry_run = false;
    bool backup = false;                ///< Copy <archive>.bak before replacing or deleting
    bool convert = true;                ///< false with --no-convert
    bool flatten = true;                ///< false with --no-flatten
    bool delete_empty_archives = false;
    bool recheck_all = false;
    bool reprocess_failed = false;

    std::chrono::seconds tool_timeout{60};       ///< Identification / colour fixes
    std::chrono::seconds encode_timeout{600};    ///< One cjxl invocation
    std::chrono::seconds archive_timeout{7200};  ///< Conversion step of one archive
};

} // namespace cbzxl

#endif // CBZXL_RUN_CONFIG_HPP
