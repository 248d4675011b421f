#ifndef CBZXL_CLI_PARSER_HPP
#define CBZXL_CLI_PARSER_HPP

#include "../../../libcbzxl/include/run_config.hpp"
#include <filesystem>
#include <string>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path input_dir{"."};

    int effort = 8;
    unsigned num_threads = 10;

    bool dry_run = false;
    bool backup = false;
    bool no_convert = false;
    bool no_flatten = false;
    bool delete_empty_archives = false;
    bool recheck_all = false;
    bool reprocess_failed = false;
    bool stats = false;
    bool reset_db = false;
    bool quiet = false;
    bool verbose = false;

    std::filesystem::path success_db{"converted_archives.db"};
    std::filesystem::path failure_db{"failed_archives.db"};
    std::filesystem::path log_file{"cbz_jxl_conversion.log"};
    std::filesystem::path report_path;

    unsigned tool_timeout = 60;
    unsigned encode_timeout = 600;
    unsigned archive_timeout = 7200;

    /**
     * @brief The immutable configuration handed to the pipeline.
     *
     * --reset-db in a dry run deletes nothing but behaves like --recheck-all.
     */
    [[nodiscard]] cbzxl::RunConfig to_run_config() const;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // CBZXL_CLI_PARSER_HPP
