#include "cli_parser.hpp"
#include <CLI/CLI.hpp>

cbzxl::RunConfig Settings::to_run_config() const {
    cbzxl::RunConfig config;
    config.input_dir = input_dir;
    config.success_db = success_db;
    config.failure_db = failure_db;
    config.effort = effort;
    config.threads = num_threads;
    config.dry_run = dry_run;
    config.backup = backup;
    config.convert = !no_convert;
    config.flatten = !no_flatten;
    config.delete_empty_archives = delete_empty_archives;
    config.recheck_all = recheck_all || (reset_db && dry_run);
    config.reprocess_failed = reprocess_failed;
    config.tool_timeout = std::chrono::seconds(tool_timeout);
    config.encode_timeout = std::chrono::seconds(encode_timeout);
    config.archive_timeout = std::chrono::seconds(archive_timeout);
    return config;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "1.0");
    app.set_config("--config", "", "Read options from an INI or TOML file.");

    // --- Flags (booleans) ---
    app.add_flag("--dry-run", settings.dry_run,
                 "Log what would be done without touching any archive or database.");

    app.add_flag("--backup", settings.backup,
                 "Keep a copy of each archive as <name>.bak before replacing or deleting it.");

    app.add_flag("--no-convert", settings.no_convert,
                 "Don't convert images (extension fixes and flattening still apply).");

    app.add_flag("--no-flatten", settings.no_flatten,
                 "Keep the directory structure inside archives.");

    app.add_flag("--delete-empty-archives", settings.delete_empty_archives,
                 "Delete archives that contain no recognized image.");

    auto* recheck = app.add_flag("--recheck-all", settings.recheck_all,
                                 "Process archives even if they are already recorded as processed.");

    auto* reprocess = app.add_flag("--reprocess-failed", settings.reprocess_failed,
                                   "Only retry archives recorded as failed.");
    recheck->excludes(reprocess);

    app.add_flag("--stats", settings.stats,
                  "Print statistics of the database and exit.");

    app.add_flag("--reset-db", settings.reset_db,
                 "Delete both databases before running.");

    auto* quiet = app.add_flag("-q,--quiet", settings.quiet,
                               "Only print errors on the console.");
    auto* verbose = app.add_flag("-v,--verbose", settings.verbose,
                                 "Print debug output on the console.");
    quiet->excludes(verbose);

    // --- Options ---
    app.add_option("-e,--effort", settings.effort,
                   "cjxl effort, 0 (fastest) to 10 (smallest).")
                   ->default_val(8)
                   ->check(CLI::Range(0, 10));

    app.add_option("-t,--threads", settings.num_threads,
                   "Images encoded in parallel.")
                   ->default_val(10)
                   ->check(CLI::PositiveNumber);

    app.add_option("--db", settings.success_db,
                   "Database of processed archives.")
                   ->default_val("converted_archives.db");

    app.add_option("--failed-db", settings.failure_db,
                   "Database of failed archives.")
                   ->default_val("failed_archives.db");

    app.add_option("--log-file", settings.log_file,
                   "Append log lines to this file.")
                   ->default_val("cbz_jxl_conversion.log");

    app.add_option("--report", settings.report_path,
                   "Export the archive records to a CSV file.")
                   ->take_last();

    app.add_option("--timeout", settings.tool_timeout,
                   "Timeout in seconds for identification and colour fixes.")
                   ->default_val(60)
                   ->check(CLI::PositiveNumber);

    app.add_option("--encode-timeout", settings.encode_timeout,
                   "Timeout in seconds for one cjxl run.")
                   ->default_val(600)
                   ->check(CLI::PositiveNumber);

    app.add_option("--archive-timeout", settings.archive_timeout,
                   "Time budget in seconds for converting the images of one archive.")
                   ->default_val(7200)
                   ->check(CLI::PositiveNumber);

    // --- Positional Arguments ---
    app.add_option("input", settings.input_dir, "Directory scanned recursively for .cbz archives.")
        ->default_val(".")
        ->check(CLI::ExistingDirectory);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (settings.stats && (settings.reset_db || settings.reprocess_failed || settings.recheck_all)) {
            throw CLI::ValidationError("--stats can't be combined with options that process archives.");
        }
        if (settings.reset_db && settings.reprocess_failed) {
            throw CLI::ValidationError("--reset-db leaves nothing to --reprocess-failed.");
        }
    });
}
