#include <atomic>
#include <clocale>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "cli/run_setup.hpp"
#include "report/report_generator.hpp"
#include "utils/color.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "../../libcbzxl/include/errors.hpp"
#include "../../libcbzxl/include/event_bus.hpp"
#include "../../libcbzxl/include/events.hpp"
#include "../../libcbzxl/include/image_tools.hpp"
#include "../../libcbzxl/include/logger.hpp"
#include "../../libcbzxl/include/mime_detector.hpp"
#include "../../libcbzxl/include/pipeline.hpp"
#include "../../libcbzxl/include/state_store.hpp"
#include "../../libcbzxl/include/store_statistics.hpp"

using namespace cbzxl;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};
static std::atomic<PipelineOrchestrator*> g_orchestrator{nullptr};

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        constexpr char msg[] = "\n[INTERRUPT] Stop detected. Finishing the current archive...\n";
        [[maybe_unused]] const auto n = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        if (PipelineOrchestrator* orchestrator = g_orchestrator.load()) {
            orchestrator->request_stop();
        }
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Debug, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static int print_statistics(const Settings& settings) {
    std::error_code ec;
    if (!fs::exists(settings.success_db, ec)) {
        Logger::log(LogLevel::Error, "Database not found: " + settings.success_db.string(), "main");
        return 1;
    }
    try {
        const ArchiveStateStore store(settings.success_db, settings.failure_db, StoreMode::ReadOnly);
        const auto records = store.load_records();
        print_store_statistics(summarize_records(records), isatty(STDOUT_FILENO) != 0);

        const auto failed = store.load_failed_paths();
        if (!failed.empty()) {
            std::cout << "\nArchives waiting in the failure store: " << failed.size() << "\n";
        }
        if (!settings.report_path.empty() && !export_csv_report(records, settings.report_path)) {
            return 1;
        }
    } catch (const StateStoreError& e) {
        Logger::log(LogLevel::Error, std::string("Can't read statistics: ") + e.what(), "main");
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {

    CLI::App app{"cbzxl: convert the images of comic archives to lossless JPEG XL."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    // set file logger
    Logger::clear_sinks();
    if (!settings.stats) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, settings.dry_run);
        if (!fileSink->is_open()) {
            std::cerr << YELLOW << "Can't open log file " << settings.log_file.string() << RESET << std::endl;
        }
        Logger::add_sink(std::move(fileSink));
    }

    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->log_level = settings.quiet ? LogLevel::Error
                           : settings.verbose ? LogLevel::Debug
                           : LogLevel::Info;
    consoleSink->dry_run = settings.dry_run;
    Logger::add_sink(std::move(consoleSink));

    init_utf8_locale();

    if (settings.stats) {
        return print_statistics(settings);
    }

    // external tools are checked once, before any archive or database is touched
    if (!prepare_run(settings, [] {
            CommandLineImageTools::verify_available();
            MimeDetector::verify_available();
        })) {
        return 1;
    }

    const RunConfig config = settings.to_run_config();
    Logger::log(LogLevel::Info, "Starting CBZ to JXL conversion in " + fs::absolute(config.input_dir).string() +
                " (effort " + std::to_string(config.effort) + ", " + std::to_string(config.threads) + " threads)",
                "main");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 0;
    try {
        ArchiveStateStore store(config.success_db, config.failure_db,
                                config.dry_run ? StoreMode::ReadOnly : StoreMode::ReadWrite);
        const CommandLineImageTools tools(config);
        const MimeDetector detector;
        EventBus bus;

        std::vector<std::string> failures;
        bus.subscribe<ArchiveStartEvent>([](const ArchiveStartEvent& e) {
            Logger::log(LogLevel::Info, "[" + std::to_string(e.index) + "/" + std::to_string(e.total) + "] " +
                        e.relative, "main");
        });
        bus.subscribe<ArchiveErrorEvent>([&failures](const ArchiveErrorEvent& e) {
            failures.push_back(e.relative + ": " + e.error_message);
        });

        PipelineOrchestrator orchestrator(config, detector, tools, store, bus);
        g_orchestrator = &orchestrator;
        const RunStats stats = orchestrator.run();
        g_orchestrator = nullptr;

        for (const auto& f : failures) {
            Logger::log(LogLevel::Warning, "Failed: " + f, "main");
        }
        print_run_summary(stats, settings.log_file);

        if (!settings.report_path.empty() && !export_csv_report(store.load_records(), settings.report_path)) {
            exit_code = 1;
        }
    } catch (const std::exception& e) {
        g_orchestrator = nullptr;
        Logger::log(LogLevel::Error, std::string("Run aborted: ") + e.what(), "main");
        exit_code = 1;
    }

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }
    return exit_code;
}
