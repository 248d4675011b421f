#include "run_setup.hpp"
#include "../../../libcbzxl/include/errors.hpp"
#include "../../../libcbzxl/include/logger.hpp"
#include "../../../libcbzxl/include/state_store.hpp"
#include <string>

using namespace cbzxl;

bool prepare_run(const Settings& settings, const std::function<void()>& verify_tools) {
    try {
        verify_tools();
    } catch (const ToolMissingError& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        return false;
    }

    if (!settings.reset_db) {
        return true;
    }
    if (settings.dry_run) {
        Logger::log(LogLevel::Info, "Would reset " + settings.success_db.string() + " and " +
                    settings.failure_db.string() + "; rechecking every archive instead", "main");
        return true;
    }
    try {
        ArchiveStateStore::reset(settings.success_db, settings.failure_db);
    } catch (const StateStoreError& e) {
        Logger::log(LogLevel::Error, std::string("Database reset failed: ") + e.what(), "main");
        return false;
    }
    return true;
}
