#include "../../include/state_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <sqlite3.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace cbzxl {

static const char* store_tag() {
    return "StateStore";
}

namespace {

constexpr const char* kSuccessSchema =
    "CREATE TABLE IF NOT EXISTS converted_archives ("
    " path TEXT PRIMARY KEY,"
    " original_size INTEGER,"
    " final_size INTEGER,"
    " bytes_saved INTEGER,"
    " percent_saved REAL,"
    " timestamp TEXT,"
    " status TEXT,"
    " outcome TEXT,"
    " dominant_type TEXT,"
    " effort INTEGER,"
    " duration REAL,"
    " image_count INTEGER,"
    " jpg_count INTEGER,"
    " png_count INTEGER,"
    " tool_version TEXT,"
    " error_message TEXT);";

constexpr const char* kFailureSchema =
    "CREATE TABLE IF NOT EXISTS failed_archives ("
    " path TEXT PRIMARY KEY,"
    " timestamp TEXT,"
    " duration REAL,"
    " error_message TEXT);";

constexpr const char* kRecordColumns =
    "path, original_size, final_size, bytes_saved, percent_saved, timestamp, status, outcome,"
    " dominant_type, effort, duration, image_count, jpg_count, png_count, tool_version, error_message";

[[noreturn]] void fail(sqlite3* db, const std::string& what) {
    const std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
    Logger::log(LogLevel::Error, msg, store_tag());
    throw StateStoreError(msg);
}

// prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            fail(db, std::string("prepare failed (") + sql + ")");
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
    }
    void bind(int idx, const std::int64_t v) { check(sqlite3_bind_int64(stmt_, idx, v)); }
    void bind(int idx, const int v) { check(sqlite3_bind_int(stmt_, idx, v)); }
    void bind(int idx, const double v) { check(sqlite3_bind_double(stmt_, idx, v)); }
    void bind(int idx, const std::optional<std::string>& v) {
        if (v) bind(idx, *v);
        else check(sqlite3_bind_null(stmt_, idx));
    }

    /// true while a row is available
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        fail(db_, "step failed");
    }

    std::string text(int col) const {
        const auto* t = sqlite3_column_text(stmt_, col);
        return t ? reinterpret_cast<const char*>(t) : "";
    }
    std::optional<std::string> nullable_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    std::int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    int integer(int col) const { return sqlite3_column_int(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) fail(db_, "bind failed");
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        const std::string msg = std::string("exec failed (") + sql + "): " + (err ? err : "unknown error");
        sqlite3_free(err);
        Logger::log(LogLevel::Error, msg, store_tag());
        throw StateStoreError(msg);
    }
}

sqlite3* open_db(const fs::path& file, const char* schema) {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(file.string().c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = "Cannot open database " + file.string() + ": " +
                                (db ? sqlite3_errmsg(db) : "out of memory");
        if (db) sqlite3_close(db);
        Logger::log(LogLevel::Error, msg, store_tag());
        throw StateStoreError(msg);
    }
    try {
        sqlite3_busy_timeout(db, 5000);
        exec(db, "PRAGMA journal_mode=WAL;");
        exec(db, schema);
    } catch (const StateStoreError&) {
        sqlite3_close(db);
        throw;
    }
    return db;
}

// nullptr when the file or its table doesn't exist yet
sqlite3* open_db_read_only(const fs::path& file, const char* table) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        Logger::log(LogLevel::Debug, "No database at " + file.string() + ", reading as empty", store_tag());
        return nullptr;
    }
    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(file.string().c_str(), &db, SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = "Cannot open database " + file.string() + " read-only: " +
                                (db ? sqlite3_errmsg(db) : "out of memory");
        if (db) sqlite3_close(db);
        Logger::log(LogLevel::Error, msg, store_tag());
        throw StateStoreError(msg);
    }
    sqlite3_busy_timeout(db, 5000);

    bool has_table = false;
    try {
        Statement st(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
        st.bind(1, std::string(table));
        has_table = st.step();
    } catch (const StateStoreError&) {
        sqlite3_close(db);
        throw;
    }
    if (!has_table) {
        Logger::log(LogLevel::Debug, std::string("No ") + table + " table in " + file.string() + ", reading as empty",
                    store_tag());
        sqlite3_close(db);
        return nullptr;
    }
    return db;
}

ArchiveRecord read_record(const Statement& st) {
    ArchiveRecord r;
    r.path = st.text(0);
    r.original_size = st.int64(1);
    r.final_size = st.int64(2);
    r.bytes_saved = st.int64(3);
    r.percent_saved = st.real(4);
    r.timestamp = st.text(5);
    try {
        r.status = status_from_string(st.text(6));
    } catch (const std::invalid_argument& e) {
        throw StateStoreError("Corrupt record for " + r.path + ": " + e.what());
    }
    r.outcome = st.text(7);
    r.dominant_type = st.text(8);
    r.effort = st.integer(9);
    r.duration = st.real(10);
    r.image_count = st.integer(11);
    r.jpg_count = st.integer(12);
    r.png_count = st.integer(13);
    r.tool_version = st.text(14);
    r.error_message = st.nullable_text(15);
    return r;
}

} // namespace

ArchiveStateStore::ArchiveStateStore(const fs::path& success_db, const fs::path& failure_db, const StoreMode mode)
    : mode_(mode) {
    if (mode_ == StoreMode::ReadOnly) {
        success_ = open_db_read_only(success_db, "converted_archives");
    } else {
        success_ = open_db(success_db, kSuccessSchema);
    }
    try {
        failure_ = mode_ == StoreMode::ReadOnly ? open_db_read_only(failure_db, "failed_archives")
                                                : open_db(failure_db, kFailureSchema);
    } catch (const StateStoreError&) {
        sqlite3_close(success_);
        throw;
    }
    Logger::log(LogLevel::Debug, std::string("Opened ") + success_db.string() + " and " + failure_db.string() +
                (mode_ == StoreMode::ReadOnly ? " read-only" : ""), store_tag());
}

void ArchiveStateStore::require_writable(const char* operation) const {
    if (mode_ == StoreMode::ReadOnly) {
        const std::string msg = std::string(operation) + " on a read-only store";
        Logger::log(LogLevel::Error, msg, store_tag());
        throw StateStoreError(msg);
    }
}

ArchiveStateStore::~ArchiveStateStore() {
    sqlite3_close(failure_);
    sqlite3_close(success_);
}

void ArchiveStateStore::upsert_processed(const ArchiveRecord& record) {
    require_writable("upsert_processed");
    const std::string sql = std::string("INSERT OR REPLACE INTO converted_archives (") + kRecordColumns +
                            ") VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
    Statement st(success_, sql.c_str());
    st.bind(1, record.path);
    st.bind(2, record.original_size);
    st.bind(3, record.final_size);
    st.bind(4, record.bytes_saved);
    st.bind(5, record.percent_saved);
    st.bind(6, record.timestamp.empty() ? current_timestamp() : record.timestamp);
    st.bind(7, std::string(status_to_string(record.status)));
    st.bind(8, record.outcome);
    st.bind(9, record.dominant_type);
    st.bind(10, record.effort);
    st.bind(11, record.duration);
    st.bind(12, record.image_count);
    st.bind(13, record.jpg_count);
    st.bind(14, record.png_count);
    st.bind(15, record.tool_version);
    st.bind(16, record.error_message);
    st.step();
}

void ArchiveStateStore::upsert_failed(const std::string& path, const double duration, const std::string& error) {
    require_writable("upsert_failed");
    Statement st(failure_,
                 "INSERT OR REPLACE INTO failed_archives (path, timestamp, duration, error_message) VALUES (?,?,?,?);");
    st.bind(1, path);
    st.bind(2, current_timestamp());
    st.bind(3, duration);
    st.bind(4, error);
    st.step();
}

void ArchiveStateStore::remove_failed(const std::string& path) {
    require_writable("remove_failed");
    Statement st(failure_, "DELETE FROM failed_archives WHERE path = ?;");
    st.bind(1, path);
    st.step();
}

std::unordered_set<std::string> ArchiveStateStore::load_processed_paths() const {
    if (!success_) return {};
    Statement st(success_, "SELECT path FROM converted_archives WHERE status IN ('processed', 'deleted');");
    std::unordered_set<std::string> paths;
    while (st.step()) {
        paths.insert(st.text(0));
    }
    return paths;
}

std::vector<std::string> ArchiveStateStore::load_failed_paths() const {
    if (!failure_) return {};
    Statement st(failure_, "SELECT path FROM failed_archives ORDER BY path;");
    std::vector<std::string> paths;
    while (st.step()) {
        paths.push_back(st.text(0));
    }
    return paths;
}

std::optional<ArchiveRecord> ArchiveStateStore::find_record(const std::string& path) const {
    if (!success_) return std::nullopt;
    const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM converted_archives WHERE path = ?;";
    Statement st(success_, sql.c_str());
    st.bind(1, path);
    if (!st.step()) return std::nullopt;
    return read_record(st);
}

std::optional<FailureRecord> ArchiveStateStore::find_failure(const std::string& path) const {
    if (!failure_) return std::nullopt;
    Statement st(failure_, "SELECT path, timestamp, duration, error_message FROM failed_archives WHERE path = ?;");
    st.bind(1, path);
    if (!st.step()) return std::nullopt;
    FailureRecord f;
    f.path = st.text(0);
    f.timestamp = st.text(1);
    f.duration = st.real(2);
    f.error_message = st.text(3);
    return f;
}

std::vector<ArchiveRecord> ArchiveStateStore::load_records() const {
    if (!success_) return {};
    const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM converted_archives ORDER BY path;";
    Statement st(success_, sql.c_str());
    std::vector<ArchiveRecord> records;
    while (st.step()) {
        records.push_back(read_record(st));
    }
    return records;
}

void ArchiveStateStore::reset(const fs::path& success_db, const fs::path& failure_db) {
    for (const auto& db : {success_db, failure_db}) {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            fs::path file = db;
            file += suffix;
            std::error_code ec;
            fs::remove(file, ec);
            if (ec) {
                const std::string msg = "Can't delete " + file.string() + ": " + ec.message();
                Logger::log(LogLevel::Error, msg, store_tag());
                throw StateStoreError(msg);
            }
        }
        Logger::log(LogLevel::Info, "Database reset: " + db.string(), store_tag());
    }
}

} // namespace cbzxl
