/**
 * @file ban_store.cpp
 * @brief Ban state repositories
 * @note Requires sqlite3 (HAVE_SQLITE)
 */

#include "../include/sgate_ban_store.hpp"
#include "../include/sgate_errors.hpp"

#ifndef HAVE_SQLITE
#error "sgate requires sqlite3. Define HAVE_SQLITE and link against sqlite3."
#endif

#include <sqlite3.h>

namespace {

// RAII guard for sqlite3_stmt: finalize() runs on every path
struct SqliteStmtGuard {
    sqlite3_stmt* stmt;
    explicit SqliteStmtGuard(sqlite3_stmt* s) : stmt(s) {}
    ~SqliteStmtGuard() { if (stmt) sqlite3_finalize(stmt); }
    SqliteStmtGuard(const SqliteStmtGuard&) = delete;
    SqliteStmtGuard& operator=(const SqliteStmtGuard&) = delete;
};

const char* const SCHEMA =
    "CREATE TABLE IF NOT EXISTS ban_records ("
    "  ip            TEXT PRIMARY KEY,"
    "  hits          INTEGER NOT NULL,"
    "  level         INTEGER NOT NULL,"
    "  state         TEXT NOT NULL,"
    "  expiry        INTEGER,"
    "  first_failure INTEGER,"
    "  last_failure  INTEGER,"
    "  whitelisted   INTEGER NOT NULL DEFAULT 0"
    ")";

const char* const SELECT_COLUMNS =
    "SELECT ip, hits, level, state, expiry, first_failure, last_failure, whitelisted "
    "FROM ban_records";

} // anonymous namespace

namespace sgate {

const char* ban_state_to_string(BanState s) noexcept {
    switch (s) {
        case BanState::CLEAN:   return "clean";
        case BanState::WATCHED: return "watched";
        case BanState::BANNED:  return "banned";
        case BanState::EXPIRED: return "expired";
        default: return "unknown";
    }
}

std::optional<BanState> ban_state_from_string(const std::string& s) {
    if (s == "clean")   return BanState::CLEAN;
    if (s == "watched") return BanState::WATCHED;
    if (s == "banned")  return BanState::BANNED;
    if (s == "expired") return BanState::EXPIRED;
    return std::nullopt;
}

// ==================== MemoryBanStore ====================

std::optional<BanRecord> MemoryBanStore::load(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(ip);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void MemoryBanStore::save(const BanRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.ip] = record;
}

void MemoryBanStore::erase(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(ip);
}

std::vector<BanRecord> MemoryBanStore::all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BanRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) out.push_back(kv.second);
    return out;
}

// ==================== SqliteBanStore ====================

namespace {

void bind_time(sqlite3_stmt* stmt, int idx, const std::optional<TimePoint>& tp) {
    if (tp) {
        sqlite3_bind_int64(stmt, idx, to_unix(*tp));
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

std::optional<TimePoint> column_time(sqlite3_stmt* stmt, int idx) {
    if (sqlite3_column_type(stmt, idx) == SQLITE_NULL) return std::nullopt;
    return from_unix(sqlite3_column_int64(stmt, idx));
}

BanRecord row_to_record(sqlite3_stmt* stmt) {
    BanRecord r;
    const char* ip = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    const char* state = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
    r.ip = ip ? ip : "";
    r.hits = static_cast<uint32_t>(sqlite3_column_int64(stmt, 1));
    r.level = static_cast<uint32_t>(sqlite3_column_int64(stmt, 2));
    r.state = ban_state_from_string(state ? state : "").value_or(BanState::CLEAN);
    r.expiry = column_time(stmt, 4);
    r.first_failure = column_time(stmt, 5);
    r.last_failure = column_time(stmt, 6);
    r.whitelisted = sqlite3_column_int(stmt, 7) != 0;
    return r;
}

} // anonymous namespace

SqliteBanStore::SqliteBanStore(const std::string& db_path)
    : db_handle_(nullptr), db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_handle_);
    if (rc != SQLITE_OK) {
        std::string err = db_handle_ ? sqlite3_errmsg(db_handle_) : "out of memory";
        sqlite3_close(db_handle_);
        db_handle_ = nullptr;
        throw IOError("open ban database " + db_path + ": " + err);
    }
    sqlite3_busy_timeout(db_handle_, 2000);

    try {
        execute("PRAGMA journal_mode=WAL");
        execute(SCHEMA);
    } catch (const IOError&) {
        sqlite3_close(db_handle_);
        db_handle_ = nullptr;
        throw;
    }
}

SqliteBanStore::~SqliteBanStore() {
    if (db_handle_) {
        sqlite3_close(db_handle_);
        db_handle_ = nullptr;
    }
}

void SqliteBanStore::fail(const std::string& what) {
    throw IOError("ban database " + what + ": " + sqlite3_errmsg(db_handle_));
}

void SqliteBanStore::execute(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_handle_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string err = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        throw IOError("ban database " + db_path_ + ": " + err);
    }
}

std::optional<BanRecord> SqliteBanStore::load(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(SELECT_COLUMNS) + " WHERE ip = ?1";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_handle_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare load");
    }
    SqliteStmtGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, ip.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return row_to_record(stmt);
    if (rc != SQLITE_DONE) fail("load " + ip);
    return std::nullopt;
}

void SqliteBanStore::save(const BanRecord& r) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql =
        "INSERT INTO ban_records "
        "(ip, hits, level, state, expiry, first_failure, last_failure, whitelisted) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8) "
        "ON CONFLICT(ip) DO UPDATE SET "
        "hits = excluded.hits, level = excluded.level, state = excluded.state, "
        "expiry = excluded.expiry, first_failure = excluded.first_failure, "
        "last_failure = excluded.last_failure, whitelisted = excluded.whitelisted";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_handle_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare save");
    }
    SqliteStmtGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, r.ip.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, r.hits);
    sqlite3_bind_int64(stmt, 3, r.level);
    sqlite3_bind_text(stmt, 4, ban_state_to_string(r.state), -1, SQLITE_STATIC);
    bind_time(stmt, 5, r.expiry);
    bind_time(stmt, 6, r.first_failure);
    bind_time(stmt, 7, r.last_failure);
    sqlite3_bind_int(stmt, 8, r.whitelisted ? 1 : 0);

    if (sqlite3_step(stmt) != SQLITE_DONE) fail("save " + r.ip);
}

void SqliteBanStore::erase(const std::string& ip) {
    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_handle_, "DELETE FROM ban_records WHERE ip = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare erase");
    }
    SqliteStmtGuard guard(stmt);
    sqlite3_bind_text(stmt, 1, ip.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) != SQLITE_DONE) fail("erase " + ip);
}

std::vector<BanRecord> SqliteBanStore::all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string(SELECT_COLUMNS) + " ORDER BY ip";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_handle_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare list");
    }
    SqliteStmtGuard guard(stmt);

    std::vector<BanRecord> out;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        out.push_back(row_to_record(stmt));
    }
    if (rc != SQLITE_DONE) fail("list");
    return out;
}

} // namespace sgate
