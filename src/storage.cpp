// src/storage.cpp
// sqlite3 wrappers.

#include "storage.hpp"
#include "logging.hpp"
#include "datrack/error.hpp"

#include <utility>

namespace datrack {

static void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw TrackerError::storage(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

// --- SqliteDb ---

SqliteDb::SqliteDb(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw TrackerError::storage("open " + path_ + ": " + msg);
    }

    try {
        configure();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDb::~SqliteDb() {
    if (db_) sqlite3_close(db_);
}

void SqliteDb::configure() {
    // WAL lets the uploader read while producers append.
    exec("PRAGMA journal_mode=WAL;");

    // A record reported as enqueued must survive a process kill.
    exec("PRAGMA synchronous=FULL;");

    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
    exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDb::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "sqlite exec failed";
        sqlite3_free(err);
        throw TrackerError::storage(msg);
    }
}

Statement SqliteDb::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    throw_if(rc, db_, "prepare");
    return Statement(db_, stmt);
}

int64_t SqliteDb::last_insert_rowid() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

int SqliteDb::changes() const {
    return sqlite3_changes(db_);
}

// --- Statement ---

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

void Statement::check(int rc, const char* what) const {
    throw_if(rc, db_, what);
}

void Statement::bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "bind int64");
}

void Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                            SQLITE_TRANSIENT), "bind text");
}

void Statement::bind_blob(int index, const uint8_t* data, size_t len) {
    // A zero-length blob must stay a blob, not NULL.
    static const uint8_t empty = 0;
    check(sqlite3_bind_blob(stmt_, index, len > 0 ? data : &empty, static_cast<int>(len),
                            SQLITE_TRANSIENT), "bind blob");
}

void Statement::bind_null(int index) {
    check(sqlite3_bind_null(stmt_, index), "bind null");
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw TrackerError::storage(std::string("step: ") + sqlite3_errmsg(db_));
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int64(int index) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_, index);
    int len = sqlite3_column_bytes(stmt_, index);
    if (!text || len <= 0) return {};
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

std::vector<uint8_t> Statement::column_blob(int index) const {
    const void* blob = sqlite3_column_blob(stmt_, index);
    int len = sqlite3_column_bytes(stmt_, index);
    if (!blob || len <= 0) return {};
    const auto* bytes = static_cast<const uint8_t*>(blob);
    return std::vector<uint8_t>(bytes, bytes + len);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

// --- Transaction ---

Transaction::Transaction(SqliteDb& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    try {
        db_.exec("ROLLBACK;");
    } catch (const TrackerError& e) {
        DATRACK_LOG_ERROR("rollback failed", {logging::string_field("error", e.what())});
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace datrack
