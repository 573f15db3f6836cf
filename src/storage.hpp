// src/storage.hpp
// Thin RAII wrappers around sqlite3: connection, statement, transaction.

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace datrack {

class Statement;

// One sqlite3 connection. Not shareable across threads without external
// locking; every owner serializes its own access.
class SqliteDb {
public:
    // Opens (creating if needed) and configures the database.
    // Throws TrackerError (Storage) on failure.
    explicit SqliteDb(std::string path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    sqlite3* handle() const noexcept { return db_; }
    const std::string& path() const noexcept { return path_; }

    // Execute one or more SQL statements without results.
    void exec(const std::string& sql);

    Statement prepare(const std::string& sql);

    int64_t last_insert_rowid() const;
    int changes() const;

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

// Prepared statement, finalized on destruction.
class Statement {
public:
    Statement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    // Parameter indexes are 1-based, as in sqlite3_bind_*.
    void bind(int index, int64_t value);
    void bind(int index, const std::string& value);
    void bind_blob(int index, const uint8_t* data, size_t len);
    void bind_null(int index);

    // Returns true when a row is available, false when done.
    bool step();
    void reset();

    // Column indexes are 0-based.
    int64_t column_int64(int index) const;
    std::string column_text(int index) const;
    std::vector<uint8_t> column_blob(int index) const;
    bool column_is_null(int index) const;

private:
    void check(int rc, const char* what) const;

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE ... COMMIT, rolled back on destruction unless committed.
class Transaction {
public:
    explicit Transaction(SqliteDb& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SqliteDb& db_;
    bool done_ = false;
};

} // namespace datrack
