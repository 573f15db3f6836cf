// tests/temp_db.hpp
// Unique SQLite file per test, removed (with its WAL files) afterwards.
// Can inject write failures for storage error paths.

#pragma once

#include "storage.hpp"
#include "uuid.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace datrack {

class TempDb {
public:
    TempDb() : path_(::testing::TempDir() + "datrack-" + uuid_to_string(generate_uuid()) + ".db") {}

    ~TempDb() {
        std::remove(path_.c_str());
        std::remove((path_ + "-wal").c_str());
        std::remove((path_ + "-shm").c_str());
    }

    TempDb(const TempDb&) = delete;
    TempDb& operator=(const TempDb&) = delete;

    const std::string& path() const noexcept { return path_; }

    // Make every `op` ("INSERT", "UPDATE" or "DELETE") on `table` fail with a
    // storage error, through a second connection. The table must exist.
    void fail_writes(const std::string& op, const std::string& table = "queue") const {
        SqliteDb db(path_);
        db.exec("CREATE TRIGGER IF NOT EXISTS fail_" + op + "_" + table + " BEFORE " + op +
                " ON " + table + " BEGIN SELECT RAISE(ABORT, 'disk I/O error'); END;");
    }

    void restore_writes(const std::string& op, const std::string& table = "queue") const {
        SqliteDb db(path_);
        db.exec("DROP TRIGGER IF EXISTS fail_" + op + "_" + table + ";");
    }

private:
    std::string path_;
};

} // namespace datrack
