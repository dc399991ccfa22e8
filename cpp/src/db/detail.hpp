#pragma once

#include <sqlite3.h>

namespace sqlcas::db::detail {
    // Holds the connection mutex across several sqlite3_* calls so that
    // sqlite3_errmsg() reports the error of this caller's statement.
    class ConnectionLock {
    public:
        explicit ConnectionLock(sqlite3* db) noexcept : mutex_(db ? sqlite3_db_mutex(db) : nullptr) {
            sqlite3_mutex_enter(mutex_);
        }
        ~ConnectionLock() noexcept { sqlite3_mutex_leave(mutex_); }

        ConnectionLock(const ConnectionLock&) = delete;
        ConnectionLock& operator=(const ConnectionLock&) = delete;

    private:
        sqlite3_mutex* mutex_;
    };
} // namespace sqlcas::db::detail
