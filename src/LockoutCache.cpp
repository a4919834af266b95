#include "LockoutCache.hpp"

#include <sqlite3.h>
#include <stdexcept>

LockoutCache::LockoutCache(const std::string& dbPath)
    : m_db(dbPath)
{
}

void LockoutCache::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS lockout_cache (
  user_id      TEXT PRIMARY KEY,
  locked_until INTEGER,
  attempts     INTEGER NOT NULL DEFAULT 0,
  timestamp    INTEGER NOT NULL
);
)SQL";

    m_db.exec(kSchema);
}

void LockoutCache::put(const std::string& userId, const LockoutCacheEntry& entry) {
    const char* sql = R"SQL(
        INSERT INTO lockout_cache (user_id, locked_until, attempts, timestamp)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(user_id) DO UPDATE SET
          locked_until = excluded.locked_until,
          attempts     = excluded.attempts,
          timestamp    = excluded.timestamp;
    )SQL";

    Statement stmt = m_db.prepare(sql, "put lockout");

    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
    if (entry.lockedUntil) {
        m_db.check(sqlite3_bind_int64(stmt.get(), 2, *entry.lockedUntil), "bind locked_until");
    } else {
        m_db.check(sqlite3_bind_null(stmt.get(), 2), "bind locked_until");
    }
    m_db.check(sqlite3_bind_int  (stmt.get(), 3, entry.attempts),  "bind attempts");
    m_db.check(sqlite3_bind_int64(stmt.get(), 4, entry.timestamp), "bind timestamp");

    m_db.stepDone(stmt.get(), "put lockout");
}

std::optional<LockoutCacheEntry> LockoutCache::get(const std::string& userId) {
    const char* sql =
        "SELECT locked_until, attempts, timestamp FROM lockout_cache WHERE user_id = ?;";
    std::optional<LockoutCacheEntry> out;
    {
        Statement stmt = m_db.prepare(sql, "get lockout");
        m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            LockoutCacheEntry e;
            e.lockedUntil = readInt64Opt(stmt.get(), 0);
            e.attempts    = sqlite3_column_int(stmt.get(), 1);
            e.timestamp   = static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 2));
            out = e;
        } else if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("sqlite3_step(get lockout): ")
                                     + sqlite3_errmsg(m_db.raw()));
        }
    }

    if (out && out->attempts < 0) {
        remove(userId);
        return std::nullopt;
    }
    return out;
}

void LockoutCache::remove(const std::string& userId) {
    Statement stmt = m_db.prepare("DELETE FROM lockout_cache WHERE user_id = ?;", "remove lockout");
    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
    m_db.stepDone(stmt.get(), "remove lockout");
}
