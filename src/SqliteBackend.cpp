#include "SqliteBackend.hpp"
#include "EncryptionErrors.hpp"

#include <sqlite3.h>
#include <stdexcept>
#include <utility>

namespace {
    // Map token to user; an empty token is what an expired session looks like
    const std::string& requireUser(const std::string& token) {
        if (token.empty()) {
            throw RemoteUnavailable("Unauthorized. Please login.");
        }
        return token;
    }

    // Storage failures reach callers as RemoteUnavailable, like any other
    // backend error would.
    template <typename F>
    auto guarded(const char* op, F&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const EncryptionError&) {
            throw;
        } catch (const std::runtime_error& ex) {
            throw RemoteUnavailable(std::string(op) + ": " + ex.what());
        }
    }
}

SqliteBackend::SqliteBackend(const std::string& dbPath, BackendPolicy policy, Clock clock)
    : m_db(dbPath), m_policy(policy), m_clock(std::move(clock))
{
    if (m_policy.maxAttempts <= 0 || m_policy.lockoutSeconds <= 0) {
        throw std::invalid_argument("SqliteBackend: policy values must be positive");
    }
}

void SqliteBackend::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS users (
  user_id         TEXT PRIMARY KEY,
  salt            TEXT,
  failed_attempts INTEGER NOT NULL DEFAULT 0,
  locked_until    INTEGER
);

CREATE TABLE IF NOT EXISTS analyses (
  id               INTEGER PRIMARY KEY AUTOINCREMENT,
  user_id          TEXT NOT NULL,
  user_email       TEXT NOT NULL,
  input_content    TEXT NOT NULL,
  analysis_context TEXT,
  ml_result        TEXT NOT NULL,
  input_type       TEXT NOT NULL DEFAULT '',
  created_at       TEXT NOT NULL,
  updated_at       TEXT NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_analyses_user ON analyses(user_id, created_at);
)SQL";

    m_db.exec(kSchema);
}

EncryptionStatus SqliteBackend::getEncryptionStatus(const std::string& token) {
    const std::string& userId = requireUser(token);
    return guarded("getEncryptionStatus", [&] {
        EncryptionStatus out;
        {
            Statement stmt = m_db.prepare("SELECT salt FROM users WHERE user_id = ?;", "status salt");
            m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
            int rc = sqlite3_step(stmt.get());
            if (rc == SQLITE_ROW) {
                auto salt = readTextOpt(stmt.get(), 0);
                if (salt && !salt->empty()) {
                    out.hasSalt = true;
                    out.salt = std::move(salt);
                }
            } else if (rc != SQLITE_DONE) {
                throw std::runtime_error(std::string("step status salt: ") + sqlite3_errmsg(m_db.raw()));
            }
        }
        {
            Statement stmt = m_db.prepare(
                "SELECT EXISTS(SELECT 1 FROM analyses WHERE user_id = ?);", "status analyses");
            m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
            if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
                throw std::runtime_error(std::string("step status analyses: ") + sqlite3_errmsg(m_db.raw()));
            }
            out.hasAnalyses = sqlite3_column_int(stmt.get(), 0) != 0;
        }
        return out;
    });
}

void SqliteBackend::saveSalt(const std::string& token, const std::string& saltB64) {
    const std::string& userId = requireUser(token);
    if (saltB64.empty()) {
        throw std::invalid_argument("saveSalt: salt must not be empty");
    }
    guarded("saveSalt", [&] {
        auto status = getEncryptionStatus(token);
        if (status.salt) {
            if (*status.salt == saltB64) return;
            throw RemoteUnavailable("Failed to save salt: salt already set");
        }

        const char* sql = R"SQL(
            INSERT INTO users (user_id, salt) VALUES (?, ?)
            ON CONFLICT(user_id) DO UPDATE SET salt = excluded.salt;
        )SQL";
        Statement stmt = m_db.prepare(sql, "saveSalt");
        m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(),  -1, SQLITE_TRANSIENT), "bind user_id");
        m_db.check(sqlite3_bind_text(stmt.get(), 2, saltB64.c_str(), -1, SQLITE_TRANSIENT), "bind salt");
        m_db.stepDone(stmt.get(), "saveSalt");
    });
}

std::vector<EncryptedRecord> SqliteBackend::listRecords(const std::string& token, std::size_t limit) {
    const std::string& userId = requireUser(token);
    return guarded("listRecords", [&] {
        const char* sql = R"SQL(
            SELECT id, user_email, input_content, analysis_context, ml_result,
                   input_type, created_at, updated_at
            FROM analyses WHERE user_id = ?
            ORDER BY created_at DESC, id DESC
            LIMIT ?;
        )SQL";

        Statement stmt = m_db.prepare(sql, "listRecords");
        m_db.check(sqlite3_bind_text (stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
        m_db.check(sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit)), "bind limit");

        std::vector<EncryptedRecord> out;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            EncryptedRecord r;
            r.id              = std::to_string(sqlite3_column_int64(stmt.get(), 0));
            r.userEmail       = readText(stmt.get(), 1);
            r.inputContent    = readText(stmt.get(), 2);
            r.analysisContext = readTextOpt(stmt.get(), 3);
            r.mlResult        = readText(stmt.get(), 4);
            r.inputType       = readText(stmt.get(), 5);
            r.createdAt       = readText(stmt.get(), 6);
            r.updatedAt       = readText(stmt.get(), 7);
            out.push_back(std::move(r));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("step listRecords: ") + sqlite3_errmsg(m_db.raw()));
        }
        return out;
    });
}

UnlockAttemptStatus SqliteBackend::loadAttempts(const std::string& userId) {
    Statement stmt = m_db.prepare(
        "SELECT failed_attempts, locked_until FROM users WHERE user_id = ?;", "loadAttempts");
    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");

    UnlockAttemptStatus out;
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        out.attempts    = sqlite3_column_int(stmt.get(), 0);
        out.lockedUntil = readInt64Opt(stmt.get(), 1);
    } else if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("step loadAttempts: ") + sqlite3_errmsg(m_db.raw()));
    }
    return out;
}

void SqliteBackend::storeAttempts(const std::string& userId, const UnlockAttemptStatus& status) {
    const char* sql = R"SQL(
        INSERT INTO users (user_id, failed_attempts, locked_until) VALUES (?, ?, ?)
        ON CONFLICT(user_id) DO UPDATE SET
          failed_attempts = excluded.failed_attempts,
          locked_until    = excluded.locked_until;
    )SQL";
    Statement stmt = m_db.prepare(sql, "storeAttempts");
    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
    m_db.check(sqlite3_bind_int (stmt.get(), 2, status.attempts), "bind attempts");
    if (status.lockedUntil) {
        m_db.check(sqlite3_bind_int64(stmt.get(), 3, *status.lockedUntil), "bind locked_until");
    } else {
        m_db.check(sqlite3_bind_null(stmt.get(), 3), "bind locked_until");
    }
    m_db.stepDone(stmt.get(), "storeAttempts");
}

UnlockAttemptStatus SqliteBackend::getUnlockAttempts(const std::string& token) {
    const std::string& userId = requireUser(token);
    return guarded("getUnlockAttempts", [&] {
        UnlockAttemptStatus status = loadAttempts(userId);
        // Time-based expiry is the only automatic reset
        if (status.lockedUntil && m_clock() >= *status.lockedUntil) {
            status = UnlockAttemptStatus{};
            storeAttempts(userId, status);
        }
        return status;
    });
}

UnlockAttemptStatus SqliteBackend::recordUnlockAttempt(const std::string& token, bool success) {
    const std::string& userId = requireUser(token);
    UnlockAttemptStatus status = getUnlockAttempts(token);
    return guarded("recordUnlockAttempt", [&] {
        if (success) {
            status = UnlockAttemptStatus{};
        } else if (!status.lockedUntil) {
            ++status.attempts;
            if (status.attempts >= m_policy.maxAttempts) {
                status.lockedUntil = m_clock()
                    + static_cast<std::int64_t>(m_policy.lockoutSeconds) * 1000;
            }
        }
        storeAttempts(userId, status);
        return status;
    });
}

std::string SqliteBackend::saveRecord(const std::string& token, const EncryptedRecord& record) {
    const std::string& userId = requireUser(token);
    return guarded("saveRecord", [&] {
        const char* sql = R"SQL(
            INSERT INTO analyses(user_id, user_email, input_content, analysis_context,
                                 ml_result, input_type, created_at, updated_at)
            VALUES(?, ?, ?, ?, ?, ?, ?, ?);
        )SQL";

        Statement stmt = m_db.prepare(sql, "saveRecord");
        const std::string ts = nowUtcIso8601();
        const std::string& createdAt = record.createdAt.empty() ? ts : record.createdAt;
        const std::string& updatedAt = record.updatedAt.empty() ? createdAt : record.updatedAt;

        m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(),              -1, SQLITE_TRANSIENT), "bind user_id");
        m_db.check(sqlite3_bind_text(stmt.get(), 2, record.userEmail.c_str(),    -1, SQLITE_TRANSIENT), "bind user_email");
        m_db.check(sqlite3_bind_text(stmt.get(), 3, record.inputContent.c_str(), -1, SQLITE_TRANSIENT), "bind input_content");
        if (record.analysisContext) {
            m_db.check(sqlite3_bind_text(stmt.get(), 4, record.analysisContext->c_str(), -1, SQLITE_TRANSIENT),
                       "bind analysis_context");
        } else {
            m_db.check(sqlite3_bind_null(stmt.get(), 4), "bind analysis_context");
        }
        m_db.check(sqlite3_bind_text(stmt.get(), 5, record.mlResult.c_str(),  -1, SQLITE_TRANSIENT), "bind ml_result");
        m_db.check(sqlite3_bind_text(stmt.get(), 6, record.inputType.c_str(), -1, SQLITE_TRANSIENT), "bind input_type");
        m_db.check(sqlite3_bind_text(stmt.get(), 7, createdAt.c_str(),        -1, SQLITE_TRANSIENT), "bind created_at");
        m_db.check(sqlite3_bind_text(stmt.get(), 8, updatedAt.c_str(),        -1, SQLITE_TRANSIENT), "bind updated_at");

        m_db.stepDone(stmt.get(), "saveRecord");
        return std::to_string(sqlite3_last_insert_rowid(m_db.raw()));
    });
}

void SqliteBackend::resetUnlockAttempts(const std::string& userId) {
    storeAttempts(userId, UnlockAttemptStatus{});
}
