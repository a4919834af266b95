#include "KeyMaterialStore.hpp"

#include <sqlite3.h>
#include <stdexcept>

KeyMaterialStore::KeyMaterialStore(const std::string& dbPath)
    : m_db(dbPath)
{
}

void KeyMaterialStore::init() {
    static const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS key_material (
  user_id                     TEXT PRIMARY KEY,
  encrypted_verification_blob TEXT NOT NULL DEFAULT '',
  salt                        TEXT,
  created_at                  TEXT NOT NULL,
  updated_at                  TEXT NOT NULL
);
)SQL";

    m_db.exec(kSchema);
}

void KeyMaterialStore::store(const std::string& userId, const std::string& blob) {
    const char* sql = R"SQL(
        INSERT INTO key_material (user_id, encrypted_verification_blob, created_at, updated_at)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(user_id) DO UPDATE SET
          encrypted_verification_blob = excluded.encrypted_verification_blob,
          updated_at = excluded.updated_at;
    )SQL";

    Statement stmt = m_db.prepare(sql, "store");
    const std::string ts = nowUtcIso8601();

    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
    m_db.check(sqlite3_bind_text(stmt.get(), 2, blob.c_str(),   -1, SQLITE_TRANSIENT), "bind blob");
    m_db.check(sqlite3_bind_text(stmt.get(), 3, ts.c_str(),     -1, SQLITE_TRANSIENT), "bind created_at");
    m_db.check(sqlite3_bind_text(stmt.get(), 4, ts.c_str(),     -1, SQLITE_TRANSIENT), "bind updated_at");

    m_db.stepDone(stmt.get(), "store");
}

std::optional<std::string> KeyMaterialStore::get(const std::string& userId) const {
    const char* sql =
        "SELECT encrypted_verification_blob FROM key_material WHERE user_id = ?;";
    Statement stmt = m_db.prepare(sql, "get");
    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        std::string blob = readText(stmt.get(), 0);
        if (blob.empty()) return std::nullopt;
        return blob;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    } else {
        throw std::runtime_error(std::string("sqlite3_step(get): ") + sqlite3_errmsg(m_db.raw()));
    }
}

void KeyMaterialStore::clear(const std::string& userId) {
    const char* sql = R"SQL(
        UPDATE key_material
        SET encrypted_verification_blob = '', updated_at = ?
        WHERE user_id = ?;
    )SQL";

    Statement stmt = m_db.prepare(sql, "clear");
    const std::string ts = nowUtcIso8601();
    m_db.check(sqlite3_bind_text(stmt.get(), 1, ts.c_str(),     -1, SQLITE_TRANSIENT), "bind updated_at");
    m_db.check(sqlite3_bind_text(stmt.get(), 2, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");
    m_db.stepDone(stmt.get(), "clear");
}

bool KeyMaterialStore::has(const std::string& userId) const {
    return get(userId).has_value();
}

void KeyMaterialStore::storeSalt(const std::string& userId, const std::string& saltB64) {
    if (saltB64.empty()) {
        throw std::invalid_argument("storeSalt: salt must not be empty");
    }
    if (auto existing = loadSalt(userId)) {
        if (*existing == saltB64) return;
        throw std::runtime_error("storeSalt: salt already set for this user");
    }

    const char* sql = R"SQL(
        INSERT INTO key_material (user_id, salt, created_at, updated_at)
        VALUES (?, ?, ?, ?)
        ON CONFLICT(user_id) DO UPDATE SET
          salt = excluded.salt,
          updated_at = excluded.updated_at;
    )SQL";

    Statement stmt = m_db.prepare(sql, "storeSalt");
    const std::string ts = nowUtcIso8601();

    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(),  -1, SQLITE_TRANSIENT), "bind user_id");
    m_db.check(sqlite3_bind_text(stmt.get(), 2, saltB64.c_str(), -1, SQLITE_TRANSIENT), "bind salt");
    m_db.check(sqlite3_bind_text(stmt.get(), 3, ts.c_str(),      -1, SQLITE_TRANSIENT), "bind created_at");
    m_db.check(sqlite3_bind_text(stmt.get(), 4, ts.c_str(),      -1, SQLITE_TRANSIENT), "bind updated_at");

    m_db.stepDone(stmt.get(), "storeSalt");
}

std::optional<std::string> KeyMaterialStore::loadSalt(const std::string& userId) const {
    const char* sql = "SELECT salt FROM key_material WHERE user_id = ?;";
    Statement stmt = m_db.prepare(sql, "loadSalt");
    m_db.check(sqlite3_bind_text(stmt.get(), 1, userId.c_str(), -1, SQLITE_TRANSIENT), "bind user_id");

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        auto salt = readTextOpt(stmt.get(), 0);
        if (!salt || salt->empty()) return std::nullopt;
        return salt;
    } else if (rc == SQLITE_DONE) {
        return std::nullopt;
    } else {
        throw std::runtime_error(std::string("sqlite3_step(loadSalt): ") + sqlite3_errmsg(m_db.raw()));
    }
}
