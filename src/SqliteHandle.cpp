#include "SqliteHandle.hpp"

#include <sqlite3.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

void StmtCloser::operator()(sqlite3_stmt* stmt) const {
    if (stmt) sqlite3_finalize(stmt);
}

SqliteHandle::SqliteHandle(const std::string& dbPath, int busyTimeoutMs)
    : m_dbPath(dbPath), m_db(nullptr)
{
    int rc = sqlite3_open_v2(
        m_dbPath.c_str(),
        &m_db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK || !m_db) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "unknown";
        if (m_db) sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("sqlite3_open_v2 failed: " + msg);
    }

    sqlite3_busy_timeout(m_db, busyTimeoutMs);
    exec("PRAGMA foreign_keys = ON;");
}

SqliteHandle::~SqliteHandle() {
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

void SqliteHandle::exec(const std::string& sql) const {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : "unknown";
        sqlite3_free(errMsg);
        throw std::runtime_error("sqlite3_exec failed: " + msg);
    }
}

Statement SqliteHandle::prepare(const char* sql, const char* what) const {
    sqlite3_stmt* stmtRaw = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql, -1, &stmtRaw, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite3_prepare_v2(") + what + "): "
                                 + sqlite3_errmsg(m_db));
    }
    return Statement(stmtRaw);
}

void SqliteHandle::check(int code, const char* what) const {
    if (code != SQLITE_OK) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(m_db));
    }
}

void SqliteHandle::stepDone(sqlite3_stmt* stmt, const char* what) const {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("step ") + what + ": " + sqlite3_errmsg(m_db));
    }
}

std::string readText(sqlite3_stmt* st, int col) {
    const unsigned char* p = sqlite3_column_text(st, col);
    return p ? reinterpret_cast<const char*>(p) : std::string{};
}

std::optional<std::string> readTextOpt(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return readText(st, col);
}

std::optional<std::int64_t> readInt64Opt(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::string nowUtcIso8601() {
    using namespace std::chrono;
    auto now  = system_clock::now();
    auto secs = time_point_cast<seconds>(now);
    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}
