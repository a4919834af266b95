#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Forward-declare sqlite3 so consumers of this header don't need sqlite3.h
struct sqlite3;
struct sqlite3_stmt;

struct StmtCloser {
    void operator()(sqlite3_stmt* stmt) const;
};
using Statement = std::unique_ptr<sqlite3_stmt, StmtCloser>;

// One persistent SQLite connection. Several handles (processes, tabs) may
// open the same file; writers wait up to `busyTimeoutMs` for each other.
class SqliteHandle {
public:
    explicit SqliteHandle(const std::string& dbPath, int busyTimeoutMs = 5000);
    ~SqliteHandle();

    SqliteHandle(const SqliteHandle&) = delete;
    SqliteHandle& operator=(const SqliteHandle&) = delete;

    // Run raw SQL without parameters
    void exec(const std::string& sql) const;

    // Throws std::runtime_error tagged with `what` on failure
    Statement prepare(const char* sql, const char* what) const;

    // Throws std::runtime_error("<what>: <sqlite message>") when code != SQLITE_OK
    void check(int code, const char* what) const;

    // sqlite3_step expecting SQLITE_DONE
    void stepDone(sqlite3_stmt* stmt, const char* what) const;

    sqlite3* raw() const { return m_db; }
    const std::string& path() const { return m_dbPath; }

private:
    std::string m_dbPath;
    sqlite3*    m_db = nullptr;
};

// Null-safe column readers
std::string readText(sqlite3_stmt* st, int col);
std::optional<std::string> readTextOpt(sqlite3_stmt* st, int col);
std::optional<std::int64_t> readInt64Opt(sqlite3_stmt* st, int col);

// UTC now in ISO-8601 "YYYY-MM-DDTHH:MM:SSZ"
std::string nowUtcIso8601();
