#pragma once
#include "SqliteHandle.hpp"

#include <optional>
#include <string>

// Device-local, per-user key material:
//   - the serialized verification blob (sealed {timestamp, userId})
//   - the user's salt (base64), kept even when the blob is cleared
// One row per user; same-user writes are last-write-wins.
class KeyMaterialStore {
public:
    explicit KeyMaterialStore(const std::string& dbPath);

    // Create tables if not present
    void init();

    void store(const std::string& userId, const std::string& blob);

    // Empty when no row exists or the blob was cleared
    std::optional<std::string> get(const std::string& userId) const;

    // Blanks the blob, keeps the row and its salt
    void clear(const std::string& userId);

    bool has(const std::string& userId) const;

    // Salt is write-once: storing a different salt for a user that already
    // has one throws std::runtime_error. Re-storing the same value is a no-op.
    void storeSalt(const std::string& userId, const std::string& saltB64);
    std::optional<std::string> loadSalt(const std::string& userId) const;

private:
    SqliteHandle m_db;
};
