#pragma once
#include "SqliteHandle.hpp"

#include <cstdint>
#include <optional>
#include <string>

struct LockoutCacheEntry {
    std::optional<std::int64_t> lockedUntil;   // ms since epoch
    int attempts = 0;
    std::int64_t timestamp = 0;                // ms since epoch, when written
};

// Advisory, device-local copy of the backend's unlock-attempt counter.
// Shared by every instance on the device; last write wins.
class LockoutCache {
public:
    explicit LockoutCache(const std::string& dbPath);

    void init();

    void put(const std::string& userId, const LockoutCacheEntry& entry);

    // A row with a negative attempt count is dropped and reported as absent
    std::optional<LockoutCacheEntry> get(const std::string& userId);

    void remove(const std::string& userId);

private:
    SqliteHandle m_db;
};
