#pragma once
#include "Clock.hpp"
#include "LockoutCache.hpp"
#include "LockoutChannel.hpp"
#include "RemoteBackend.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

struct LockoutStatus {
    bool isLocked = false;
    std::int64_t remainingSeconds = 0;
    int attempts = 0;
    std::optional<std::int64_t> lockedUntil;   // ms since epoch
};

struct LockoutSettings {
    std::int64_t refreshIntervalMs = 1000;     // refresh() is a no-op inside this window
    std::int64_t cacheTtlMs = 60000;           // cached entries older than this go back to the backend
};

// Failed-unlock counter and lockout countdown per user, for display.
//
// Sources, in order: the device-local cache while it is fresh, then the
// backend. Whatever is read from the backend is written back to the cache
// and announced on the channel so sibling trackers (other tabs/windows on
// this device) re-read the cache instead of polling the backend.
//
// This is a UX affordance only. The backend enforces the lockout, and
// EncryptionSession::unlock asks the backend directly; nothing here gates
// an unlock.
class LockoutTracker {
public:
    using Listener = std::function<void(const std::string& userId, const LockoutStatus& status)>;

    LockoutTracker(RemoteBackend& remote,
                   TokenProvider tokens,
                   LockoutCache& cache,
                   LockoutChannel* channel = nullptr,
                   LockoutSettings settings = {},
                   Clock clock = systemNowMs);
    ~LockoutTracker();

    LockoutTracker(const LockoutTracker&) = delete;
    LockoutTracker& operator=(const LockoutTracker&) = delete;

    // Last known state, with remainingSeconds computed against now
    LockoutStatus status(const std::string& userId) const;

    // Re-check; throttled per user. Backend failures reset the user to
    // "not locked, zero attempts" instead of throwing.
    void refresh(const std::string& userId);

    // Status the backend returned for an unlock attempt
    void apply(const std::string& userId, const UnlockAttemptStatus& reported);

    // Called whenever a user's state changes (refresh, apply, sibling notice)
    void setListener(Listener listener);

private:
    struct Entry {
        int attempts = 0;
        std::optional<std::int64_t> lockedUntil;
        std::optional<std::int64_t> lastRefreshMs;
    };

    bool isFresh(const LockoutCacheEntry& cached, std::int64_t now) const;
    void persist(const std::string& userId, const UnlockAttemptStatus& status, std::int64_t now);
    void setEntry(const std::string& userId, int attempts, std::optional<std::int64_t> lockedUntil);
    void onSiblingChange(const std::string& userId);

    RemoteBackend&   m_remote;
    TokenProvider    m_tokens;
    LockoutCache&    m_cache;
    LockoutChannel*  m_channel;
    LockoutSettings  m_settings;
    Clock            m_clock;
    LockoutChannel::SubscriptionId m_subscription = 0;

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    Listener m_listener;
};
