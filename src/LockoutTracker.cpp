#include "LockoutTracker.hpp"

#include <loguru.hpp>
#include <stdexcept>
#include <utility>

LockoutTracker::LockoutTracker(RemoteBackend& remote,
                               TokenProvider tokens,
                               LockoutCache& cache,
                               LockoutChannel* channel,
                               LockoutSettings settings,
                               Clock clock)
    : m_remote(remote),
      m_tokens(std::move(tokens)),
      m_cache(cache),
      m_channel(channel),
      m_settings(settings),
      m_clock(std::move(clock))
{
    if (m_channel) {
        m_subscription = m_channel->subscribe(
            [this](const std::string& userId) { onSiblingChange(userId); });
    }
}

LockoutTracker::~LockoutTracker() {
    if (m_channel) {
        m_channel->unsubscribe(m_subscription);
    }
}

LockoutStatus LockoutTracker::status(const std::string& userId) const {
    const std::int64_t now = m_clock();
    LockoutStatus out;
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(userId);
        if (it != m_entries.end()) {
            out.attempts = it->second.attempts;
            out.lockedUntil = it->second.lockedUntil;
            known = true;
        }
    }

    // Not seen by this instance yet: another one on the device may have written it
    if (!known) {
        try {
            auto cached = m_cache.get(userId);
            if (cached && isFresh(*cached, now)) {
                out.attempts = cached->attempts;
                out.lockedUntil = cached->lockedUntil;
            }
        } catch (const std::runtime_error& ex) {
            LOG_F(WARNING, "Lockout cache unreadable: %s", ex.what());
        }
    }

    if (out.lockedUntil) {
        const std::int64_t remainingMs = *out.lockedUntil - now;
        if (remainingMs > 0) {
            out.isLocked = true;
            out.remainingSeconds = (remainingMs + 999) / 1000;
        }
    }
    return out;
}

void LockoutTracker::refresh(const std::string& userId) {
    const std::int64_t now = m_clock();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Entry& e = m_entries[userId];
        if (e.lastRefreshMs && now - *e.lastRefreshMs < m_settings.refreshIntervalMs) {
            return;
        }
        e.lastRefreshMs = now;
    }

    try {
        if (auto cached = m_cache.get(userId)) {
            if (isFresh(*cached, now)) {
                setEntry(userId, cached->attempts, cached->lockedUntil);
                return;
            }
        }
    } catch (const std::runtime_error& ex) {
        LOG_F(WARNING, "Lockout cache unreadable, asking backend: %s", ex.what());
    }

    UnlockAttemptStatus remote;
    try {
        remote = m_remote.getUnlockAttempts(m_tokens());
    } catch (const std::exception& ex) {
        LOG_F(WARNING, "Unlock-attempt status unavailable, showing unlocked: %s", ex.what());
        setEntry(userId, 0, std::nullopt);
        return;
    }

    // An elapsed lock is an expired lock: the backend resets the counter with it
    if (remote.lockedUntil && *remote.lockedUntil <= now) {
        remote = UnlockAttemptStatus{};
    }
    persist(userId, remote, now);
    setEntry(userId, remote.attempts, remote.lockedUntil);
}

void LockoutTracker::apply(const std::string& userId, const UnlockAttemptStatus& reported) {
    const std::int64_t now = m_clock();
    UnlockAttemptStatus status = reported;
    if (status.lockedUntil && *status.lockedUntil <= now) {
        status = UnlockAttemptStatus{};
    }
    persist(userId, status, now);
    setEntry(userId, status.attempts, status.lockedUntil);
}

void LockoutTracker::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

bool LockoutTracker::isFresh(const LockoutCacheEntry& cached, std::int64_t now) const {
    if (now - cached.timestamp >= m_settings.cacheTtlMs) return false;
    if (cached.lockedUntil) return *cached.lockedUntil > now;
    return true;
}

void LockoutTracker::persist(const std::string& userId,
                             const UnlockAttemptStatus& status,
                             std::int64_t now) {
    try {
        if (status.lockedUntil || status.attempts > 0) {
            LockoutCacheEntry entry;
            entry.lockedUntil = status.lockedUntil;
            entry.attempts = status.attempts;
            entry.timestamp = now;
            m_cache.put(userId, entry);
        } else {
            m_cache.remove(userId);
        }
    } catch (const std::runtime_error& ex) {
        LOG_F(WARNING, "Could not update lockout cache: %s", ex.what());
        return;
    }

    if (m_channel) {
        m_channel->publish(userId, m_subscription);
    }
}

void LockoutTracker::setEntry(const std::string& userId,
                              int attempts,
                              std::optional<std::int64_t> lockedUntil) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        Entry& e = m_entries[userId];
        e.attempts = attempts;
        e.lockedUntil = lockedUntil;
        listener = m_listener;
    }
    if (listener) {
        listener(userId, status(userId));
    }
}

void LockoutTracker::onSiblingChange(const std::string& userId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_entries.find(userId) == m_entries.end()) return;
    }

    std::optional<LockoutCacheEntry> cached;
    try {
        cached = m_cache.get(userId);
    } catch (const std::runtime_error& ex) {
        LOG_F(WARNING, "Lockout cache unreadable after change notice: %s", ex.what());
        return;
    }
    if (cached) {
        setEntry(userId, cached->attempts, cached->lockedUntil);
    } else {
        setEntry(userId, 0, std::nullopt);
    }
}
