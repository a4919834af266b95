#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// "The lockout entry for <userId> changed" notifications between instances
// that share one lockout cache.
class LockoutChannel {
public:
    using Listener = std::function<void(const std::string& userId)>;
    using SubscriptionId = std::uint64_t;

    virtual ~LockoutChannel() = default;

    // `origin` is the publisher's own subscription; it is not called back.
    // Pass 0 to reach every listener.
    virtual void publish(const std::string& userId, SubscriptionId origin) = 0;
    virtual SubscriptionId subscribe(Listener listener) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};

// Same-process fan-out. Listeners run on the publishing thread, outside the
// channel's lock, so they may publish or unsubscribe themselves.
class InProcessLockoutChannel : public LockoutChannel {
public:
    void publish(const std::string& userId, SubscriptionId origin) override;
    SubscriptionId subscribe(Listener listener) override;
    void unsubscribe(SubscriptionId id) override;

private:
    std::mutex m_mutex;
    SubscriptionId m_nextId = 1;
    std::map<SubscriptionId, Listener> m_listeners;
};
