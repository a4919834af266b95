#include "LockoutChannel.hpp"

#include <utility>
#include <vector>

void InProcessLockoutChannel::publish(const std::string& userId, SubscriptionId origin) {
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        snapshot.reserve(m_listeners.size());
        for (const auto& kv : m_listeners) {
            if (kv.first != origin) snapshot.push_back(kv.second);
        }
    }
    for (const auto& listener : snapshot) {
        listener(userId);
    }
}

LockoutChannel::SubscriptionId InProcessLockoutChannel::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const SubscriptionId id = m_nextId++;
    m_listeners.emplace(id, std::move(listener));
    return id;
}

void InProcessLockoutChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.erase(id);
}
