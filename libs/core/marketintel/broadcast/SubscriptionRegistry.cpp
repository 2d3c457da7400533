#include "SubscriptionRegistry.hpp"

namespace Vigil {

bool SubscriptionRegistry::subscribe(const SubscriberHandle& handle, const SubscriptionKey& key) {
    auto& cs = connShard(handle.id);
    std::lock_guard<std::mutex> connLock(cs.mx);
    if (!cs.keys[handle.id].insert(key).second) return false;

    auto& ks = keyShard(key);
    std::lock_guard<std::mutex> keyLock(ks.mx);
    ks.subscribers[key].emplace(handle.id, handle.channel);
    return true;
}

bool SubscriptionRegistry::unsubscribe(ConnectionId id, const SubscriptionKey& key) {
    auto& cs = connShard(id);
    std::lock_guard<std::mutex> connLock(cs.mx);
    auto it = cs.keys.find(id);
    if (it == cs.keys.end() || it->second.erase(key) == 0) return false;
    if (it->second.empty()) cs.keys.erase(it);

    auto& ks = keyShard(key);
    std::lock_guard<std::mutex> keyLock(ks.mx);
    if (auto sub = ks.subscribers.find(key); sub != ks.subscribers.end()) {
        sub->second.erase(id);
        if (sub->second.empty()) ks.subscribers.erase(sub);
    }
    return true;
}

std::vector<SubscriberHandle> SubscriptionRegistry::subscribersOf(const SubscriptionKey& key) const {
    std::vector<SubscriberHandle> out;
    const auto& ks = keyShard(key);
    std::lock_guard<std::mutex> lock(ks.mx);
    auto it = ks.subscribers.find(key);
    if (it == ks.subscribers.end()) return out;
    out.reserve(it->second.size());
    for (const auto& [id, channel] : it->second) out.push_back(SubscriberHandle{id, channel});
    return out;
}

size_t SubscriptionRegistry::dropConnection(ConnectionId id) {
    auto& cs = connShard(id);
    std::lock_guard<std::mutex> connLock(cs.mx);
    auto it = cs.keys.find(id);
    if (it == cs.keys.end()) return 0;

    const size_t n = it->second.size();
    for (const auto& key : it->second) {
        auto& ks = keyShard(key);
        std::lock_guard<std::mutex> keyLock(ks.mx);
        if (auto sub = ks.subscribers.find(key); sub != ks.subscribers.end()) {
            sub->second.erase(id);
            if (sub->second.empty()) ks.subscribers.erase(sub);
        }
    }
    cs.keys.erase(it);
    return n;
}

std::vector<SubscriptionKey> SubscriptionRegistry::subscriptionsOf(ConnectionId id) const {
    const auto& cs = connShard(id);
    std::lock_guard<std::mutex> lock(cs.mx);
    auto it = cs.keys.find(id);
    if (it == cs.keys.end()) return {};
    return {it->second.begin(), it->second.end()};
}

size_t SubscriptionRegistry::subscriberCount(const SubscriptionKey& key) const {
    const auto& ks = keyShard(key);
    std::lock_guard<std::mutex> lock(ks.mx);
    auto it = ks.subscribers.find(key);
    return it == ks.subscribers.end() ? 0 : it->second.size();
}

} // namespace Vigil
