/*
Vigil — SubscriptionRegistry
Role: Which connections want which (topic, symbol, timeframe) keys.
Inputs/Outputs: subscribe/unsubscribe per connection; subscribersOf(key) for fan-out.
Threading: Keys and connections are each split over kShards mutex-guarded shards.
           Lock order is connection shard, then key shard.
Performance: Hash lookup per key; dropConnection touches only that connection's keys.
Integration: Mutated by the Gateway; read by the BroadcastEngine on every publish.
Observability: No internal logging.
Related: SubscriptionRegistry.cpp, OutboundChannel.hpp, BroadcastEngine.hpp.
Assumptions: A connection is registered at most once per key; repeats are no-ops.
*/
#pragma once
#include <array>
#include <map>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "OutboundChannel.hpp"

namespace Vigil {

class SubscriptionRegistry {
public:
    static constexpr size_t kShards = 16;

    /// True when the subscription is new.
    bool subscribe(const SubscriberHandle& handle, const SubscriptionKey& key);

    /// True when a subscription was removed.
    bool unsubscribe(ConnectionId id, const SubscriptionKey& key);

    [[nodiscard]] std::vector<SubscriberHandle> subscribersOf(const SubscriptionKey& key) const;

    /// Removes every subscription of the connection; returns how many there were.
    size_t dropConnection(ConnectionId id);

    [[nodiscard]] std::vector<SubscriptionKey> subscriptionsOf(ConnectionId id) const;
    [[nodiscard]] size_t subscriberCount(const SubscriptionKey& key) const;

private:
    using KeySet = std::unordered_set<SubscriptionKey, SubscriptionKeyHash>;

    struct KeyShard {
        mutable std::mutex mx;
        std::unordered_map<SubscriptionKey, std::map<ConnectionId, std::weak_ptr<OutboundChannel>>,
                           SubscriptionKeyHash> subscribers;
    };

    struct ConnectionShard {
        mutable std::mutex mx;
        std::unordered_map<ConnectionId, KeySet> keys;
    };

    KeyShard& keyShard(const SubscriptionKey& key) { return m_keyShards[SubscriptionKeyHash{}(key) % kShards]; }
    const KeyShard& keyShard(const SubscriptionKey& key) const { return m_keyShards[SubscriptionKeyHash{}(key) % kShards]; }
    ConnectionShard& connShard(ConnectionId id) { return m_connShards[id % kShards]; }
    const ConnectionShard& connShard(ConnectionId id) const { return m_connShards[id % kShards]; }

    std::array<KeyShard, kShards>        m_keyShards;
    std::array<ConnectionShard, kShards> m_connShards;
};

} // namespace Vigil
