/*
Vigil — BroadcastEngine
Role: Delivers each MarketUpdate to the connections subscribed to its key.
Inputs/Outputs: publish(update) -> PublishStats; frames go onto subscriber OutboundChannels.
Threading: Any thread may publish. Publishes for the same (symbol, timeframe) are serialized on
           one lane whatever their topic; other series proceed in parallel.
Performance: One serialization per update, shared by every subscriber; never waits on a consumer.
Integration: Fed by the FeedIngestor; reads the SubscriptionRegistry.
Observability: Stale updates and overflow drops log throttled under "broadcast".
Related: BroadcastEngine.cpp, SubscriptionRegistry.hpp, OutboundChannel.hpp, ClientProtocol.hpp.
Assumptions: Source timestamps are monotonic per (symbol, timeframe); anything older than the last
             update published for that series, under any topic, is stale.
*/
#pragma once
#include <array>
#include <memory>
#include <mutex>
#include <unordered_map>
#include "SubscriptionRegistry.hpp"

namespace Vigil {

struct PublishStats {
    size_t delivered{0};   // frames enqueued (including those that displaced an older frame)
    size_t dropped{0};     // older frames displaced by overflow
    size_t skipped{0};     // dead or closed subscribers
    bool   stale{false};
};

class BroadcastEngine {
public:
    static constexpr size_t kLanes = 16;

    explicit BroadcastEngine(SubscriptionRegistry& registry) : m_registry(registry) {}

    PublishStats publish(const MarketUpdate& update);
    PublishStats publish(const std::shared_ptr<const MarketUpdate>& update) { return publish(*update); }

private:
    struct Lane {
        std::mutex                                                   mx;
        std::unordered_map<SubscriptionKey, int64_t, SubscriptionKeyHash> lastTimestamp;   // topic left empty
    };

    SubscriptionRegistry&     m_registry;
    std::array<Lane, kLanes>  m_lanes;
};

} // namespace Vigil
