#include "BroadcastEngine.hpp"
#include "Log.hpp"
#include "../protocol/ClientProtocol.hpp"

namespace Vigil {

PublishStats BroadcastEngine::publish(const MarketUpdate& update) {
    PublishStats stats;
    const auto key = update.key();
    // Ordering is per (symbol, timeframe) across every topic carrying that series.
    const SubscriptionKey series{"", update.symbol, update.timeframe};
    auto& lane = m_lanes[SubscriptionKeyHash{}(series) % kLanes];

    std::lock_guard<std::mutex> lock(lane.mx);

    auto [it, inserted] = lane.lastTimestamp.try_emplace(series, update.timestampMs);
    if (!inserted) {
        if (update.timestampMs < it->second) {
            stats.stale = true;
            LOG_EVERY_N(DEBUG, 100, "broadcast", "stale update for {} ({} < {})", key.toString(),
                        update.timestampMs, it->second);
            return stats;
        }
        it->second = update.timestampMs;
    }

    auto subscribers = m_registry.subscribersOf(key);
    if (subscribers.empty()) return stats;

    auto frame = std::make_shared<const std::string>(ClientProtocol::encodeMarketUpdate(update));
    for (const auto& sub : subscribers) {
        auto channel = sub.channel.lock();
        if (!channel) {
            ++stats.skipped;
            continue;
        }
        switch (channel->push(frame)) {
            case OutboundChannel::PushResult::Enqueued:
                ++stats.delivered;
                break;
            case OutboundChannel::PushResult::DroppedOldest:
                ++stats.delivered;
                ++stats.dropped;
                break;
            case OutboundChannel::PushResult::Closed:
                ++stats.skipped;
                break;
        }
    }

    if (stats.dropped > 0) {
        LOG_EVERY_N(WARN, 1000, "broadcast", "{}: {} slow subscriber(s) dropped their oldest frame",
                    key.toString(), stats.dropped);
    }
    return stats;
}

} // namespace Vigil
