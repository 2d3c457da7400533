#pragma once
#include <nlohmann/json.hpp>
#include "../config/VigilConfig.hpp"
#include "../model/Errors.hpp"
#include "../model/MarketTypes.hpp"

namespace Vigil {

// Raw feed payload -> validated MarketUpdate.
//
// Accepted shapes (numbers may arrive as strings; arrays and {"bars"|"candles": [...]} use the last element):
//   {"open","high","low","close","volume", "timestamp"|"time"}   -> Ohlcv
//   {"price", "size"|"volume",             "timestamp"|"time"}   -> Tick
// Timestamps are epoch milliseconds or ISO-8601.
class FeedNormalizer {
public:
    static Result<MarketUpdate> normalize(const FeedConfig& feed, const nlohmann::json& raw);

    /// high >= low, open/close inside [low, high], volume >= 0, prices > 0.
    static bool valid(const Ohlcv& bar) noexcept;
    static bool valid(const Tick& tick) noexcept;
};

} // namespace Vigil
