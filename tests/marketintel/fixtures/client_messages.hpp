#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/// Builders for inbound client frames
namespace fixtures {

inline std::string authFrame(const std::string& token) {
    return nlohmann::json{{"type", "auth"}, {"token", token}}.dump();
}

inline std::string subscribeFrame(const std::string& symbol,
                                  const std::string& timeframe = "1m",
                                  const std::string& topic = "market") {
    return nlohmann::json{{"type", "subscribe"}, {"topic", topic}, {"symbol", symbol},
                          {"timeframe", timeframe}}.dump();
}

inline std::string unsubscribeFrame(const std::string& symbol,
                                    const std::string& timeframe = "1m",
                                    const std::string& topic = "market") {
    return nlohmann::json{{"type", "unsubscribe"}, {"topic", topic}, {"symbol", symbol},
                          {"timeframe", timeframe}}.dump();
}

inline std::string analyzeFrame(const std::string& id,
                                const std::vector<std::string>& symbols,
                                const std::vector<std::string>& kinds = {"ai-insight"},
                                int64_t deadlineMs = 2000) {
    return nlohmann::json{{"type", "analyze"}, {"id", id}, {"symbols", symbols},
                          {"kinds", kinds}, {"deadline_ms", deadlineMs}}.dump();
}

/// A one-bar OHLCV payload as a feed source would return it
inline nlohmann::json ohlcvBar(int64_t ts, double open, double high, double low, double close, double volume) {
    return nlohmann::json{{"timestamp", ts}, {"open", open}, {"high", high},
                          {"low", low}, {"close", close}, {"volume", volume}};
}

} // namespace fixtures
