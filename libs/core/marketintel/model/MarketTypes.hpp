#pragma once
/*
Vigil — MarketTypes
Role: Shared value types of the gateway: subscription keys, market updates, analysis requests,
      context bundles and insights.
Threading: Plain values; MarketUpdate is shared immutably once published.
Related: MarketTypes.cpp, Timeframe.hpp, Deadline.hpp, Errors.hpp.
*/
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>
#include "Deadline.hpp"

namespace Vigil {

using ConnectionId = uint64_t;

/// Opaque authenticated identity handed out by the auth collaborator.
struct Principal {
    std::string id;
};

struct SubscriptionKey {
    std::string topic;
    std::string symbol;
    std::string timeframe;

    bool operator==(const SubscriptionKey&) const = default;
    [[nodiscard]] std::string toString() const { return topic + "/" + symbol + "/" + timeframe; }
};

struct SubscriptionKeyHash {
    size_t operator()(const SubscriptionKey& k) const noexcept {
        size_t h = std::hash<std::string>{}(k.topic);
        h ^= std::hash<std::string>{}(k.symbol) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(k.timeframe) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

/// Upper-cased symbol code, or nullopt when empty, longer than 20 characters
/// or containing whitespace.
std::optional<std::string> normalizeSymbol(std::string_view raw);

struct Ohlcv {
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
};

struct Tick {
    double price{0.0};
    double size{0.0};
};

inline constexpr const char* kDefaultTopic = "market";

struct MarketUpdate {
    std::string topic{kDefaultTopic};
    std::string symbol;
    std::string timeframe;
    int64_t     timestampMs{0};   // source-supplied
    std::variant<Ohlcv, Tick> payload;
    std::string source;

    [[nodiscard]] SubscriptionKey key() const { return {topic, symbol, timeframe}; }
};

enum class AnalysisKind { Technical, Pattern, Sentiment, AiInsight };

/// Kinds served by analyzer backends; AiInsight is produced by the reasoning step.
inline constexpr std::array<AnalysisKind, 3> kAnalyzerKinds{
    AnalysisKind::Technical, AnalysisKind::Pattern, AnalysisKind::Sentiment};

std::string_view toString(AnalysisKind kind) noexcept;
std::optional<AnalysisKind> parseAnalysisKind(std::string_view text);

struct AnalysisRequest {
    std::string                requestId;
    Principal                  requester;
    std::vector<std::string>   symbols;
    std::set<AnalysisKind>     kinds;
    nlohmann::json             params = nlohmann::json::object();
    Deadline                   deadline;
};

/// One analyzer kind's outcome inside a bundle.
struct SlotOutcome {
    std::optional<nlohmann::json> result;
    boost::system::error_code     error;
    bool                          fromCache{false};

    [[nodiscard]] bool ok() const noexcept { return !error && result.has_value(); }
};

struct ContextBundle {
    std::vector<std::string>            symbols;
    std::map<AnalysisKind, SlotOutcome> slots;
    bool                                complete{false};

    [[nodiscard]] size_t successCount() const;
    [[nodiscard]] bool allFailed() const { return successCount() == 0; }
    [[nodiscard]] std::vector<AnalysisKind> missingKinds() const;

    /// {"symbols":[..], "complete":bool, "slots":{"technical":{"ok":true,"data":..}, ...}}
    [[nodiscard]] nlohmann::json toJson() const;
};

struct Insight {
    std::string                requestId;
    std::vector<std::string>   symbols;
    std::string                backend;
    nlohmann::json             content;
    bool                       partial{false};
    std::vector<AnalysisKind>  missingKinds;
    int64_t                    elapsedMs{0};
};

} // namespace Vigil
