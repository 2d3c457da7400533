/*
Vigil — ClientProtocol
Role: JSON text-frame codec for the client-facing WebSocket protocol.
Inputs/Outputs: decode() turns an inbound frame into a typed ClientMessage; encode*() build outbound frames.
Threading: Stateless; all functions are pure.
Integration: Gateway decodes inbound frames and encodes replies; BroadcastEngine encodes market updates.
Related: ClientProtocol.cpp, Gateway.hpp, BroadcastEngine.hpp.
Assumptions: Malformed JSON or an unknown "type" is a protocol violation; bad field values are
             an invalid request and leave the connection open.
*/
#pragma once
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/Errors.hpp"
#include "../model/MarketTypes.hpp"

namespace Vigil {

struct AuthMsg        { std::string token; };
struct SubscribeMsg   { SubscriptionKey key; };
struct UnsubscribeMsg { SubscriptionKey key; };
struct AnalyzeMsg {
    std::string                              id;
    std::vector<std::string>                 symbols;
    std::set<AnalysisKind>                   kinds;
    nlohmann::json                           params = nlohmann::json::object();
    std::optional<std::chrono::milliseconds> deadline;
};

using ClientMessage = std::variant<AuthMsg, SubscribeMsg, UnsubscribeMsg, AnalyzeMsg>;

struct DecodeResult {
    std::optional<ClientMessage> message;
    boost::system::error_code    error;
    std::string                  detail;      // log only
    std::optional<std::string>   requestId;   // echoed in the error frame when known

    explicit operator bool() const noexcept { return message.has_value(); }
};

namespace ClientProtocol {

inline constexpr size_t kMaxTopicLength = 64;

DecodeResult decode(std::string_view frame);

std::string encodeAck(std::string_view op, nlohmann::json extra = nlohmann::json::object());
std::string encodeError(const boost::system::error_code& ec, const std::optional<std::string>& requestId = std::nullopt);
std::string encodeInsight(const Insight& insight);
std::string encodeMarketUpdate(const MarketUpdate& update);

} // namespace ClientProtocol
} // namespace Vigil
