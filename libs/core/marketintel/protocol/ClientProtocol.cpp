#include "ClientProtocol.hpp"
#include "ParseUtils.hpp"
#include "../model/Timeframe.hpp"
#include <algorithm>

namespace Vigil::ClientProtocol {

namespace {

DecodeResult fail(Errc code, std::string detail, std::optional<std::string> id = std::nullopt) {
    DecodeResult r;
    r.error = make_error_code(code);
    r.detail = std::move(detail);
    r.requestId = std::move(id);
    return r;
}

DecodeResult ok(ClientMessage msg) {
    DecodeResult r;
    r.message = std::move(msg);
    return r;
}

std::optional<std::string> stringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

DecodeResult decodeKey(const nlohmann::json& j, bool subscribe) {
    std::string topic = kDefaultTopic;
    if (j.contains("topic")) {
        auto t = stringField(j, "topic");
        if (!t || t->empty() || t->size() > kMaxTopicLength) {
            return fail(Errc::invalid_request, "bad topic");
        }
        topic = std::move(*t);
    }

    auto rawSymbol = stringField(j, "symbol");
    if (!rawSymbol) return fail(Errc::invalid_request, "missing symbol");
    auto symbol = normalizeSymbol(*rawSymbol);
    if (!symbol) return fail(Errc::invalid_request, "invalid symbol '" + *rawSymbol + "'");

    auto rawTf = stringField(j, "timeframe");
    if (!rawTf) return fail(Errc::invalid_request, "missing timeframe");
    auto tf = Timeframe::parse(*rawTf);
    if (!tf) return fail(Errc::invalid_request, "invalid timeframe '" + *rawTf + "'");

    SubscriptionKey key{std::move(topic), std::move(*symbol), tf->toString()};
    if (subscribe) return ok(SubscribeMsg{std::move(key)});
    return ok(UnsubscribeMsg{std::move(key)});
}

DecodeResult decodeAnalyze(const nlohmann::json& j) {
    AnalyzeMsg msg;

    auto idIt = j.find("id");
    if (idIt == j.end()) return fail(Errc::invalid_request, "analyze without id");
    if (idIt->is_string()) {
        msg.id = idIt->get<std::string>();
    } else if (idIt->is_number_integer()) {
        msg.id = std::to_string(idIt->get<int64_t>());
    } else {
        return fail(Errc::invalid_request, "analyze id must be a string or integer");
    }
    if (msg.id.empty()) return fail(Errc::invalid_request, "empty analyze id");

    std::vector<std::string> rawSymbols;
    if (auto s = j.find("symbols"); s != j.end()) {
        if (!s->is_array()) return fail(Errc::invalid_request, "symbols must be an array", msg.id);
        for (const auto& v : *s) {
            if (!v.is_string()) return fail(Errc::invalid_request, "symbols must be strings", msg.id);
            rawSymbols.push_back(v.get<std::string>());
        }
    } else if (auto s1 = stringField(j, "symbol")) {
        rawSymbols.push_back(std::move(*s1));
    }
    if (rawSymbols.empty()) return fail(Errc::invalid_request, "analyze without symbols", msg.id);

    for (const auto& raw : rawSymbols) {
        auto sym = normalizeSymbol(raw);
        if (!sym) return fail(Errc::invalid_request, "invalid symbol '" + raw + "'", msg.id);
        if (std::find(msg.symbols.begin(), msg.symbols.end(), *sym) == msg.symbols.end()) {
            msg.symbols.push_back(std::move(*sym));
        }
    }

    if (auto k = j.find("kinds"); k != j.end()) {
        if (!k->is_array() || k->empty()) return fail(Errc::invalid_request, "kinds must be a non-empty array", msg.id);
        for (const auto& v : *k) {
            auto kind = v.is_string() ? parseAnalysisKind(v.get<std::string>()) : std::nullopt;
            if (!kind) return fail(Errc::invalid_request, "unknown analysis kind " + v.dump(), msg.id);
            msg.kinds.insert(*kind);
        }
    } else {
        msg.kinds.insert(AnalysisKind::AiInsight);
    }

    if (auto d = j.find("deadline_ms"); d != j.end()) {
        if (!d->is_number_integer() || d->get<int64_t>() <= 0) {
            return fail(Errc::invalid_request, "deadline_ms must be a positive integer", msg.id);
        }
        msg.deadline = std::chrono::milliseconds{d->get<int64_t>()};
    }

    if (auto p = j.find("params"); p != j.end()) {
        if (!p->is_object()) return fail(Errc::invalid_request, "params must be an object", msg.id);
        msg.params = *p;
    }
    if (auto tf = msg.params.find("timeframe"); tf != msg.params.end()) {
        auto parsed = tf->is_string() ? Timeframe::parse(tf->get<std::string>()) : std::nullopt;
        if (!parsed) return fail(Errc::invalid_request, "invalid params.timeframe", msg.id);
        *tf = parsed->toString();
    }

    return ok(std::move(msg));
}

} // namespace

DecodeResult decode(std::string_view frame) {
    auto j = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) return fail(Errc::protocol_violation, "frame is not valid JSON");
    if (!j.is_object()) return fail(Errc::protocol_violation, "frame is not a JSON object");

    auto type = stringField(j, "type");
    if (!type) return fail(Errc::protocol_violation, "frame without type");

    if (*type == "auth") {
        auto token = stringField(j, "token");
        if (!token) return fail(Errc::protocol_violation, "auth without token");
        return ok(AuthMsg{std::move(*token)});
    }
    if (*type == "subscribe")   return decodeKey(j, true);
    if (*type == "unsubscribe") return decodeKey(j, false);
    if (*type == "analyze")     return decodeAnalyze(j);

    return fail(Errc::protocol_violation, "unknown frame type '" + *type + "'");
}

std::string encodeAck(std::string_view op, nlohmann::json extra) {
    nlohmann::json msg = extra.is_object() ? std::move(extra) : nlohmann::json::object();
    msg["type"] = "ack";
    msg["op"] = std::string(op);
    return msg.dump();
}

std::string encodeError(const boost::system::error_code& ec, const std::optional<std::string>& requestId) {
    nlohmann::json msg;
    msg["type"] = "error";
    msg["code"] = std::string(errorKindName(ec));
    msg["message"] = clientMessage(ec);
    if (requestId) msg["id"] = *requestId;
    return msg.dump();
}

std::string encodeInsight(const Insight& insight) {
    nlohmann::json missing = nlohmann::json::array();
    for (auto kind : insight.missingKinds) missing.push_back(std::string(toString(kind)));

    nlohmann::json msg;
    msg["type"] = "insight";
    msg["id"] = insight.requestId;
    msg["symbols"] = insight.symbols;
    msg["backend"] = insight.backend;
    msg["partial"] = insight.partial;
    msg["missing"] = std::move(missing);
    msg["elapsed_ms"] = insight.elapsedMs;
    msg["content"] = insight.content;
    return msg.dump();
}

std::string encodeMarketUpdate(const MarketUpdate& update) {
    nlohmann::json data;
    if (const auto* bar = std::get_if<Ohlcv>(&update.payload)) {
        data = {{"kind", "ohlcv"}, {"open", bar->open}, {"high", bar->high}, {"low", bar->low},
                {"close", bar->close}, {"volume", bar->volume}};
    } else if (const auto* tick = std::get_if<Tick>(&update.payload)) {
        data = {{"kind", "tick"}, {"price", tick->price}, {"size", tick->size}};
    }

    nlohmann::json msg;
    msg["type"] = "marketUpdate";
    msg["topic"] = update.topic;
    msg["symbol"] = update.symbol;
    msg["timeframe"] = update.timeframe;
    msg["timestamp"] = update.timestampMs;
    msg["time"] = ParseUtils::formatMillisUtc(update.timestampMs);
    if (!update.source.empty()) msg["source"] = update.source;
    msg["data"] = std::move(data);
    return msg.dump();
}

} // namespace Vigil::ClientProtocol
