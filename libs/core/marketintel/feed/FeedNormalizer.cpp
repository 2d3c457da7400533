#include "FeedNormalizer.hpp"
#include "Log.hpp"
#include "ParseUtils.hpp"
#include "../model/Timeframe.hpp"
#include <cmath>
#include <limits>

namespace Vigil {

namespace {

std::optional<double> number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) return ParseUtils::fastStringToDouble(it->get<std::string>());
    return std::nullopt;
}

std::optional<int64_t> timestamp(const nlohmann::json& j) {
    for (const char* key : {"timestamp", "time", "ts"}) {
        auto it = j.find(key);
        if (it == j.end()) continue;
        if (it->is_number_unsigned()) {
            const auto v = it->get<uint64_t>();
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
            return static_cast<int64_t>(v);
        }
        if (it->is_number_integer()) return it->get<int64_t>();
        if (it->is_number_float()) {
            // Anything outside int64 cannot be converted.
            const double v = it->get<double>();
            if (!std::isfinite(v) || v <= 0.0 || v >= 9.2e18) return std::nullopt;
            return static_cast<int64_t>(v);
        }
        if (it->is_string()) {
            const auto& s = it->get_ref<const std::string&>();
            if (auto iso = ParseUtils::parseISO8601Millis(s)) return iso;
            return ParseUtils::fastStringToInt(s);
        }
        return std::nullopt;
    }
    return std::nullopt;
}

const nlohmann::json* latestRecord(const nlohmann::json& raw) {
    const nlohmann::json* node = &raw;
    if (node->is_object()) {
        for (const char* key : {"bars", "candles", "data"}) {
            auto it = node->find(key);
            if (it != node->end() && (it->is_array() || it->is_object())) {
                node = &*it;
                break;
            }
        }
    }
    if (node->is_array()) {
        if (node->empty()) return nullptr;
        node = &node->back();
    }
    return node->is_object() ? node : nullptr;
}

outcome::failure_type<boost::system::error_code> rejected(const FeedConfig& feed, std::string_view why) {
    LOG_EVERY_N(WARN, 100, "feed", "{}:{} payload rejected: {}", feed.source, feed.symbol, why);
    return outcome::failure(make_error_code(Errc::upstream_failed));
}

} // namespace

bool FeedNormalizer::valid(const Ohlcv& bar) noexcept {
    for (double v : {bar.open, bar.high, bar.low, bar.close, bar.volume}) {
        if (!std::isfinite(v)) return false;
    }
    return bar.open > 0.0 && bar.high > 0.0 && bar.low > 0.0 && bar.close > 0.0
        && bar.high >= bar.low
        && bar.open >= bar.low && bar.open <= bar.high
        && bar.close >= bar.low && bar.close <= bar.high
        && bar.volume >= 0.0;
}

bool FeedNormalizer::valid(const Tick& tick) noexcept {
    return std::isfinite(tick.price) && std::isfinite(tick.size) && tick.price > 0.0 && tick.size >= 0.0;
}

Result<MarketUpdate> FeedNormalizer::normalize(const FeedConfig& feed, const nlohmann::json& raw) {
    const auto* rec = latestRecord(raw);
    if (!rec) return rejected(feed, "no record");

    auto symbol = normalizeSymbol(feed.symbol);
    auto tf = Timeframe::parse(feed.timeframe);
    if (!symbol || !tf) return rejected(feed, "bad feed configuration");

    auto ts = timestamp(*rec);
    if (!ts || *ts <= 0) return rejected(feed, "missing or invalid timestamp");

    MarketUpdate update;
    update.topic = feed.topic;
    update.symbol = std::move(*symbol);
    update.timeframe = tf->toString();
    update.timestampMs = *ts;
    update.source = feed.source;

    if (rec->contains("open") || rec->contains("close")) {
        auto o = number(*rec, "open"), h = number(*rec, "high"), l = number(*rec, "low"), c = number(*rec, "close");
        if (!o || !h || !l || !c) return rejected(feed, "incomplete OHLC");
        Ohlcv bar{*o, *h, *l, *c, number(*rec, "volume").value_or(0.0)};
        if (!valid(bar)) return rejected(feed, "OHLCV failed validation");
        update.payload = bar;
    } else if (auto price = number(*rec, "price")) {
        auto size = number(*rec, "size");
        if (!size) size = number(*rec, "volume");
        Tick tick{*price, size.value_or(0.0)};
        if (!valid(tick)) return rejected(feed, "tick failed validation");
        update.payload = tick;
    } else {
        return rejected(feed, "neither OHLCV nor tick");
    }

    return outcome::success(std::move(update));
}

} // namespace Vigil
