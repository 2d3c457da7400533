#include "StandIns.hpp"
#include "marketintel/feed/FeedIngestor.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace Vigil::StandIns {

SimulatedFeedSource::SimulatedFeedSource(double startPrice, uint32_t seed)
    : m_rng(seed)
    , m_startPrice(startPrice)
{}

Result<nlohmann::json> SimulatedFeedSource::pollOrStream(const FetchParams& params, const Deadline& deadline) {
    if (deadline.expired()) return outcome::failure(make_error_code(Errc::timeout));

    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_last.try_emplace(params.symbol, m_startPrice).first;
    const double open = it->second;

    std::normal_distribution<double> step(0.0, 0.002);
    std::uniform_real_distribution<double> wick(0.0, 0.001);
    std::uniform_real_distribution<double> vol(1.0, 50.0);

    const double close = std::max(0.01, open * (1.0 + step(m_rng)));
    const double high = std::max(open, close) * (1.0 + wick(m_rng));
    const double low = std::min(open, close) * (1.0 - wick(m_rng));
    it->second = close;

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    return outcome::success(nlohmann::json{
        {"timestamp", now}, {"open", open}, {"high", high}, {"low", low}, {"close", close}, {"volume", vol(m_rng)}});
}

Result<nlohmann::json> SnapshotAnalyzer::analyze(const std::string& symbol, const nlohmann::json& params,
                                                 const Deadline& deadline) {
    if (deadline.expired()) return outcome::failure(make_error_code(Errc::timeout));

    std::string timeframe = "1m";
    if (auto tf = params.find("timeframe"); tf != params.end() && tf->is_string()) timeframe = tf->get<std::string>();

    auto bar = m_cache.get(FeedIngestor::latestKey(symbol, timeframe));
    if (!bar || !bar->contains("close")) return outcome::failure(make_error_code(Errc::upstream_failed));

    const double open = bar->value("open", 0.0);
    const double high = bar->value("high", 0.0);
    const double low = bar->value("low", 0.0);
    const double close = bar->value("close", 0.0);
    const double changePct = open > 0.0 ? (close - open) / open * 100.0 : 0.0;

    switch (m_kind) {
        case AnalysisKind::Technical:
            return outcome::success(nlohmann::json{
                {"last", close}, {"range", high - low}, {"change_pct", changePct}, {"as_of", bar->value("timestamp", 0)}});
        case AnalysisKind::Pattern: {
            const double span = high - low;
            return outcome::success(nlohmann::json{
                {"bar", close >= open ? "bullish" : "bearish"},
                {"body_ratio", span > 0.0 ? std::abs(close - open) / span : 0.0}});
        }
        case AnalysisKind::Sentiment: {
            const double score = std::clamp(changePct / 5.0, -1.0, 1.0);
            return outcome::success(nlohmann::json{
                {"score", score}, {"label", score > 0.1 ? "positive" : score < -0.1 ? "negative" : "neutral"}});
        }
        case AnalysisKind::AiInsight:
            break;
    }
    return outcome::failure(make_error_code(Errc::invalid_request));
}

Result<nlohmann::json> SummaryReasoningBackend::infer(const ContextBundle& bundle, const Deadline& deadline) {
    if (deadline.expired()) return outcome::failure(make_error_code(Errc::timeout));

    nlohmann::json used = nlohmann::json::array();
    for (const auto& [kind, slot] : bundle.slots) {
        if (slot.ok()) used.push_back(std::string(toString(kind)));
    }

    std::string summary = "Context for ";
    for (size_t i = 0; i < bundle.symbols.size(); ++i) {
        if (i) summary += ", ";
        summary += bundle.symbols[i];
    }
    summary += bundle.complete ? " is complete." : " is partial.";

    return outcome::success(nlohmann::json{
        {"model", m_name}, {"summary", summary}, {"used", used}, {"context", bundle.toJson()}});
}

} // namespace Vigil::StandIns
