#include "MarketTypes.hpp"
#include "Errors.hpp"
#include "ParseUtils.hpp"

namespace Vigil {

std::optional<std::string> normalizeSymbol(std::string_view raw) {
    if (raw.empty() || raw.size() > 20) return std::nullopt;
    for (char c : raw) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            return std::nullopt;
        }
    }
    return ParseUtils::toUpper(raw);
}

std::string_view toString(AnalysisKind kind) noexcept {
    switch (kind) {
        case AnalysisKind::Technical: return "technical";
        case AnalysisKind::Pattern:   return "pattern";
        case AnalysisKind::Sentiment: return "sentiment";
        case AnalysisKind::AiInsight: return "ai-insight";
    }
    return "unknown";
}

std::optional<AnalysisKind> parseAnalysisKind(std::string_view text) {
    if (ParseUtils::equalsIgnoreCase(text, "technical")) return AnalysisKind::Technical;
    if (ParseUtils::equalsIgnoreCase(text, "pattern"))   return AnalysisKind::Pattern;
    if (ParseUtils::equalsIgnoreCase(text, "sentiment")) return AnalysisKind::Sentiment;
    if (ParseUtils::equalsIgnoreCase(text, "ai-insight") ||
        ParseUtils::equalsIgnoreCase(text, "ai_insight")) return AnalysisKind::AiInsight;
    return std::nullopt;
}

size_t ContextBundle::successCount() const {
    size_t n = 0;
    for (const auto& [kind, slot] : slots) {
        if (slot.ok()) ++n;
    }
    return n;
}

std::vector<AnalysisKind> ContextBundle::missingKinds() const {
    std::vector<AnalysisKind> out;
    for (const auto& [kind, slot] : slots) {
        if (!slot.ok()) out.push_back(kind);
    }
    return out;
}

nlohmann::json ContextBundle::toJson() const {
    nlohmann::json slotsJson = nlohmann::json::object();
    for (const auto& [kind, slot] : slots) {
        nlohmann::json s;
        s["ok"] = slot.ok();
        if (slot.ok()) {
            s["data"] = *slot.result;
            s["cached"] = slot.fromCache;
        } else {
            s["error"] = std::string(errorKindName(slot.error));
        }
        slotsJson[std::string(toString(kind))] = std::move(s);
    }
    return nlohmann::json{
        {"symbols", symbols},
        {"complete", complete},
        {"slots", std::move(slotsJson)},
    };
}

} // namespace Vigil
