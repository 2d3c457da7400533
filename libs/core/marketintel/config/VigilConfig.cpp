#include "VigilConfig.hpp"
#include "Log.hpp"
#include "ParseUtils.hpp"
#include "../model/Timeframe.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace Vigil {

namespace {

Millis readMillis(const nlohmann::json& j, const char* key, Millis def) {
    if (!j.contains(key)) return def;
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a non-negative integer (ms)");
    }
    return Millis{v.get<int64_t>()};
}

template <typename T>
T readUnsigned(const nlohmann::json& j, const char* key, T def) {
    if (!j.contains(key)) return def;
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a non-negative integer");
    }
    return static_cast<T>(v.get<uint64_t>());
}

double readDouble(const nlohmann::json& j, const char* key, double def) {
    if (!j.contains(key)) return def;
    const auto& v = j.at(key);
    if (!v.is_number()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a number");
    }
    return v.get<double>();
}

SourceLimits readLimits(const nlohmann::json& j, const SourceLimits& base) {
    SourceLimits out = base;
    // Per-minute / per-hour quotas translate to a bucket holding the whole quota.
    if (j.contains("requests_per_minute")) {
        auto rpm = readUnsigned<uint32_t>(j, "requests_per_minute", 0);
        out.capacity = rpm;
        out.refillPerSec = rpm / 60.0;
    }
    if (j.contains("requests_per_hour")) {
        auto rph = readUnsigned<uint32_t>(j, "requests_per_hour", 0);
        double refill = rph / 3600.0;
        if (!j.contains("requests_per_minute") || refill < out.refillPerSec) {
            out.capacity = rph;
            out.refillPerSec = refill;
        }
    }
    out.capacity = readDouble(j, "capacity", out.capacity);
    out.refillPerSec = readDouble(j, "refill_per_sec", out.refillPerSec);
    out.failureThreshold = readUnsigned<uint32_t>(j, "failure_threshold", out.failureThreshold);
    out.cooldown = readMillis(j, "cooldown_ms", out.cooldown);
    return out;
}

} // namespace

SourceLimits FetchConfig::limitsFor(const std::string& source) const {
    auto it = sources.find(source);
    return it != sources.end() ? it->second : defaults;
}

Millis CacheConfig::ttlFor(AnalysisKind kind) const {
    switch (kind) {
        case AnalysisKind::Technical: return technicalTtl;
        case AnalysisKind::Pattern:   return patternTtl;
        case AnalysisKind::Sentiment: return sentimentTtl;
        case AnalysisKind::AiInsight: break;
    }
    return marketTtl;
}

bool FeatureFlags::analyzerEnabled(AnalysisKind kind) const {
    switch (kind) {
        case AnalysisKind::Pattern:   return patternRecognition;
        case AnalysisKind::Sentiment: return sentimentAnalysis;
        case AnalysisKind::AiInsight: return aiInsights;
        case AnalysisKind::Technical: break;
    }
    return true;
}

VigilConfig VigilConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("config: top level must be a JSON object");

    VigilConfig cfg;
    try {
        if (auto it = j.find("server"); it != j.end()) {
            const auto& s = *it;
            cfg.server.host = s.value("host", cfg.server.host);
            auto port = readUnsigned<uint32_t>(s, "port", cfg.server.port);
            if (port > 65535) throw std::runtime_error("config: 'port' out of range");
            cfg.server.port = static_cast<uint16_t>(port);
            cfg.server.authTimeout = readMillis(s, "auth_timeout_ms", cfg.server.authTimeout);
            cfg.server.outboundCapacity = readUnsigned<size_t>(s, "outbound_capacity", cfg.server.outboundCapacity);
            cfg.server.maxInflightPerConnection =
                readUnsigned<size_t>(s, "max_inflight_per_connection", cfg.server.maxInflightPerConnection);
            cfg.server.maxSubscriptionsPerConnection =
                readUnsigned<size_t>(s, "max_subscriptions_per_connection", cfg.server.maxSubscriptionsPerConnection);
            cfg.server.defaultDeadline = readMillis(s, "default_deadline_ms", cfg.server.defaultDeadline);
            cfg.server.maxDeadline = readMillis(s, "max_deadline_ms", cfg.server.maxDeadline);
        }

        if (auto it = j.find("threads"); it != j.end()) {
            cfg.threads.io = readUnsigned<size_t>(*it, "io", cfg.threads.io);
            cfg.threads.request = readUnsigned<size_t>(*it, "request", cfg.threads.request);
            cfg.threads.backend = readUnsigned<size_t>(*it, "backend", cfg.threads.backend);
        }

        if (auto it = j.find("fetch"); it != j.end()) {
            if (auto d = it->find("default"); d != it->end()) {
                cfg.fetch.defaults = readLimits(*d, cfg.fetch.defaults);
            }
            if (auto srcs = it->find("sources"); srcs != it->end() && srcs->is_object()) {
                for (const auto& [name, limits] : srcs->items()) {
                    cfg.fetch.sources[name] = readLimits(limits, cfg.fetch.defaults);
                }
            }
        }

        if (auto it = j.find("cache"); it != j.end()) {
            if (auto ttl = it->find("ttl_ms"); ttl != it->end()) {
                cfg.cache.technicalTtl = readMillis(*ttl, "technical", cfg.cache.technicalTtl);
                cfg.cache.patternTtl = readMillis(*ttl, "pattern", cfg.cache.patternTtl);
                cfg.cache.sentimentTtl = readMillis(*ttl, "sentiment", cfg.cache.sentimentTtl);
                cfg.cache.marketTtl = readMillis(*ttl, "market", cfg.cache.marketTtl);
            }
            cfg.cache.purgeEveryNWrites = readUnsigned<size_t>(*it, "purge_every_n_writes", cfg.cache.purgeEveryNWrites);
        }

        if (auto it = j.find("reasoning"); it != j.end()) {
            cfg.reasoning.localBudget = readMillis(*it, "local_budget_ms", cfg.reasoning.localBudget);
            cfg.reasoning.contextShare = readDouble(*it, "context_share", cfg.reasoning.contextShare);
        }

        if (auto it = j.find("features"); it != j.end()) {
            cfg.features.aiInsights = it->value("enable_ai_insights", cfg.features.aiInsights);
            cfg.features.patternRecognition = it->value("enable_pattern_recognition", cfg.features.patternRecognition);
            cfg.features.sentimentAnalysis = it->value("enable_sentiment_analysis", cfg.features.sentimentAnalysis);
            cfg.features.realTimeUpdates = it->value("enable_real_time_updates", cfg.features.realTimeUpdates);
        }

        if (auto it = j.find("feeds"); it != j.end()) {
            if (!it->is_array()) throw std::runtime_error("config: 'feeds' must be an array");
            for (const auto& f : *it) {
                FeedConfig feed;
                feed.source = f.value("source", "");
                feed.symbol = f.value("symbol", "");
                feed.timeframe = f.value("timeframe", feed.timeframe);
                feed.topic = f.value("topic", feed.topic);
                feed.interval = readMillis(f, "interval_ms", feed.interval);
                cfg.feeds.push_back(std::move(feed));
            }
        }

        if (auto it = j.find("auth"); it != j.end()) {
            cfg.tokensFile = it->value("tokens_file", cfg.tokensFile);
        }

        if (auto it = j.find("logging"); it != j.end()) {
            cfg.logLevel = it->value("level", cfg.logLevel);
        }
    }
    catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("config: malformed value: ") + ex.what());
    }
    return cfg;
}

VigilConfig VigilConfig::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("config: failed to open " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    }
    catch (const std::exception& ex) {
        throw std::runtime_error("config: failed to parse JSON from " + path + ": " + ex.what());
    }

    auto cfg = fromJson(j);
    LOG_I("config", "loaded {} ({} feed(s), {} source override(s))", path, cfg.feeds.size(), cfg.fetch.sources.size());
    return cfg;
}

void VigilConfig::applyEnvironment() {
    if (const char* host = std::getenv("VIGIL_HOST"); host && *host) {
        server.host = host;
        LOG_I("config", "VIGIL_HOST override: {}", server.host);
    }
    if (const char* port = std::getenv("VIGIL_PORT"); port && *port) {
        auto parsed = ParseUtils::fastStringToInt(port);
        if (!parsed || *parsed <= 0 || *parsed > 65535) {
            throw std::runtime_error(std::string("config: invalid VIGIL_PORT: ") + port);
        }
        server.port = static_cast<uint16_t>(*parsed);
        LOG_I("config", "VIGIL_PORT override: {}", server.port);
    }
    if (const char* tokens = std::getenv("VIGIL_TOKENS_FILE"); tokens && *tokens) {
        tokensFile = tokens;
        LOG_I("config", "VIGIL_TOKENS_FILE override: {}", tokensFile);
    }
    if (const char* level = std::getenv("VIGIL_LOG"); level && *level) {
        logLevel = level;
    }
}

void VigilConfig::validate() const {
    if (server.port == 0) throw std::runtime_error("config: server.port must be non-zero");
    if (server.outboundCapacity == 0) throw std::runtime_error("config: server.outbound_capacity must be > 0");
    if (server.maxInflightPerConnection == 0) {
        throw std::runtime_error("config: server.max_inflight_per_connection must be > 0");
    }
    if (server.maxSubscriptionsPerConnection == 0) {
        throw std::runtime_error("config: server.max_subscriptions_per_connection must be > 0");
    }
    if (server.defaultDeadline.count() <= 0 || server.defaultDeadline > server.maxDeadline) {
        throw std::runtime_error("config: server.default_deadline_ms must be in (0, max_deadline_ms]");
    }
    if (threads.io == 0 || threads.request == 0 || threads.backend == 0) {
        throw std::runtime_error("config: thread counts must be > 0");
    }

    auto checkLimits = [](const std::string& name, const SourceLimits& l) {
        if (l.capacity < 1.0) throw std::runtime_error("config: fetch '" + name + "' capacity must be >= 1");
        if (l.refillPerSec <= 0.0) throw std::runtime_error("config: fetch '" + name + "' refill rate must be > 0");
        if (l.failureThreshold == 0) throw std::runtime_error("config: fetch '" + name + "' failure_threshold must be > 0");
    };
    checkLimits("default", fetch.defaults);
    for (const auto& [name, limits] : fetch.sources) checkLimits(name, limits);

    if (!(reasoning.contextShare > 0.0 && reasoning.contextShare <= 1.0)) {
        throw std::runtime_error("config: reasoning.context_share must be in (0, 1]");
    }

    if (cache.purgeEveryNWrites == 0) throw std::runtime_error("config: cache.purge_every_n_writes must be > 0");

    for (const auto& feed : feeds) {
        if (feed.source.empty()) throw std::runtime_error("config: feed without 'source'");
        if (!normalizeSymbol(feed.symbol)) throw std::runtime_error("config: feed has invalid symbol '" + feed.symbol + "'");
        if (!Timeframe::parse(feed.timeframe)) {
            throw std::runtime_error("config: feed has invalid timeframe '" + feed.timeframe + "'");
        }
        if (feed.interval.count() <= 0) throw std::runtime_error("config: feed interval_ms must be > 0");
    }
}

} // namespace Vigil
