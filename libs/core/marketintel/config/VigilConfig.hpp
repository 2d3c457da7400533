/*
Vigil — VigilConfig
Role: Typed gateway configuration: server, thread pools, fetch limits, cache TTLs, features, feeds.
Inputs/Outputs: Reads a JSON file; VIGIL_* environment variables override selected fields.
Threading: Built once at startup, then read-only; safe to share by const reference.
Integration: Loaded by apps/vigil_gateway and handed to every service constructor.
Observability: Load and override steps log under the "config" category.
Related: VigilConfig.cpp, vigil.example.json.
Assumptions: Missing keys keep their defaults; unknown keys are ignored.
*/
#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/MarketTypes.hpp"

namespace Vigil {

using Millis = std::chrono::milliseconds;

struct ServerConfig {
    std::string host{"0.0.0.0"};
    uint16_t    port{8080};
    Millis      authTimeout{5000};
    size_t      outboundCapacity{256};
    size_t      maxInflightPerConnection{8};
    size_t      maxSubscriptionsPerConnection{256};
    Millis      defaultDeadline{5000};
    Millis      maxDeadline{30000};
};

struct ThreadConfig {
    size_t io{1};
    size_t request{4};
    size_t backend{8};
};

/// Token bucket plus breaker settings for one upstream source.
struct SourceLimits {
    double   capacity{10.0};
    double   refillPerSec{5.0};
    uint32_t failureThreshold{5};
    Millis   cooldown{30000};
};

struct FetchConfig {
    SourceLimits                        defaults;
    std::map<std::string, SourceLimits> sources;

    [[nodiscard]] SourceLimits limitsFor(const std::string& source) const;
};

struct CacheConfig {
    Millis technicalTtl{60000};
    Millis patternTtl{300000};
    Millis sentimentTtl{900000};
    Millis marketTtl{5000};
    size_t purgeEveryNWrites{256};

    [[nodiscard]] Millis ttlFor(AnalysisKind kind) const;
};

struct ReasoningConfig {
    Millis localBudget{1500};
    double contextShare{0.6};   // part of the remaining budget given to context assembly
};

struct FeatureFlags {
    bool aiInsights{true};
    bool patternRecognition{true};
    bool sentimentAnalysis{true};
    bool realTimeUpdates{true};

    [[nodiscard]] bool analyzerEnabled(AnalysisKind kind) const;
};

struct FeedConfig {
    std::string source;
    std::string symbol;
    std::string timeframe{"1m"};
    std::string topic{kDefaultTopic};
    Millis      interval{1000};
};

struct VigilConfig {
    ServerConfig            server;
    ThreadConfig            threads;
    FetchConfig             fetch;
    CacheConfig             cache;
    ReasoningConfig         reasoning;
    FeatureFlags            features;
    std::vector<FeedConfig> feeds;
    std::string             tokensFile{"tokens.json"};
    std::string             logLevel;   // empty keeps VIGIL_LOG / default

    /// Throws std::runtime_error on malformed values.
    static VigilConfig fromJson(const nlohmann::json& j);

    /// Throws std::runtime_error when the file is missing or not valid JSON.
    static VigilConfig loadFile(const std::string& path);

    /// Applies VIGIL_HOST, VIGIL_PORT, VIGIL_TOKENS_FILE and VIGIL_LOG.
    void applyEnvironment();

    /// Throws std::runtime_error describing the first invalid setting.
    void validate() const;
};

} // namespace Vigil
