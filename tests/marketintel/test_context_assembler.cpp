/*
Vigil — ContextAssembler Tests
Role: Verify concurrent analyzer fan-out, per-slot outcomes, completeness and cache write-back
Testing Strategy: ScriptedSource analyzers behind a real RateLimitedFetcher and thread pool;
                  generous timing margins around deadlines
Coverage: Complete bundles, timeouts, failures, cancellation, caching, feature flags, multi-symbol merge
*/
#include <gtest/gtest.h>
#include "marketintel/analysis/ContextAssembler.hpp"
#include "fixtures/scripted_sources.hpp"
#include <map>
#include <memory>

using namespace Vigil;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class ContextAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SourceLimits generous;
        generous.capacity = 1000;
        generous.refillPerSec = 1000;
        for (auto kind : kAnalyzerKinds) {
            auto src = std::make_shared<fixtures::ScriptedSource>(nlohmann::json{{"kind", std::string(toString(kind))}});
            sources[kind] = src;
            fetcher.registerSource(ContextAssembler::sourceName(kind), src, generous);
        }
    }

    void TearDown() override {
        pool.join();
    }

    ContextAssembler& makeAssembler(FeatureFlags flags = {}) {
        assembler = std::make_unique<ContextAssembler>(cache, fetcher, pool, CacheConfig{}, flags);
        return *assembler;
    }

    static AnalysisRequest request(std::set<AnalysisKind> kinds,
                                   std::vector<std::string> symbols = {"BTC-USD"},
                                   std::chrono::milliseconds budget = 2s) {
        AnalysisRequest r;
        r.requestId = "req-1";
        r.requester = Principal{"alice"};
        r.symbols = std::move(symbols);
        r.kinds = std::move(kinds);
        r.deadline = Deadline::after(budget);
        return r;
    }

    TtlCache cache;
    RateLimitedFetcher fetcher;
    boost::asio::thread_pool pool{6};
    std::map<AnalysisKind, std::shared_ptr<fixtures::ScriptedSource>> sources;
    std::unique_ptr<ContextAssembler> assembler;
};

// =============================================================================
// Required Kinds
// =============================================================================

TEST_F(ContextAssemblerTest, InsightAloneExpandsToEnabledAnalyzers) {
    FeatureFlags flags;
    flags.patternRecognition = false;
    auto& a = makeAssembler(flags);

    auto kinds = a.requiredKinds({AnalysisKind::AiInsight});
    EXPECT_EQ(kinds, (std::set<AnalysisKind>{AnalysisKind::Technical, AnalysisKind::Sentiment}));

    kinds = a.requiredKinds({AnalysisKind::Technical, AnalysisKind::AiInsight});
    EXPECT_EQ(kinds, (std::set<AnalysisKind>{AnalysisKind::Technical}));
}

TEST_F(ContextAssemblerTest, SourceNamesFollowKind) {
    EXPECT_EQ(ContextAssembler::sourceName(AnalysisKind::Sentiment), "analyzer.sentiment");
}

// =============================================================================
// Completeness
// =============================================================================

TEST_F(ContextAssemblerTest, AllKindsSucceedGivesCompleteBundle) {
    auto& a = makeAssembler();
    auto bundle = a.assemble(request({AnalysisKind::AiInsight}));

    EXPECT_TRUE(bundle.complete);
    ASSERT_EQ(bundle.slots.size(), 3u);
    for (auto kind : kAnalyzerKinds) {
        const auto& slot = bundle.slots.at(kind);
        ASSERT_TRUE(slot.ok()) << toString(kind);
        EXPECT_EQ((*slot.result)["kind"], std::string(toString(kind)));
        EXPECT_EQ((*slot.result)["symbol"], "BTC-USD");
        EXPECT_FALSE(slot.fromCache);
    }
}

TEST_F(ContextAssemblerTest, OneTimeoutClearsCompletenessButKeepsOthers) {
    sources[AnalysisKind::Sentiment]->setDelay(5s);
    auto& a = makeAssembler();

    auto started = std::chrono::steady_clock::now();
    auto bundle = a.assemble(request({AnalysisKind::Technical, AnalysisKind::Sentiment}, {"BTC-USD"}, 300ms));
    auto took = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(bundle.complete);
    ASSERT_EQ(bundle.slots.size(), 2u);
    EXPECT_TRUE(bundle.slots.at(AnalysisKind::Technical).ok());
    EXPECT_EQ(bundle.slots.at(AnalysisKind::Sentiment).error, make_error_code(Errc::timeout));
    EXPECT_LT(took, 1500ms) << "assembly must end at the deadline";

    pool.join();
    EXPECT_EQ(sources[AnalysisKind::Sentiment]->cancelled(), 1) << "outstanding call is cancelled";
}

TEST_F(ContextAssemblerTest, FailedAnalyzerIsRecordedPerSlot) {
    sources[AnalysisKind::Pattern]->setFailing(true);
    auto& a = makeAssembler();

    auto bundle = a.assemble(request({AnalysisKind::AiInsight}));
    EXPECT_FALSE(bundle.complete);
    EXPECT_EQ(bundle.successCount(), 2u);
    EXPECT_EQ(bundle.slots.at(AnalysisKind::Pattern).error, make_error_code(Errc::upstream_failed));
    ASSERT_EQ(bundle.missingKinds().size(), 1u);
    EXPECT_EQ(bundle.missingKinds()[0], AnalysisKind::Pattern);
}

TEST_F(ContextAssemblerTest, AllFailedBundleIsEmptyOfResults) {
    for (auto& [kind, src] : sources) src->setFailing(true);
    auto& a = makeAssembler();

    auto bundle = a.assemble(request({AnalysisKind::AiInsight}));
    EXPECT_FALSE(bundle.complete);
    EXPECT_TRUE(bundle.allFailed());
}

TEST_F(ContextAssemblerTest, AnalyzersRunConcurrently) {
    for (auto& [kind, src] : sources) src->setDelay(200ms);
    auto& a = makeAssembler();

    auto started = std::chrono::steady_clock::now();
    auto bundle = a.assemble(request({AnalysisKind::AiInsight}));
    auto took = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(bundle.complete);
    EXPECT_LT(took, 550ms) << "three 200ms analyzers should overlap";
}

// =============================================================================
// Cache Layer Interaction
// =============================================================================

TEST_F(ContextAssemblerTest, SuccessesAreCachedAndReused) {
    auto& a = makeAssembler();

    auto first = a.assemble(request({AnalysisKind::Technical}));
    ASSERT_TRUE(first.complete);
    EXPECT_EQ(sources[AnalysisKind::Technical]->calls(), 1);

    auto second = a.assemble(request({AnalysisKind::Technical}));
    ASSERT_TRUE(second.complete);
    EXPECT_TRUE(second.slots.at(AnalysisKind::Technical).fromCache);
    EXPECT_EQ(sources[AnalysisKind::Technical]->calls(), 1);
}

TEST_F(ContextAssemblerTest, FailuresAreNotCached) {
    sources[AnalysisKind::Technical]->setFailing(true);
    auto& a = makeAssembler();
    EXPECT_FALSE(a.assemble(request({AnalysisKind::Technical})).complete);

    sources[AnalysisKind::Technical]->setFailing(false);
    EXPECT_TRUE(a.assemble(request({AnalysisKind::Technical})).complete);
    EXPECT_EQ(sources[AnalysisKind::Technical]->calls(), 2);
}

TEST_F(ContextAssemblerTest, DifferentParamsMissTheCache) {
    auto& a = makeAssembler();
    auto r1 = request({AnalysisKind::Technical});
    r1.params = {{"timeframe", "1h"}};
    auto r2 = request({AnalysisKind::Technical});
    r2.params = {{"timeframe", "4h"}};

    EXPECT_TRUE(a.assemble(r1).complete);
    EXPECT_TRUE(a.assemble(r2).complete);
    EXPECT_EQ(sources[AnalysisKind::Technical]->calls(), 2);
    EXPECT_EQ(sources[AnalysisKind::Technical]->lastParams().timeframe, "4h");
}

// =============================================================================
// Feature Flags & Symbols
// =============================================================================

TEST_F(ContextAssemblerTest, DisabledKindRequestedExplicitlyIsFeatureDisabled) {
    FeatureFlags flags;
    flags.sentimentAnalysis = false;
    auto& a = makeAssembler(flags);

    auto bundle = a.assemble(request({AnalysisKind::Technical, AnalysisKind::Sentiment}));
    EXPECT_FALSE(bundle.complete);
    EXPECT_TRUE(bundle.slots.at(AnalysisKind::Technical).ok());
    EXPECT_EQ(bundle.slots.at(AnalysisKind::Sentiment).error, make_error_code(Errc::feature_disabled));
    EXPECT_EQ(sources[AnalysisKind::Sentiment]->calls(), 0);
}

TEST_F(ContextAssemblerTest, MultiSymbolSlotsAreKeyedBySymbol) {
    auto& a = makeAssembler();
    auto bundle = a.assemble(request({AnalysisKind::Technical}, {"BTC-USD", "ETH-USD"}));

    ASSERT_TRUE(bundle.complete);
    const auto& data = *bundle.slots.at(AnalysisKind::Technical).result;
    ASSERT_TRUE(data.is_object());
    EXPECT_EQ(data["BTC-USD"]["symbol"], "BTC-USD");
    EXPECT_EQ(data["ETH-USD"]["symbol"], "ETH-USD");
    EXPECT_EQ(sources[AnalysisKind::Technical]->calls(), 2);
}

TEST_F(ContextAssemblerTest, RateLimitedAnalyzerIsAnErroredSlot) {
    SourceLimits tight;
    tight.capacity = 1;
    tight.refillPerSec = 0.001;
    auto src = std::make_shared<fixtures::ScriptedSource>();
    fetcher.registerSource(ContextAssembler::sourceName(AnalysisKind::Pattern), src, tight);
    auto& a = makeAssembler();

    EXPECT_TRUE(a.assemble(request({AnalysisKind::Pattern}, {"AAPL"})).complete);
    auto bundle = a.assemble(request({AnalysisKind::Pattern}, {"MSFT"}));
    EXPECT_EQ(bundle.slots.at(AnalysisKind::Pattern).error, make_error_code(Errc::rate_limited));
}
