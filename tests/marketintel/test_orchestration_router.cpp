/*
Vigil — OrchestrationRouter Tests
Role: Verify local-first/cloud-fallback reasoning, partial insights and the error contract
Testing Strategy: Real assembler + fetcher + pool; ScriptedSource analyzers and ScriptedBackend
                  reasoning backends; deadlines sized with wide margins
Coverage: Local answer, cloud fallback (failure, budget, exception), partial context,
          NoContext, ReasoningUnavailable, DeadlineExceeded, AI insights switched off
*/
#include <gtest/gtest.h>
#include "marketintel/analysis/OrchestrationRouter.hpp"
#include "fixtures/scripted_sources.hpp"
#include <map>
#include <memory>

using namespace Vigil;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class OrchestrationRouterTest : public ::testing::Test {
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

    OrchestrationRouter& makeRouter(ReasoningConfig reasoning = {}, FeatureFlags flags = {}) {
        assembler = std::make_unique<ContextAssembler>(cache, fetcher, pool, CacheConfig{}, flags);
        router = std::make_unique<OrchestrationRouter>(*assembler, local, cloud, pool, reasoning, flags);
        return *router;
    }

    static AnalysisRequest request(std::set<AnalysisKind> kinds = {AnalysisKind::AiInsight},
                                   std::chrono::milliseconds budget = 3s) {
        AnalysisRequest r;
        r.requestId = "req-42";
        r.requester = Principal{"alice"};
        r.symbols = {"BTC-USD"};
        r.kinds = std::move(kinds);
        r.deadline = Deadline::after(budget);
        return r;
    }

    TtlCache cache;
    RateLimitedFetcher fetcher;
    boost::asio::thread_pool pool{8};
    std::map<AnalysisKind, std::shared_ptr<fixtures::ScriptedSource>> sources;
    std::shared_ptr<fixtures::ScriptedBackend> local = std::make_shared<fixtures::ScriptedBackend>("local");
    std::shared_ptr<fixtures::ScriptedBackend> cloud = std::make_shared<fixtures::ScriptedBackend>("cloud");
    std::unique_ptr<ContextAssembler> assembler;
    std::unique_ptr<OrchestrationRouter> router;
};

// =============================================================================
// Local First
// =============================================================================

TEST_F(OrchestrationRouterTest, LocalBackendAnswersFirst) {
    auto& r = makeRouter();
    auto result = r.handle(request());

    ASSERT_TRUE(result) << errorKindName(result.error());
    const auto& insight = result.value();
    EXPECT_EQ(insight.requestId, "req-42");
    EXPECT_EQ(insight.backend, "local");
    EXPECT_EQ(insight.content["model"], "local");
    EXPECT_FALSE(insight.partial);
    EXPECT_TRUE(insight.missingKinds.empty());
    EXPECT_EQ(cloud->calls(), 0);
}

// =============================================================================
// Cloud Fallback
// =============================================================================

TEST_F(OrchestrationRouterTest, CloudAnswersWhenLocalFailsImmediately) {
    local->setFailing(true);
    auto& r = makeRouter();

    auto result = r.handle(request());
    ASSERT_TRUE(result) << errorKindName(result.error());
    EXPECT_EQ(result.value().backend, "cloud");
    EXPECT_EQ(result.value().content["model"], "cloud");
    EXPECT_EQ(local->calls(), 1);
    EXPECT_EQ(cloud->calls(), 1);
}

TEST_F(OrchestrationRouterTest, CloudAnswersWhenLocalExceedsItsBudget) {
    local->setDelay(5s);
    ReasoningConfig reasoning;
    reasoning.localBudget = 100ms;
    auto& r = makeRouter(reasoning);

    auto started = std::chrono::steady_clock::now();
    auto result = r.handle(request());
    auto took = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result) << errorKindName(result.error());
    EXPECT_EQ(result.value().backend, "cloud");
    EXPECT_LT(took, 1500ms);

    pool.join();
    EXPECT_EQ(local->cancelled(), 1) << "the abandoned local call is cancelled";
}

TEST_F(OrchestrationRouterTest, ThrowingLocalBackendFallsBack) {
    local->setThrows(true);
    auto& r = makeRouter();

    auto result = r.handle(request());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().backend, "cloud");
}

// =============================================================================
// Partial Context
// =============================================================================

TEST_F(OrchestrationRouterTest, SentimentTimeoutYieldsPartialInsight) {
    sources[AnalysisKind::Sentiment]->setDelay(10s);
    auto& r = makeRouter();

    auto result = r.handle(request({AnalysisKind::Technical, AnalysisKind::Sentiment}, 1500ms));

    ASSERT_TRUE(result) << "partial context must still be reasoned over, got " << errorKindName(result.error());
    const auto& insight = result.value();
    EXPECT_TRUE(insight.partial);
    ASSERT_EQ(insight.missingKinds.size(), 1u);
    EXPECT_EQ(insight.missingKinds[0], AnalysisKind::Sentiment);
    EXPECT_EQ(local->calls(), 1);
    EXPECT_FALSE(local->lastComplete()) << "backend sees the incomplete bundle";
}

TEST_F(OrchestrationRouterTest, NoContextWhenEveryAnalyzerFails) {
    for (auto& [kind, src] : sources) src->setFailing(true);
    auto& r = makeRouter();

    auto result = r.handle(request());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), make_error_code(Errc::no_context));
    EXPECT_EQ(local->calls(), 0);
    EXPECT_EQ(cloud->calls(), 0);
}

// =============================================================================
// Failure Contract
// =============================================================================

TEST_F(OrchestrationRouterTest, BothBackendsFailingIsReasoningUnavailable) {
    local->setFailing(true);
    cloud->setFailing(true);
    auto& r = makeRouter();

    auto result = r.handle(request());
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), make_error_code(Errc::reasoning_unavailable));
}

TEST_F(OrchestrationRouterTest, DeadlineExceededWhenNoBackendAnswersInTime) {
    local->setDelay(10s);
    cloud->setDelay(10s);
    ReasoningConfig reasoning;
    reasoning.localBudget = 10s;
    auto& r = makeRouter(reasoning);

    auto started = std::chrono::steady_clock::now();
    auto result = r.handle(request({AnalysisKind::AiInsight}, 400ms));
    auto took = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), make_error_code(Errc::deadline_exceeded));
    EXPECT_LT(took, 1500ms) << "the request deadline bounds the whole call";
}

TEST_F(OrchestrationRouterTest, ExpiredRequestIsRejectedUpFront) {
    auto& r = makeRouter();
    auto req = request();
    req.deadline.cancel();

    auto result = r.handle(req);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), make_error_code(Errc::deadline_exceeded));
    EXPECT_EQ(sources[AnalysisKind::Technical]->calls(), 0);
}

// =============================================================================
// Feature Flags
// =============================================================================

TEST_F(OrchestrationRouterTest, AiInsightsOffReturnsTheContext) {
    FeatureFlags flags;
    flags.aiInsights = false;
    auto& r = makeRouter({}, flags);

    auto result = r.handle(request());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().backend, "context");
    EXPECT_TRUE(result.value().content["complete"].get<bool>());
    EXPECT_TRUE(result.value().content["slots"].contains("technical"));
    EXPECT_EQ(local->calls(), 0);
    EXPECT_EQ(cloud->calls(), 0);
}
