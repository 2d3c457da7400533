/*
Vigil — FeedIngestor Tests
Role: Verify a feed poll flows through fetcher → normalizer → cache → broadcast
Testing Strategy: ScriptedSource as feed upstream; pollOnce driven synchronously, timers driven by io_context
Coverage: Successful poll, cached latest value, rejected payloads, rate-limited feeds, timer-driven polling
*/
#include <gtest/gtest.h>
#include "marketintel/feed/FeedIngestor.hpp"
#include "fixtures/client_messages.hpp"
#include "fixtures/scripted_sources.hpp"
#include <thread>

using namespace Vigil;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

class FeedIngestorTest : public ::testing::Test {
protected:
    void SetUp() override {
        feedCfg.source = "sim";
        feedCfg.symbol = "BTC-USD";
        feedCfg.timeframe = "1m";
        feedCfg.interval = 20ms;

        SourceLimits limits;
        limits.capacity = 1000;
        limits.refillPerSec = 1000;
        source = std::make_shared<fixtures::ScriptedSource>(fixtures::ohlcvBar(1700000000000, 100, 110, 95, 105, 3));
        fetcher.registerSource("sim", source, limits);

        subscriber = std::make_shared<OutboundChannel>(1, 64);
        registry.subscribe(SubscriberHandle{1, subscriber}, SubscriptionKey{"market", "BTC-USD", "1m"});
    }

    void TearDown() override {
        pool.join();
    }

    FeedConfig feedCfg;
    boost::asio::io_context ioc;
    boost::asio::thread_pool pool{2};
    TtlCache cache;
    RateLimitedFetcher fetcher;
    SubscriptionRegistry registry;
    BroadcastEngine broadcast{registry};
    std::shared_ptr<fixtures::ScriptedSource> source;
    std::shared_ptr<OutboundChannel> subscriber;
};

// =============================================================================
// Single Poll
// =============================================================================

TEST_F(FeedIngestorTest, PollPublishesAndCachesLatestValue) {
    FeedIngestor ingestor(ioc, pool, fetcher, cache, broadcast, {feedCfg}, CacheConfig{});

    auto r = ingestor.pollOnce(feedCfg, Deadline::after(1s));
    ASSERT_TRUE(r) << errorKindName(r.error());
    EXPECT_EQ(r.value().delivered, 1u);

    auto frame = subscriber->pop();
    ASSERT_NE(frame, nullptr);
    auto j = nlohmann::json::parse(*frame);
    EXPECT_EQ(j["symbol"], "BTC-USD");
    EXPECT_EQ(j["source"], "sim");

    auto cached = cache.get(FeedIngestor::latestKey("BTC-USD", "1m"));
    ASSERT_TRUE(cached.has_value());
    EXPECT_DOUBLE_EQ((*cached)["close"].get<double>(), 105.0);
    EXPECT_EQ((*cached)["timestamp"], 1700000000000);
}

TEST_F(FeedIngestorTest, RepeatedBarIsNotStale) {
    FeedIngestor ingestor(ioc, pool, fetcher, cache, broadcast, {feedCfg}, CacheConfig{});
    ASSERT_TRUE(ingestor.pollOnce(feedCfg, Deadline::after(1s)));
    auto again = ingestor.pollOnce(feedCfg, Deadline::after(1s));
    ASSERT_TRUE(again);
    EXPECT_FALSE(again.value().stale);
}

TEST_F(FeedIngestorTest, RejectedPayloadIsNotPublished) {
    auto broken = std::make_shared<fixtures::ScriptedSource>(nlohmann::json{{"timestamp", 5}, {"open", -1}});
    SourceLimits limits;
    fetcher.registerSource("broken", broken, limits);
    feedCfg.source = "broken";

    FeedIngestor ingestor(ioc, pool, fetcher, cache, broadcast, {feedCfg}, CacheConfig{});
    auto r = ingestor.pollOnce(feedCfg, Deadline::after(1s));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), make_error_code(Errc::upstream_failed));
    EXPECT_EQ(subscriber->size(), 0u);
    EXPECT_FALSE(cache.get(FeedIngestor::latestKey("BTC-USD", "1m")).has_value());
}

TEST_F(FeedIngestorTest, FetchErrorsPassThrough) {
    feedCfg.source = "unregistered";
    FeedIngestor ingestor(ioc, pool, fetcher, cache, broadcast, {feedCfg}, CacheConfig{});
    auto r = ingestor.pollOnce(feedCfg, Deadline::after(1s));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), make_error_code(Errc::unknown_source));
}

// =============================================================================
// Scheduling
// =============================================================================

TEST_F(FeedIngestorTest, TimerDrivenPollingKeepsPublishing) {
    FeedConfig skipped = feedCfg;
    skipped.source = "unregistered";
    FeedIngestor ingestor(ioc, pool, fetcher, cache, broadcast, {feedCfg, skipped}, CacheConfig{});
    ingestor.start();

    std::thread io([this] { ioc.run_for(300ms); });
    io.join();
    ingestor.stop();
    pool.join();   // no poll may outlive the ingestor

    EXPECT_GE(source->calls(), 3);
    EXPECT_GE(subscriber->size(), 3u);
}
