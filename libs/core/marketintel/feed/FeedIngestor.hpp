/*
Vigil — FeedIngestor
Role: Polls configured external feeds and pushes each fresh value through cache and broadcast.
Inputs/Outputs: One steady_timer per feed; fetch -> normalize -> cache put -> publish.
Threading: Timers live on per-feed strands of the io_context; fetches run on the backend pool so
           slow upstreams never block I/O. A feed never has two polls in flight.
Performance: Poll deadline equals the feed interval; late answers count as upstream timeouts.
Integration: Started by apps/vigil_gateway when features.enable_real_time_updates is on.
Observability: Poll failures log throttled under "feed".
Related: FeedIngestor.cpp, FeedNormalizer.hpp, RateLimitedFetcher.hpp, BroadcastEngine.hpp.
Assumptions: Sources are registered with the fetcher under the feed's "source" name.
*/
#pragma once
#include <atomic>
#include <memory>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include "FeedNormalizer.hpp"
#include "../broadcast/BroadcastEngine.hpp"
#include "../cache/TtlCache.hpp"
#include "../fetch/RateLimitedFetcher.hpp"

namespace Vigil {

class FeedIngestor {
public:
    FeedIngestor(boost::asio::io_context& ioc,
                 boost::asio::thread_pool& backendPool,
                 RateLimitedFetcher& fetcher,
                 TtlCache& cache,
                 BroadcastEngine& broadcast,
                 std::vector<FeedConfig> feeds,
                 const CacheConfig& cacheConfig);
    ~FeedIngestor();

    void start();
    void stop();

    /// One synchronous poll of one feed.
    Result<PublishStats> pollOnce(const FeedConfig& feed, const Deadline& deadline);

    /// Cache key holding the latest normalized value of (symbol, timeframe).
    static std::string latestKey(const std::string& symbol, const std::string& timeframe);

private:
    struct FeedTask {
        FeedTask(boost::asio::io_context& ioc, FeedConfig c) : cfg(std::move(c)), timer(boost::asio::make_strand(ioc)) {}
        FeedConfig                cfg;
        boost::asio::steady_timer timer;
    };

    void schedule(const std::shared_ptr<FeedTask>& task);

    boost::asio::io_context&               m_ioc;
    boost::asio::thread_pool&              m_pool;
    RateLimitedFetcher&                    m_fetcher;
    TtlCache&                              m_cache;
    BroadcastEngine&                       m_broadcast;
    std::vector<FeedConfig>                m_feeds;
    CacheConfig                            m_cacheConfig;
    std::vector<std::shared_ptr<FeedTask>> m_tasks;
    std::atomic<bool>                      m_running{false};
};

} // namespace Vigil
