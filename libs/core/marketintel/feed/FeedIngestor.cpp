#include "FeedIngestor.hpp"
#include "Log.hpp"
#include <boost/asio/post.hpp>

namespace Vigil {

namespace {

nlohmann::json toJson(const MarketUpdate& u) {
    nlohmann::json j{{"symbol", u.symbol}, {"timeframe", u.timeframe}, {"timestamp", u.timestampMs},
                     {"source", u.source}};
    if (const auto* bar = std::get_if<Ohlcv>(&u.payload)) {
        j["open"] = bar->open;
        j["high"] = bar->high;
        j["low"] = bar->low;
        j["close"] = bar->close;
        j["volume"] = bar->volume;
    } else if (const auto* tick = std::get_if<Tick>(&u.payload)) {
        j["price"] = tick->price;
        j["size"] = tick->size;
    }
    return j;
}

} // namespace

FeedIngestor::FeedIngestor(boost::asio::io_context& ioc,
                           boost::asio::thread_pool& backendPool,
                           RateLimitedFetcher& fetcher,
                           TtlCache& cache,
                           BroadcastEngine& broadcast,
                           std::vector<FeedConfig> feeds,
                           const CacheConfig& cacheConfig)
    : m_ioc(ioc)
    , m_pool(backendPool)
    , m_fetcher(fetcher)
    , m_cache(cache)
    , m_broadcast(broadcast)
    , m_feeds(std::move(feeds))
    , m_cacheConfig(cacheConfig)
{}

FeedIngestor::~FeedIngestor() {
    stop();
}

std::string FeedIngestor::latestKey(const std::string& symbol, const std::string& timeframe) {
    return TtlCache::makeKey("market", symbol, nlohmann::json{{"timeframe", timeframe}});
}

void FeedIngestor::start() {
    if (m_running.exchange(true)) return;
    for (const auto& feed : m_feeds) {
        if (!m_fetcher.hasSource(feed.source)) {
            LOG_W("feed", "feed {}:{} skipped, source not registered", feed.source, feed.symbol);
            continue;
        }
        auto task = std::make_shared<FeedTask>(m_ioc, feed);
        m_tasks.push_back(task);
        boost::asio::post(task->timer.get_executor(), [this, task] { schedule(task); });
        LOG_I("feed", "polling {}:{} {} every {}ms", feed.source, feed.symbol, feed.timeframe, feed.interval.count());
    }
}

void FeedIngestor::stop() {
    if (!m_running.exchange(false)) return;
    for (const auto& task : m_tasks) {
        boost::asio::post(task->timer.get_executor(), [task] { task->timer.cancel(); });
    }
    m_tasks.clear();
}

void FeedIngestor::schedule(const std::shared_ptr<FeedTask>& task) {
    if (!m_running.load()) return;
    task->timer.expires_after(task->cfg.interval);
    task->timer.async_wait([this, task](const boost::system::error_code& ec) {
        if (ec || !m_running.load()) return;
        boost::asio::post(m_pool, [this, task] {
            auto r = pollOnce(task->cfg, Deadline::after(task->cfg.interval));
            if (!r) {
                LOG_EVERY_N(DEBUG, 50, "feed", "{}:{} poll failed: {}", task->cfg.source, task->cfg.symbol,
                            errorKindName(r.error()));
            }
            // Re-arm on the feed's strand once this poll has finished.
            boost::asio::post(task->timer.get_executor(), [this, task] { schedule(task); });
        });
    });
}

Result<PublishStats> FeedIngestor::pollOnce(const FeedConfig& feed, const Deadline& deadline) {
    FetchParams params{feed.symbol, feed.timeframe, nlohmann::json{{"topic", feed.topic}}};
    auto raw = m_fetcher.fetch(feed.source, params, deadline);
    if (!raw) return outcome::failure(raw.error());

    auto update = FeedNormalizer::normalize(feed, raw.value());
    if (!update) return outcome::failure(update.error());

    m_cache.put(latestKey(update.value().symbol, update.value().timeframe), toJson(update.value()),
                m_cacheConfig.marketTtl);

    auto stats = m_broadcast.publish(std::make_shared<const MarketUpdate>(std::move(update).value()));
    return outcome::success(stats);
}

} // namespace Vigil
