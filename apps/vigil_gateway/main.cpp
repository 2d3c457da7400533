#include "Log.hpp"
#include "StandIns.hpp"
#include "marketintel/analysis/ContextAssembler.hpp"
#include "marketintel/analysis/OrchestrationRouter.hpp"
#include "marketintel/auth/TokenFileAuthenticator.hpp"
#include "marketintel/broadcast/BroadcastEngine.hpp"
#include "marketintel/config/VigilConfig.hpp"
#include "marketintel/feed/FeedIngestor.hpp"
#include "marketintel/gateway/Gateway.hpp"
#include "marketintel/ws/WsServer.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <future>
#include <set>
#include <thread>
#include <vector>

using namespace Vigil;

namespace {

int run(const VigilConfig& cfg) {
    net::io_context ioc{static_cast<int>(cfg.threads.io)};
    auto work = net::make_work_guard(ioc);
    boost::asio::thread_pool backendPool(cfg.threads.backend);
    boost::asio::thread_pool requestPool(cfg.threads.request);

    TtlCache cache(cfg.cache.purgeEveryNWrites);
    RateLimitedFetcher fetcher;
    SubscriptionRegistry registry;
    BroadcastEngine broadcast(registry);
    TokenFileAuthenticator authenticator(cfg.tokensFile);

    for (auto kind : kAnalyzerKinds) {
        const auto name = ContextAssembler::sourceName(kind);
        fetcher.registerSource(name,
                               std::make_shared<AnalyzerSource>(std::make_shared<StandIns::SnapshotAnalyzer>(kind, cache)),
                               cfg.fetch.limitsFor(name));
    }
    std::set<std::string> feedSources;
    for (const auto& feed : cfg.feeds) feedSources.insert(feed.source);
    for (const auto& source : feedSources) {
        fetcher.registerSource(source, std::make_shared<StandIns::SimulatedFeedSource>(), cfg.fetch.limitsFor(source));
    }

    ContextAssembler assembler(cache, fetcher, backendPool, cfg.cache, cfg.features);
    OrchestrationRouter router(assembler,
                               std::make_shared<StandIns::SummaryReasoningBackend>("local"),
                               std::make_shared<StandIns::SummaryReasoningBackend>("cloud"),
                               backendPool, cfg.reasoning, cfg.features);
    Gateway gateway(cfg.server, cfg.features, authenticator, registry, router, requestPool);
    FeedIngestor ingestor(ioc, backendPool, fetcher, cache, broadcast, cfg.feeds, cfg.cache);

    auto server = std::make_shared<WsServer>(ioc, gateway, cfg.server);
    server->start();
    if (cfg.features.realTimeUpdates) {
        ingestor.start();
    } else {
        LOG_I("app", "real-time updates disabled; feeds not started");
    }

    std::promise<int> stopSignal;
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&stopSignal](const boost::system::error_code& ec, int sig) {
        if (!ec) stopSignal.set_value(sig);
    });

    std::vector<std::thread> ioThreads;
    ioThreads.reserve(cfg.threads.io);
    for (size_t i = 0; i < cfg.threads.io; ++i) {
        ioThreads.emplace_back([&ioc] { ioc.run(); });
    }
    LOG_I("app", "vigil gateway up ({} io, {} request, {} backend thread(s))",
          cfg.threads.io, cfg.threads.request, cfg.threads.backend);

    const int sig = stopSignal.get_future().get();
    LOG_I("app", "signal {} received, shutting down", sig);

    server->stop();
    ingestor.stop();
    gateway.shutdown();
    if (!gateway.waitIdle(cfg.server.maxDeadline + std::chrono::seconds(1))) {
        LOG_W("app", "in-flight requests still running at shutdown");
    }
    // Give sessions a moment to flush their final frames.
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    work.reset();
    ioc.stop();
    for (auto& t : ioThreads) t.join();
    requestPool.join();
    backendPool.join();

    LOG_I("app", "stopped");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const std::string path = argc > 1 ? argv[1] : "vigil.json";
    try {
        VigilConfig cfg;
        if (std::filesystem::exists(path)) {
            cfg = VigilConfig::loadFile(path);
        } else {
            LOG_W("app", "config file {} not found, using defaults", path);
        }
        cfg.applyEnvironment();
        cfg.validate();
        if (!cfg.logLevel.empty()) Log::setLevel(Log::parseLevel(cfg.logLevel.c_str()));
        return run(cfg);
    }
    catch (const std::exception& ex) {
        LOG_E("app", "fatal: {}", ex.what());
        return 1;
    }
}
