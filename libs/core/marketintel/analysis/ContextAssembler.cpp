#include "ContextAssembler.hpp"
#include "Log.hpp"
#include <future>
#include <map>
#include <boost/asio/post.hpp>

namespace Vigil {

namespace {

struct PendingCall {
    AnalysisKind                        kind;
    std::string                         symbol;
    std::string                         cacheKey;
    std::future<Result<nlohmann::json>> future;
};

struct SymbolOutcome {
    std::optional<nlohmann::json> value;
    boost::system::error_code     error;
    bool                          fromCache{false};
};

} // namespace

ContextAssembler::ContextAssembler(TtlCache& cache,
                                   RateLimitedFetcher& fetcher,
                                   boost::asio::thread_pool& backendPool,
                                   const CacheConfig& cacheConfig,
                                   const FeatureFlags& features)
    : m_cache(cache)
    , m_fetcher(fetcher)
    , m_pool(backendPool)
    , m_cacheConfig(cacheConfig)
    , m_features(features)
{}

std::string ContextAssembler::sourceName(AnalysisKind kind) {
    return "analyzer." + std::string(toString(kind));
}

std::set<AnalysisKind> ContextAssembler::requiredKinds(const std::set<AnalysisKind>& requested) const {
    std::set<AnalysisKind> out;
    for (auto kind : requested) {
        if (kind != AnalysisKind::AiInsight && m_features.analyzerEnabled(kind)) out.insert(kind);
    }
    bool insightOnly = requested.size() == 1 && requested.count(AnalysisKind::AiInsight) == 1;
    if (insightOnly) {
        for (auto kind : kAnalyzerKinds) {
            if (m_features.analyzerEnabled(kind)) out.insert(kind);
        }
    }
    return out;
}

ContextBundle ContextAssembler::assemble(const AnalysisRequest& request) {
    ContextBundle bundle;
    bundle.symbols = request.symbols;

    // Explicitly requested but switched off by configuration.
    for (auto kind : request.kinds) {
        if (kind != AnalysisKind::AiInsight && !m_features.analyzerEnabled(kind)) {
            bundle.slots[kind].error = make_error_code(Errc::feature_disabled);
        }
    }

    const auto required = requiredKinds(request.kinds);
    std::string timeframe;
    if (request.params.is_object()) {
        auto tf = request.params.find("timeframe");
        if (tf != request.params.end() && tf->is_string()) timeframe = tf->get<std::string>();
    }

    // Outstanding analyzer calls share one cancellation so a timed-out request stops them together.
    Deadline calls = request.deadline.child();

    std::map<AnalysisKind, std::map<std::string, SymbolOutcome>> results;
    std::vector<PendingCall> pending;

    for (auto kind : required) {
        const auto source = sourceName(kind);
        for (const auto& symbol : request.symbols) {
            auto key = TtlCache::makeKey(source, symbol, request.params);
            if (auto hit = m_cache.get(key)) {
                results[kind][symbol] = SymbolOutcome{std::move(hit), {}, true};
                continue;
            }

            FetchParams fp{symbol, timeframe, request.params};
            auto task = std::make_shared<std::packaged_task<Result<nlohmann::json>()>>(
                [&fetcher = m_fetcher, source, fp = std::move(fp), d = calls]() {
                    return fetcher.fetch(source, fp, d);
                });
            pending.push_back(PendingCall{kind, symbol, std::move(key), task->get_future()});
            boost::asio::post(m_pool, [task]() { (*task)(); });
        }
    }

    bool outstanding = false;
    for (auto& call : pending) {
        auto& out = results[call.kind][call.symbol];
        if (!waitFor(call.future, request.deadline)) {
            out.error = make_error_code(Errc::timeout);
            outstanding = true;
            continue;
        }
        try {
            auto r = call.future.get();
            if (r) {
                m_cache.put(call.cacheKey, r.value(), m_cacheConfig.ttlFor(call.kind));
                out.value = std::move(r).value();
            } else {
                out.error = r.error();
            }
        }
        catch (const std::exception& ex) {
            LOG_W("assembler", "{} for {} failed: {}", toString(call.kind), call.symbol, ex.what());
            out.error = make_error_code(Errc::upstream_failed);
        }
    }
    if (outstanding) {
        calls.cancel();
        LOG_D("assembler", "request {} hit its deadline with analyzer calls outstanding", request.requestId);
    }

    for (auto kind : required) {
        SlotOutcome slot;
        auto& perSymbol = results[kind];
        nlohmann::json merged = nlohmann::json::object();
        bool allCached = true;
        for (const auto& symbol : request.symbols) {
            auto& o = perSymbol[symbol];
            if (!o.value) {
                if (!slot.error) slot.error = o.error ? o.error : make_error_code(Errc::timeout);
                continue;
            }
            allCached = allCached && o.fromCache;
            merged[symbol] = std::move(*o.value);
        }
        if (!slot.error) {
            slot.result = request.symbols.size() == 1 ? std::move(merged[request.symbols.front()]) : std::move(merged);
            slot.fromCache = allCached;
        } else {
            LOG_D("assembler", "request {} slot {} errored: {}", request.requestId, toString(kind),
                  errorKindName(slot.error));
        }
        bundle.slots[kind] = std::move(slot);
    }

    bundle.complete = !bundle.slots.empty() && bundle.successCount() == bundle.slots.size();
    return bundle;
}

} // namespace Vigil
