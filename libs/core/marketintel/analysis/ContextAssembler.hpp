/*
Vigil — ContextAssembler
Role: Fans the kinds of an analysis request out to their analyzers and merges the answers.
Inputs/Outputs: assemble(AnalysisRequest) -> ContextBundle with one slot per required kind.
Threading: Called from request-pool threads; cache misses run concurrently on the backend pool.
Performance: Cache hits skip the analyzer; all misses start before the first wait.
Integration: Owned by the application; called by OrchestrationRouter::handle.
Observability: Timeouts and failed slots log at debug/warn under "assembler".
Related: ContextAssembler.cpp, TtlCache.hpp, RateLimitedFetcher.hpp, IAnalyzer.hpp.
Assumptions: Analyzers are registered with the fetcher as "analyzer.<kind>".
*/
#pragma once
#include <set>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "../cache/TtlCache.hpp"
#include "../config/VigilConfig.hpp"
#include "../fetch/RateLimitedFetcher.hpp"
#include "../model/MarketTypes.hpp"

namespace Vigil {

class ContextAssembler {
public:
    ContextAssembler(TtlCache& cache,
                     RateLimitedFetcher& fetcher,
                     boost::asio::thread_pool& backendPool,
                     const CacheConfig& cacheConfig,
                     const FeatureFlags& features);

    /// Never fails as a whole; failures and timeouts are recorded per slot.
    [[nodiscard]] ContextBundle assemble(const AnalysisRequest& request);

    /// Requested analyzer kinds; a request for ai-insight alone expands to every enabled analyzer kind.
    [[nodiscard]] std::set<AnalysisKind> requiredKinds(const std::set<AnalysisKind>& requested) const;

    /// Fetcher source name for an analyzer kind, e.g. "analyzer.technical".
    static std::string sourceName(AnalysisKind kind);

private:
    TtlCache&                 m_cache;
    RateLimitedFetcher&       m_fetcher;
    boost::asio::thread_pool& m_pool;
    CacheConfig               m_cacheConfig;
    FeatureFlags              m_features;
};

} // namespace Vigil
