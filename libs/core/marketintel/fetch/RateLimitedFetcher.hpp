/*
Vigil — RateLimitedFetcher
Role: Guards every external call with a per-source token bucket and circuit breaker.
Inputs/Outputs: fetch(source, params, deadline) -> Result<json>; never queues or sleeps.
Threading: Each source has its own mutex; the upstream call runs outside it on the caller's thread.
Performance: Rejections are O(1) and never touch the upstream.
Integration: Used by the Context Assembler (analyzer.* sources) and the Feed Ingestor (feed sources).
Observability: Breaker transitions log at warn; rejections log throttled under "fetch".
Related: TokenBucket.hpp, CircuitBreaker.hpp, IDataSource.hpp.
Assumptions: Sources are registered at startup before concurrent fetches begin.
*/
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "IDataSource.hpp"
#include "TokenBucket.hpp"
#include "CircuitBreaker.hpp"
#include "../config/VigilConfig.hpp"

namespace Vigil {

struct SourceSnapshot {
    double       tokens{0.0};
    BreakerState breaker{BreakerState::Closed};
    uint32_t     consecutiveFailures{0};
    uint64_t     upstreamCalls{0};
    uint64_t     rateLimited{0};
    uint64_t     circuitRejected{0};
    uint64_t     failures{0};
};

class RateLimitedFetcher {
public:
    RateLimitedFetcher() = default;
    RateLimitedFetcher(const RateLimitedFetcher&) = delete;
    RateLimitedFetcher& operator=(const RateLimitedFetcher&) = delete;

    /// Replaces any source already registered under `name`.
    void registerSource(const std::string& name, std::shared_ptr<IDataSource> upstream, const SourceLimits& limits);

    [[nodiscard]] bool hasSource(const std::string& name) const;

    [[nodiscard]] Result<nlohmann::json> fetch(const std::string& source, const FetchParams& params, const Deadline& deadline);

    [[nodiscard]] std::optional<SourceSnapshot> snapshot(const std::string& source) const;

private:
    struct SourceState {
        SourceState(std::string n, std::shared_ptr<IDataSource> up, const SourceLimits& limits)
            : name(std::move(n))
            , upstream(std::move(up))
            , bucket(limits.capacity, limits.refillPerSec)
            , breaker(limits.failureThreshold, limits.cooldown)
        {}

        const std::string                  name;
        const std::shared_ptr<IDataSource> upstream;
        mutable std::mutex                 mx;
        TokenBucket                        bucket;
        CircuitBreaker                     breaker;
        uint64_t                           upstreamCalls{0};
        uint64_t                           rateLimited{0};
        uint64_t                           circuitRejected{0};
        uint64_t                           failures{0};
    };

    std::shared_ptr<SourceState> find(const std::string& name) const;
    void record(SourceState& s, bool wasProbe, bool ok);

    mutable std::shared_mutex                                     m_mx;
    std::unordered_map<std::string, std::shared_ptr<SourceState>> m_sources;
};

} // namespace Vigil
