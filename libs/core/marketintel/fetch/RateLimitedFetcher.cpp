#include "RateLimitedFetcher.hpp"
#include "Log.hpp"
#include <exception>

namespace Vigil {

void RateLimitedFetcher::registerSource(const std::string& name, std::shared_ptr<IDataSource> upstream,
                                        const SourceLimits& limits) {
    auto state = std::make_shared<SourceState>(name, std::move(upstream), limits);
    std::unique_lock<std::shared_mutex> lock(m_mx);
    m_sources[name] = std::move(state);
    LOG_I("fetch", "registered source '{}' (capacity={}, refill={}/s, threshold={}, cooldown={}ms)",
          name, limits.capacity, limits.refillPerSec, limits.failureThreshold, limits.cooldown.count());
}

bool RateLimitedFetcher::hasSource(const std::string& name) const {
    return find(name) != nullptr;
}

std::shared_ptr<RateLimitedFetcher::SourceState> RateLimitedFetcher::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_mx);
    auto it = m_sources.find(name);
    return it == m_sources.end() ? nullptr : it->second;
}

Result<nlohmann::json> RateLimitedFetcher::fetch(const std::string& source, const FetchParams& params,
                                                 const Deadline& deadline) {
    auto state = find(source);
    if (!state) return outcome::failure(make_error_code(Errc::unknown_source));

    if (deadline.expired()) return outcome::failure(make_error_code(Errc::timeout));

    bool probe = false;
    {
        std::lock_guard<std::mutex> lock(state->mx);
        auto admission = state->breaker.admit();
        if (admission == CircuitBreaker::Admission::Rejected) {
            ++state->circuitRejected;
            LOG_EVERY_N(DEBUG, 100, "fetch", "'{}' circuit open, call rejected", source);
            return outcome::failure(make_error_code(Errc::circuit_open));
        }
        probe = admission == CircuitBreaker::Admission::Probe;

        if (!state->bucket.tryConsume()) {
            if (probe) state->breaker.releaseProbe();
            ++state->rateLimited;
            LOG_EVERY_N(DEBUG, 100, "fetch", "'{}' out of tokens, call rejected", source);
            return outcome::failure(make_error_code(Errc::rate_limited));
        }
        ++state->upstreamCalls;
    }

    if (probe) LOG_I("fetch", "'{}' half-open, sending probe", source);

    Result<nlohmann::json> result = outcome::failure(make_error_code(Errc::upstream_failed));
    try {
        result = state->upstream->pollOrStream(params, deadline);
    }
    catch (const std::exception& ex) {
        LOG_W("fetch", "'{}' upstream threw: {}", source, ex.what());
        result = outcome::failure(make_error_code(Errc::upstream_failed));
    }

    // An answer that arrives after the deadline is a timeout, whatever it says.
    if (deadline.expired()) {
        record(*state, probe, false);
        return outcome::failure(make_error_code(Errc::timeout));
    }

    if (!result) {
        record(*state, probe, false);
        if (result.error().category() != vigilCategory()) {
            LOG_W("fetch", "'{}' upstream error: {}", source, result.error().message());
            return outcome::failure(make_error_code(Errc::upstream_failed));
        }
        return result;
    }

    record(*state, probe, true);
    return result;
}

void RateLimitedFetcher::record(SourceState& s, bool wasProbe, bool ok) {
    std::lock_guard<std::mutex> lock(s.mx);
    auto before = s.breaker.state();
    if (ok) {
        s.breaker.onSuccess(wasProbe);
    } else {
        ++s.failures;
        s.breaker.onFailure(wasProbe);
    }
    auto after = s.breaker.state();
    if (before != after) {
        if (after == BreakerState::Open) {
            LOG_W("fetch", "'{}' circuit {} -> open after {} consecutive failure(s)",
                  s.name, toString(before), s.breaker.consecutiveFailures());
        } else {
            LOG_I("fetch", "'{}' circuit {} -> {}", s.name, toString(before), toString(after));
        }
    }
}

std::optional<SourceSnapshot> RateLimitedFetcher::snapshot(const std::string& source) const {
    auto state = find(source);
    if (!state) return std::nullopt;

    std::lock_guard<std::mutex> lock(state->mx);
    SourceSnapshot snap;
    snap.tokens = state->bucket.available();
    snap.breaker = state->breaker.state();
    snap.consecutiveFailures = state->breaker.consecutiveFailures();
    snap.upstreamCalls = state->upstreamCalls;
    snap.rateLimited = state->rateLimited;
    snap.circuitRejected = state->circuitRejected;
    snap.failures = state->failures;
    return snap;
}

} // namespace Vigil
