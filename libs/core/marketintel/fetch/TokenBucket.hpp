#pragma once
// ─────────────────────────────────────────────────────────────
// TokenBucket – continuous-refill admission counter.
// Not synchronized; the owning SourceState serializes access.
// ─────────────────────────────────────────────────────────────
#include <algorithm>
#include <chrono>

namespace Vigil {

class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double capacity, double refillPerSec, Clock::time_point now = Clock::now())
        : m_capacity(capacity)
        , m_refillPerSec(refillPerSec)
        , m_tokens(capacity)
        , m_lastRefill(now)
    {}

    /// Takes one token if available; never waits.
    bool tryConsume(Clock::time_point now = Clock::now()) {
        refill(now);
        if (m_tokens < 1.0) return false;
        m_tokens -= 1.0;
        return true;
    }

    [[nodiscard]] double available(Clock::time_point now = Clock::now()) {
        refill(now);
        return m_tokens;
    }

    [[nodiscard]] double capacity() const noexcept { return m_capacity; }

private:
    void refill(Clock::time_point now) {
        if (now <= m_lastRefill) return;
        std::chrono::duration<double> dt = now - m_lastRefill;
        m_tokens = std::min(m_capacity, m_tokens + dt.count() * m_refillPerSec);
        m_lastRefill = now;
    }

    double            m_capacity;
    double            m_refillPerSec;
    double            m_tokens;
    Clock::time_point m_lastRefill;
};

} // namespace Vigil
