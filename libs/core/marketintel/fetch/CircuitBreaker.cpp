#include "CircuitBreaker.hpp"

namespace Vigil {

std::string_view toString(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::Closed:   return "closed";
        case BreakerState::Open:     return "open";
        case BreakerState::HalfOpen: return "half-open";
    }
    return "unknown";
}

CircuitBreaker::Admission CircuitBreaker::admit(Clock::time_point now) {
    switch (m_state) {
        case BreakerState::Closed:
            return Admission::Allowed;
        case BreakerState::Open:
            if (now - m_openedAt < m_cooldown) return Admission::Rejected;
            m_state = BreakerState::HalfOpen;
            [[fallthrough]];
        case BreakerState::HalfOpen:
            if (m_probeInFlight) return Admission::Rejected;
            m_probeInFlight = true;
            return Admission::Probe;
    }
    return Admission::Rejected;
}

void CircuitBreaker::onSuccess(bool wasProbe) noexcept {
    if (wasProbe) {
        m_probeInFlight = false;
        m_state = BreakerState::Closed;
        m_failures = 0;
        return;
    }
    // A call admitted before the breaker opened does not close it.
    if (m_state == BreakerState::Closed) m_failures = 0;
}

void CircuitBreaker::onFailure(bool wasProbe, Clock::time_point now) noexcept {
    ++m_failures;
    m_lastFailure = now;
    if (wasProbe) {
        m_probeInFlight = false;
        open(now);
        return;
    }
    if (m_state == BreakerState::Closed && m_failures >= m_threshold) open(now);
}

void CircuitBreaker::open(Clock::time_point now) noexcept {
    m_state = BreakerState::Open;
    m_openedAt = now;
}

} // namespace Vigil
