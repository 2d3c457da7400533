#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>

namespace Vigil {

enum class BreakerState { Closed, Open, HalfOpen };

std::string_view toString(BreakerState state) noexcept;

/// Consecutive-failure breaker with a cool-down and a single half-open probe.
/// Not synchronized; callers hold the per-source mutex.
class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    enum class Admission { Allowed, Probe, Rejected };

    CircuitBreaker(uint32_t failureThreshold, std::chrono::milliseconds cooldown)
        : m_threshold(failureThreshold == 0 ? 1 : failureThreshold)
        , m_cooldown(cooldown)
    {}

    Admission admit(Clock::time_point now = Clock::now());

    /// Gives the probe slot back when the admitted probe never reached the upstream.
    void releaseProbe() noexcept { m_probeInFlight = false; }

    void onSuccess(bool wasProbe) noexcept;
    void onFailure(bool wasProbe, Clock::time_point now = Clock::now()) noexcept;

    [[nodiscard]] BreakerState state() const noexcept { return m_state; }
    [[nodiscard]] uint32_t consecutiveFailures() const noexcept { return m_failures; }
    [[nodiscard]] Clock::time_point lastFailure() const noexcept { return m_lastFailure; }
    [[nodiscard]] bool probeInFlight() const noexcept { return m_probeInFlight; }

private:
    void open(Clock::time_point now) noexcept;

    uint32_t                  m_threshold;
    std::chrono::milliseconds m_cooldown;
    BreakerState              m_state{BreakerState::Closed};
    uint32_t                  m_failures{0};
    Clock::time_point         m_openedAt{};
    Clock::time_point         m_lastFailure{};
    bool                      m_probeInFlight{false};
};

} // namespace Vigil
