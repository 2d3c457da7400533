#pragma once
/*
Vigil — Deadline
Role: Absolute time budget plus cancellation, threaded through every call boundary of a request.
Inputs/Outputs: Built from a relative budget; answers remaining()/expired(); children may be tighter.
Threading: Copies share the cancellation state; cancel() is safe from any thread.
Integration: AnalysisRequest carries one; the assembler, router, fetcher and backends receive children.
Assumptions: steady_clock only; wall-clock jumps never shorten or extend a budget.
*/
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>

namespace Vigil {

class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /// A deadline that never expires on its own.
    Deadline() : Deadline(Clock::time_point::max(), nullptr) {}

    static Deadline at(Clock::time_point when) { return Deadline(when, nullptr); }

    static Deadline after(std::chrono::milliseconds budget) {
        return Deadline(Clock::now() + budget, nullptr);
    }

    [[nodiscard]] Clock::time_point expiresAt() const noexcept { return m_at; }

    [[nodiscard]] std::chrono::milliseconds remaining() const {
        if (cancelled()) return std::chrono::milliseconds{0};
        if (m_at == Clock::time_point::max()) return std::chrono::milliseconds::max();
        auto now = Clock::now();
        if (now >= m_at) return std::chrono::milliseconds{0};
        // Rounded up: a live deadline never reports zero.
        return std::chrono::ceil<std::chrono::milliseconds>(m_at - now);
    }

    [[nodiscard]] bool expired() const { return cancelled() || Clock::now() >= m_at; }

    [[nodiscard]] bool cancelled() const noexcept {
        for (auto* s = m_cancel.get(); s; s = s->parent.get()) {
            if (s->flag.load(std::memory_order_acquire)) return true;
        }
        return false;
    }

    /// Cancels this deadline and every child derived from it; the parent is untouched.
    void cancel() noexcept { m_cancel->flag.store(true, std::memory_order_release); }

    /// Child with its own cancellation, expiring no later than this one.
    [[nodiscard]] Deadline child() const { return Deadline(m_at, m_cancel); }

    /// Child limited to at most `budget` from now.
    [[nodiscard]] Deadline child(std::chrono::milliseconds budget) const {
        auto now = Clock::now();
        auto limit = (budget >= std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now))
                         ? Clock::time_point::max()
                         : now + budget;
        return Deadline(std::min(m_at, limit), m_cancel);
    }

private:
    struct CancelState {
        std::atomic<bool> flag{false};
        std::shared_ptr<CancelState> parent;
    };

    Deadline(Clock::time_point at, std::shared_ptr<CancelState> parent)
        : m_at(at)
        , m_cancel(std::make_shared<CancelState>())
    {
        m_cancel->parent = std::move(parent);
    }

    Clock::time_point            m_at;
    std::shared_ptr<CancelState> m_cancel;
};

/// Blocks until `f` is ready or `deadline` expires or is cancelled. True when ready.
template <class Future>
bool waitFor(Future& f, const Deadline& deadline,
             std::chrono::milliseconds slice = std::chrono::milliseconds{10}) {
    using namespace std::chrono_literals;
    for (;;) {
        if (f.wait_for(0ms) == std::future_status::ready) return true;
        auto left = deadline.remaining();
        if (left <= 0ms) return false;
        f.wait_for(std::min(left, slice));
    }
}

} // namespace Vigil
