/*
Vigil — OutboundChannel
Role: Bounded per-connection queue of serialized frames waiting for the transport.
Inputs/Outputs: push() from any producer thread; pop() from the connection's transport strand.
Threading: Internal mutex; the notify callback runs outside the lock after each push and on close.
Performance: Never blocks a producer; when full the oldest frame is dropped to make room.
Integration: Owned by the Gateway's Connection; the registry and broadcast engine hold weak handles.
Observability: dropped() counts frames lost to overflow.
Related: SubscriptionRegistry.hpp, BroadcastEngine.hpp, WsSession.hpp.
Assumptions: Frames are immutable and may be shared between many channels.
*/
#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "../model/MarketTypes.hpp"

namespace Vigil {

using Frame = std::shared_ptr<const std::string>;

class OutboundChannel {
public:
    enum class PushResult { Enqueued, DroppedOldest, Closed };
    using NotifyFn = std::function<void()>;

    OutboundChannel(ConnectionId id, size_t capacity)
        : m_id(id)
        , m_capacity(capacity == 0 ? 1 : capacity)
    {}

    PushResult push(Frame frame);

    /// Next frame in FIFO order, or nullptr when empty. Frames queued before close() remain poppable.
    Frame pop();

    /// Refuses further pushes. Idempotent.
    void close();

    void setNotify(NotifyFn fn);

    [[nodiscard]] ConnectionId id() const noexcept { return m_id; }
    [[nodiscard]] size_t capacity() const noexcept { return m_capacity; }
    [[nodiscard]] bool closed() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t dropped() const;

private:
    const ConnectionId m_id;
    const size_t       m_capacity;
    mutable std::mutex m_mx;
    std::deque<Frame>  m_frames;
    NotifyFn           m_notify;
    bool               m_closed{false};
    uint64_t           m_dropped{0};
};

/// Non-owning view of a subscriber held by the registry and broadcast engine.
struct SubscriberHandle {
    ConnectionId                   id{0};
    std::weak_ptr<OutboundChannel> channel;
};

} // namespace Vigil
