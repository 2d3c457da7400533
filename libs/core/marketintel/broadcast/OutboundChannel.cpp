#include "OutboundChannel.hpp"

namespace Vigil {

OutboundChannel::PushResult OutboundChannel::push(Frame frame) {
    NotifyFn notify;
    PushResult result = PushResult::Enqueued;
    {
        std::lock_guard<std::mutex> lock(m_mx);
        if (m_closed) return PushResult::Closed;
        if (m_frames.size() >= m_capacity) {
            m_frames.pop_front();
            ++m_dropped;
            result = PushResult::DroppedOldest;
        }
        m_frames.push_back(std::move(frame));
        notify = m_notify;
    }
    if (notify) notify();
    return result;
}

Frame OutboundChannel::pop() {
    std::lock_guard<std::mutex> lock(m_mx);
    if (m_frames.empty()) return nullptr;
    Frame f = std::move(m_frames.front());
    m_frames.pop_front();
    return f;
}

void OutboundChannel::close() {
    NotifyFn notify;
    {
        std::lock_guard<std::mutex> lock(m_mx);
        if (m_closed) return;
        m_closed = true;
        notify = m_notify;
    }
    if (notify) notify();
}

void OutboundChannel::setNotify(NotifyFn fn) {
    std::lock_guard<std::mutex> lock(m_mx);
    m_notify = std::move(fn);
}

bool OutboundChannel::closed() const {
    std::lock_guard<std::mutex> lock(m_mx);
    return m_closed;
}

size_t OutboundChannel::size() const {
    std::lock_guard<std::mutex> lock(m_mx);
    return m_frames.size();
}

uint64_t OutboundChannel::dropped() const {
    std::lock_guard<std::mutex> lock(m_mx);
    return m_dropped;
}

} // namespace Vigil
