#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include "../broadcast/OutboundChannel.hpp"

namespace Vigil {

// Connecting -> Active -> Draining -> Closed; a failed auth goes straight from Connecting to Closed.
enum class ConnectionState { Connecting, Active, Draining, Closed };

inline std::string_view toString(ConnectionState s) noexcept {
    switch (s) {
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Active:     return "active";
        case ConnectionState::Draining:   return "draining";
        case ConnectionState::Closed:     return "closed";
    }
    return "unknown";
}

/// Gateway-owned per-client state. Only the Gateway mutates it, under its own mutex.
struct Connection {
    ConnectionId                          id{0};
    std::optional<Principal>              principal;
    std::shared_ptr<OutboundChannel>      channel;
    ConnectionState                       state{ConnectionState::Connecting};
    size_t                                inflight{0};
    std::chrono::steady_clock::time_point openedAt{std::chrono::steady_clock::now()};
};

/// What the transport gets back from Gateway::openConnection.
struct ConnectionHandle {
    ConnectionId                     id{0};
    std::shared_ptr<OutboundChannel> channel;
};

} // namespace Vigil
