/*
Vigil — Gateway
Role: Client connection lifecycle, authentication and inbound request dispatch.
Inputs/Outputs: Transport events in (open, frame, auth timeout, close); frames out through each
                connection's OutboundChannel.
Threading: One mutex guards the connection table. Analyze requests run on the request pool and
           report back through completeRequest(). Authentication runs outside the lock.
Performance: Frame decoding happens before the lock is taken; per-connection in-flight cap.
Integration: Driven by WsSession; calls SubscriptionRegistry, OrchestrationRouter, IAuthenticator.
Observability: Lifecycle transitions log at info, protocol errors at warn, under "gateway".
Related: Gateway.cpp, Connection.hpp, ClientProtocol.hpp, WsSession.hpp.
Assumptions: The request pool is joined before the Gateway is destroyed.
*/
#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <boost/asio/thread_pool.hpp>
#include "Connection.hpp"
#include "../analysis/OrchestrationRouter.hpp"
#include "../auth/IAuthenticator.hpp"
#include "../broadcast/SubscriptionRegistry.hpp"
#include "../config/VigilConfig.hpp"
#include "../protocol/ClientProtocol.hpp"

namespace Vigil {

class Gateway {
public:
    Gateway(const ServerConfig& server,
            const FeatureFlags& features,
            const IAuthenticator& authenticator,
            SubscriptionRegistry& registry,
            OrchestrationRouter& router,
            boost::asio::thread_pool& requestPool);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// New connection in Connecting state. `notify` fires whenever its channel has work.
    ConnectionHandle openConnection(OutboundChannel::NotifyFn notify = {});

    /// One inbound text frame.
    void onMessage(ConnectionId id, std::string_view frame);

    /// Transport-driven: auth was not completed in time.
    void onAuthTimeout(ConnectionId id);

    /// Server-initiated close: refuse new work, deliver in-flight results, then close.
    void closeConnection(ConnectionId id);

    /// The peer is gone: close the channel now, close the connection once in-flight work ends.
    void transportClosed(ConnectionId id);

    /// Drains every connection.
    void shutdown();

    /// Blocks until no analyze request is in flight or `timeout` passes. True when idle.
    bool waitIdle(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<ConnectionState> stateOf(ConnectionId id) const;
    [[nodiscard]] size_t connectionCount() const;
    [[nodiscard]] size_t inflightOf(ConnectionId id) const;

private:
    void handleFrame(Connection& c, DecodeResult decoded);
    void dispatchAnalyze(Connection& c, AnalyzeMsg msg);
    void runAnalysis(ConnectionId id, AnalysisRequest request);
    void completeRequest(ConnectionId id, std::string frame);

    // All of the following expect m_mx held.
    void send(Connection& c, std::string frame);
    void sendError(Connection& c, Errc code, const std::optional<std::string>& requestId = std::nullopt);
    void beginClose(Connection& c, bool transportGone);
    void finalize(ConnectionId id);

    ServerConfig              m_server;
    FeatureFlags              m_features;
    const IAuthenticator&     m_auth;
    SubscriptionRegistry&     m_registry;
    OrchestrationRouter&      m_router;
    boost::asio::thread_pool& m_requestPool;

    mutable std::mutex                           m_mx;
    std::condition_variable                      m_idleCv;
    std::unordered_map<ConnectionId, Connection> m_connections;
    size_t                                       m_totalInflight{0};
    std::atomic<ConnectionId>                    m_nextId{1};
};

} // namespace Vigil
