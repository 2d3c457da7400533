#include "Gateway.hpp"
#include "Log.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>

namespace Vigil {

Gateway::Gateway(const ServerConfig& server,
                 const FeatureFlags& features,
                 const IAuthenticator& authenticator,
                 SubscriptionRegistry& registry,
                 OrchestrationRouter& router,
                 boost::asio::thread_pool& requestPool)
    : m_server(server)
    , m_features(features)
    , m_auth(authenticator)
    , m_registry(registry)
    , m_router(router)
    , m_requestPool(requestPool)
{}

ConnectionHandle Gateway::openConnection(OutboundChannel::NotifyFn notify) {
    const ConnectionId id = m_nextId.fetch_add(1);
    auto channel = std::make_shared<OutboundChannel>(id, m_server.outboundCapacity);
    channel->setNotify(std::move(notify));

    std::lock_guard<std::mutex> lock(m_mx);
    Connection c;
    c.id = id;
    c.channel = channel;
    m_connections.emplace(id, std::move(c));
    LOG_D("gateway", "connection {} opened ({} open)", id, m_connections.size());
    return ConnectionHandle{id, std::move(channel)};
}

void Gateway::onMessage(ConnectionId id, std::string_view frame) {
    auto decoded = ClientProtocol::decode(frame);

    std::unique_lock<std::mutex> lock(m_mx);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return;

    if (it->second.state == ConnectionState::Connecting) {
        const auto* auth = decoded.message ? std::get_if<AuthMsg>(&*decoded.message) : nullptr;
        if (!auth) {
            LOG_W("gateway", "connection {}: first frame is not auth ({})", id,
                  decoded ? "unexpected type" : decoded.detail);
            sendError(it->second, Errc::protocol_violation);
            finalize(id);
            return;
        }

        const std::string token = auth->token;
        lock.unlock();
        std::optional<Principal> principal;
        try {
            principal = m_auth.authenticate(token);
        }
        catch (const std::exception& ex) {
            LOG_W("gateway", "connection {}: authenticator threw: {}", id, ex.what());
        }
        lock.lock();

        it = m_connections.find(id);
        if (it == m_connections.end() || it->second.state != ConnectionState::Connecting) return;

        if (!principal) {
            LOG_I("gateway", "connection {}: authentication failed", id);
            sendError(it->second, Errc::auth_failed);
            finalize(id);
            return;
        }
        it->second.principal = std::move(principal);
        it->second.state = ConnectionState::Active;
        send(it->second, ClientProtocol::encodeAck("auth", {{"principal", it->second.principal->id}}));
        LOG_I("gateway", "connection {} authenticated as '{}'", id, it->second.principal->id);
        return;
    }

    try {
        handleFrame(it->second, std::move(decoded));
    }
    catch (const std::exception& ex) {
        LOG_E("gateway", "connection {}: frame handling failed: {}", id, ex.what());
        it = m_connections.find(id);
        if (it != m_connections.end()) {
            sendError(it->second, Errc::protocol_violation);
            beginClose(it->second, false);
        }
    }
}

void Gateway::handleFrame(Connection& c, DecodeResult decoded) {
    if (c.state != ConnectionState::Active) {
        // Draining: new work is refused.
        sendError(c, Errc::disconnected, decoded.requestId);
        return;
    }

    if (!decoded) {
        if (decoded.error == make_error_code(Errc::protocol_violation)) {
            LOG_W("gateway", "connection {}: protocol violation: {}", c.id, decoded.detail);
            sendError(c, Errc::protocol_violation, decoded.requestId);
            beginClose(c, false);
            return;
        }
        LOG_D("gateway", "connection {}: invalid request: {}", c.id, decoded.detail);
        sendError(c, Errc::invalid_request, decoded.requestId);
        return;
    }

    auto& msg = *decoded.message;
    if (std::holds_alternative<AuthMsg>(msg)) {
        sendError(c, Errc::invalid_request);
    }
    else if (auto* sub = std::get_if<SubscribeMsg>(&msg)) {
        if (!m_features.realTimeUpdates) {
            sendError(c, Errc::feature_disabled);
            return;
        }
        const auto held = m_registry.subscriptionsOf(c.id);
        if (held.size() >= m_server.maxSubscriptionsPerConnection &&
            std::find(held.begin(), held.end(), sub->key) == held.end()) {
            LOG_EVERY_N(INFO, 50, "gateway", "connection {}: subscription cap reached", c.id);
            sendError(c, Errc::rate_limited);
            return;
        }
        bool added = m_registry.subscribe(SubscriberHandle{c.id, c.channel}, sub->key);
        send(c, ClientProtocol::encodeAck("subscribe", {{"topic", sub->key.topic},
                                                        {"symbol", sub->key.symbol},
                                                        {"timeframe", sub->key.timeframe},
                                                        {"new", added}}));
    }
    else if (auto* unsub = std::get_if<UnsubscribeMsg>(&msg)) {
        bool removed = m_registry.unsubscribe(c.id, unsub->key);
        send(c, ClientProtocol::encodeAck("unsubscribe", {{"topic", unsub->key.topic},
                                                          {"symbol", unsub->key.symbol},
                                                          {"timeframe", unsub->key.timeframe},
                                                          {"removed", removed}}));
    }
    else if (auto* analyze = std::get_if<AnalyzeMsg>(&msg)) {
        dispatchAnalyze(c, std::move(*analyze));
    }
}

void Gateway::dispatchAnalyze(Connection& c, AnalyzeMsg msg) {
    if (c.inflight >= m_server.maxInflightPerConnection) {
        LOG_EVERY_N(INFO, 50, "gateway", "connection {}: in-flight cap reached", c.id);
        sendError(c, Errc::rate_limited, msg.id);
        return;
    }

    auto budget = std::min(msg.deadline.value_or(m_server.defaultDeadline), m_server.maxDeadline);

    AnalysisRequest request;
    request.requestId = std::move(msg.id);
    request.requester = *c.principal;
    request.symbols = std::move(msg.symbols);
    request.kinds = std::move(msg.kinds);
    request.params = std::move(msg.params);
    request.deadline = Deadline::after(budget);

    ++c.inflight;
    ++m_totalInflight;
    LOG_D("gateway", "connection {}: analyze {} ({} symbol(s), budget {}ms)", c.id, request.requestId,
          request.symbols.size(), budget.count());

    boost::asio::post(m_requestPool, [this, id = c.id, req = std::move(request)]() mutable {
        runAnalysis(id, std::move(req));
    });
}

void Gateway::runAnalysis(ConnectionId id, AnalysisRequest request) {
    std::string frame;
    try {
        auto result = m_router.handle(request);
        frame = result ? ClientProtocol::encodeInsight(result.value())
                       : ClientProtocol::encodeError(result.error(), request.requestId);
    }
    catch (const std::exception& ex) {
        LOG_E("gateway", "analyze {} failed: {}", request.requestId, ex.what());
        frame = ClientProtocol::encodeError(make_error_code(Errc::upstream_failed), request.requestId);
    }
    completeRequest(id, std::move(frame));
}

void Gateway::completeRequest(ConnectionId id, std::string frame) {
    std::lock_guard<std::mutex> lock(m_mx);
    --m_totalInflight;
    if (m_totalInflight == 0) m_idleCv.notify_all();

    auto it = m_connections.find(id);
    if (it == m_connections.end()) return;

    auto& c = it->second;
    if (c.inflight > 0) --c.inflight;
    send(c, std::move(frame));
    if (c.state == ConnectionState::Draining && c.inflight == 0) finalize(id);
}

void Gateway::onAuthTimeout(ConnectionId id) {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_connections.find(id);
    if (it == m_connections.end() || it->second.state != ConnectionState::Connecting) return;
    LOG_I("gateway", "connection {}: authentication timed out", id);
    sendError(it->second, Errc::auth_failed);
    finalize(id);
}

void Gateway::closeConnection(ConnectionId id) {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return;
    beginClose(it->second, false);
}

void Gateway::transportClosed(ConnectionId id) {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return;
    beginClose(it->second, true);
}

void Gateway::shutdown() {
    std::lock_guard<std::mutex> lock(m_mx);
    std::vector<ConnectionId> ids;
    ids.reserve(m_connections.size());
    for (const auto& [id, c] : m_connections) ids.push_back(id);

    LOG_I("gateway", "shutting down, draining {} connection(s)", ids.size());
    for (auto id : ids) {
        auto it = m_connections.find(id);
        if (it != m_connections.end()) beginClose(it->second, false);
    }
}

bool Gateway::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mx);
    return m_idleCv.wait_for(lock, timeout, [this] { return m_totalInflight == 0; });
}

std::optional<ConnectionState> Gateway::stateOf(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return std::nullopt;
    return it->second.state;
}

size_t Gateway::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_mx);
    return m_connections.size();
}

size_t Gateway::inflightOf(ConnectionId id) const {
    std::lock_guard<std::mutex> lock(m_mx);
    auto it = m_connections.find(id);
    return it == m_connections.end() ? 0 : it->second.inflight;
}

void Gateway::send(Connection& c, std::string frame) {
    if (c.channel->push(std::make_shared<const std::string>(std::move(frame))) ==
        OutboundChannel::PushResult::DroppedOldest) {
        LOG_EVERY_N(WARN, 1000, "gateway", "connection {}: outbound buffer full, oldest frame dropped", c.id);
    }
}

void Gateway::sendError(Connection& c, Errc code, const std::optional<std::string>& requestId) {
    send(c, ClientProtocol::encodeError(make_error_code(code), requestId));
}

void Gateway::beginClose(Connection& c, bool transportGone) {
    if (c.state == ConnectionState::Closed) return;
    if (transportGone) c.channel->close();

    m_registry.dropConnection(c.id);
    if (c.inflight == 0) {
        finalize(c.id);
        return;
    }
    if (c.state != ConnectionState::Draining) {
        LOG_D("gateway", "connection {} draining ({} request(s) in flight)", c.id, c.inflight);
        c.state = ConnectionState::Draining;
    }
}

void Gateway::finalize(ConnectionId id) {
    auto it = m_connections.find(id);
    if (it == m_connections.end()) return;
    auto& c = it->second;
    c.channel->close();
    m_registry.dropConnection(id);
    c.state = ConnectionState::Closed;
    LOG_I("gateway", "connection {} closed", id);
    m_connections.erase(it);
}

} // namespace Vigil
