/*
Vigil — WsServer
Role: Accepts TCP connections and hands each to a WsSession bound to the Gateway.
Inputs/Outputs: Listens on server.host:server.port; produces WsSessions.
Threading: The acceptor runs on its own strand; each session gets a fresh strand.
Integration: Built and started by apps/vigil_gateway; stop() closes the acceptor before Gateway::shutdown().
Observability: Listen and accept errors log under "ws".
Related: WsServer.cpp, WsSession.hpp, Gateway.hpp.
Assumptions: Plain WebSocket; TLS termination, if any, happens in front of the gateway.
*/
#pragma once
#include "WsSession.hpp"
#include "../config/VigilConfig.hpp"

namespace Vigil {

class WsServer : public std::enable_shared_from_this<WsServer> {
public:
    WsServer(net::io_context& ioc, Gateway& gateway, const ServerConfig& config);

    /// Binds and starts accepting. Throws boost::system::system_error if the endpoint is unusable.
    void start();
    void stop();

    [[nodiscard]] uint16_t port() const;

private:
    void doAccept();
    void onAccept(beast::error_code ec, tcp::socket socket);

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    Gateway& gateway_;
    ServerConfig config_;
};

} // namespace Vigil
