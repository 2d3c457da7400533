#include "WsServer.hpp"
#include "Log.hpp"
#include <boost/asio/post.hpp>

namespace Vigil {

WsServer::WsServer(net::io_context& ioc, Gateway& gateway, const ServerConfig& config)
    : ioc_(ioc)
    , acceptor_(net::make_strand(ioc))
    , gateway_(gateway)
    , config_(config)
{}

void WsServer::start() {
    auto address = net::ip::make_address(config_.host);
    tcp::endpoint endpoint{address, config_.port};

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);

    LOG_I("ws", "listening on {}:{}", config_.host, acceptor_.local_endpoint().port());
    doAccept();
}

void WsServer::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) LOG_W("ws", "acceptor close: {}", ec.message());
    });
}

uint16_t WsServer::port() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void WsServer::doAccept() {
    acceptor_.async_accept(net::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            self->onAccept(ec, std::move(socket));
        });
}

void WsServer::onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) return;
        LOG_W("ws", "accept failed: {}", ec.message());
    } else {
        std::make_shared<WsSession>(std::move(socket), gateway_, config_.authTimeout)->run();
    }
    if (acceptor_.is_open()) doAccept();
}

} // namespace Vigil
