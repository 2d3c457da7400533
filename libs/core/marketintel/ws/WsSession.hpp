#pragma once
#include "../gateway/Gateway.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <memory>

namespace Vigil {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One accepted WebSocket client. All I/O for the session runs on its strand; outbound frames are
// pulled from the connection's OutboundChannel one write at a time.
class WsSession : public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, Gateway& gateway, std::chrono::milliseconds authTimeout)
        : ws_(std::move(socket))
        , authTimer_(ws_.get_executor())
        , gateway_(gateway)
        , authTimeout_(authTimeout)
    {}

    void run();

private:
    // Beast state
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buf_;
    net::steady_timer authTimer_;

    // Gateway link
    Gateway& gateway_;
    std::chrono::milliseconds authTimeout_;
    ConnectionHandle conn_;
    bool writing_{false};
    bool closing_{false};
    bool closed_{false};

    // Handlers
    void onRun();
    void onAccept(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes);
    void onChannelReady();
    void onTransportGone(beast::error_code ec);
};

} // namespace Vigil
