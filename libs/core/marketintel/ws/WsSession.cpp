#include "WsSession.hpp"
#include "Log.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace Vigil {

void WsSession::run() {
    net::dispatch(ws_.get_executor(), [self = shared_from_this()] { self->onRun(); });
}

void WsSession::onRun() {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(beast::http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " vigil-gateway");
    }));
    ws_.async_accept([self = shared_from_this()](beast::error_code ec) { self->onAccept(ec); });
}

void WsSession::onAccept(beast::error_code ec) {
    if (ec) {
        LOG_D("ws", "handshake failed: {}", ec.message());
        return;
    }

    std::weak_ptr<WsSession> weak = shared_from_this();
    conn_ = gateway_.openConnection([weak] {
        if (auto self = weak.lock()) {
            net::post(self->ws_.get_executor(), [self] { self->onChannelReady(); });
        }
    });

    authTimer_.expires_after(authTimeout_);
    authTimer_.async_wait([self = shared_from_this()](beast::error_code tec) {
        if (tec) return;
        self->gateway_.onAuthTimeout(self->conn_.id);
    });

    doRead();
}

void WsSession::doRead() {
    ws_.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onRead(ec, bytes);
    });
}

void WsSession::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        onTransportGone(ec);
        return;
    }

    if (!ws_.got_text()) {
        buf_.consume(buf_.size());
        gateway_.onMessage(conn_.id, std::string_view{});   // binary frames are not part of the protocol
    } else {
        auto b = buf_.data();
        std::string payload(static_cast<const char*>(b.data()), b.size());
        buf_.consume(buf_.size());
        gateway_.onMessage(conn_.id, payload);
    }

    // Auth succeeded or failed on the first frame either way; the timer has done its job.
    authTimer_.cancel();
    doRead();
}

void WsSession::onChannelReady() {
    if (!writing_) doWrite();
}

void WsSession::doWrite() {
    if (closed_ || closing_) return;

    auto frame = conn_.channel->pop();
    if (!frame) {
        if (conn_.channel->closed()) {
            closing_ = true;
            authTimer_.cancel();
            ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
                if (ec) LOG_D("ws", "connection {} close: {}", self->conn_.id, ec.message());
                self->onTransportGone(ec);
            });
        }
        return;
    }

    writing_ = true;
    ws_.text(true);
    ws_.async_write(net::buffer(*frame), [self = shared_from_this(), frame](beast::error_code ec, std::size_t bytes) {
        self->onWrite(ec, bytes);
    });
}

void WsSession::onWrite(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
        onTransportGone(ec);
        return;
    }
    doWrite();
}

void WsSession::onTransportGone(beast::error_code ec) {
    if (closed_) return;
    closed_ = true;
    authTimer_.cancel();
    if (ec && ec != websocket::error::closed && ec != net::error::operation_aborted) {
        LOG_D("ws", "connection {} transport error: {}", conn_.id, ec.message());
    }
    gateway_.transportClosed(conn_.id);
}

} // namespace Vigil
