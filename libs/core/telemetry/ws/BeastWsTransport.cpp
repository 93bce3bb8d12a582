#include "BeastWsTransport.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/beast/version.hpp>
#include <boost/asio/post.hpp>
#include <openssl/err.h>

void BeastWsTransport::connect(const Endpoint& endpoint) {
    net::post(strand_, [self = shared_from_this(), endpoint]() {
        self->endpoint_ = endpoint;
        if (endpoint.secure) {
            self->ws_.emplace<TlsWs>(self->strand_, self->sslCtx_);
        } else {
            self->ws_.emplace<PlainWs>(self->strand_);
        }
        self->resolver_.async_resolve(self->endpoint_.host, self->endpoint_.port,
            [self](beast::error_code ec, tcp::resolver::results_type results) {
                self->onResolve(ec, results);
            });
    });
}

void BeastWsTransport::close() {
    net::post(strand_, [self = shared_from_this()]() {
        if (self->closing_ || self->down_) return;
        self->closing_ = true;
        self->pingTimer_.cancel();
        if (self->open_) {
            self->withStream([&self](auto& ws) {
                ws.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
                    if (ec && ec != net::error::operation_aborted && self->onError_) {
                        self->onError_(ec.message());
                    }
                    self->reportDown();
                });
            });
        } else {
            // Still resolving / connecting / handshaking: abort the pending op
            self->resolver_.cancel();
            self->withStream([](auto& ws) { beast::get_lowest_layer(ws).close(); });
            self->reportDown();
        }
    });
}

void BeastWsTransport::send(std::string frame) {
    net::post(strand_, [self = shared_from_this(), m = std::move(frame)]() mutable {
        if (!self->open_ || self->closing_) return;
        self->writeQueue_.emplace_back(std::move(m));
        if (self->writeQueue_.size() == 1) {
            self->doWrite();
        }
    });
}

void BeastWsTransport::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) { fail(ec, "resolve"); return; }
    withStream([this, &results](auto& ws) {
        beast::get_lowest_layer(ws).expires_after(opts_.handshakeTimeout);
        beast::get_lowest_layer(ws).async_connect(results,
            [self = shared_from_this()](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
                self->onConnect(ec);
            });
    });
}

void BeastWsTransport::onConnect(beast::error_code ec) {
    if (ec) { fail(ec, "connect"); return; }
    if (auto* tls = std::get_if<TlsWs>(&ws_)) {
        if (!SSL_set_tlsext_host_name(tls->next_layer().native_handle(), endpoint_.host.c_str())) {
            beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
            fail(ssl_ec, "sni");
            return;
        }
        if (opts_.verifyPeer) {
            if (!SSL_set1_host(tls->next_layer().native_handle(), endpoint_.host.c_str())) {
                beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                fail(ssl_ec, "verify host");
                return;
            }
            tls->next_layer().set_verify_mode(ssl::verify_peer);
        } else {
            tls->next_layer().set_verify_mode(ssl::verify_none);
        }
        tls->next_layer().async_handshake(ssl::stream_base::client,
            [self = shared_from_this()](beast::error_code ec) { self->onSslHandshake(ec); });
        return;
    }
    onSslHandshake({});
}

void BeastWsTransport::onSslHandshake(beast::error_code ec) {
    if (ec) { fail(ec, "tls handshake"); return; }
    withStream([this](auto& ws) {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent,
                    std::string(BOOST_BEAST_VERSION_STRING) + " lookout");
        }));
        ws.binary(true);
        ws.async_handshake(hostAndPort(endpoint_), endpoint_.target,
            [self = shared_from_this()](beast::error_code ec) { self->onWsHandshake(ec); });
    });
}

void BeastWsTransport::onWsHandshake(beast::error_code ec) {
    if (ec) { fail(ec, "ws handshake"); return; }
    if (closing_) return;
    open_ = true;
    if (onStatus_) onStatus_(true);
    doRead();
    schedulePing();
}

void BeastWsTransport::doRead() {
    withStream([this](auto& ws) {
        ws.async_read(buf_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
            self->onRead(ec, bytes);
        });
    });
}

void BeastWsTransport::onRead(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            // Server sent a close frame; not an error
            open_ = false;
            reportDown();
            return;
        }
        fail(ec, "read");
        return;
    }

    std::string payload = beast::buffers_to_string(buf_.data());
    buf_.consume(buf_.size());
    if (onMessage_) onMessage_(std::move(payload));

    doRead();
}

void BeastWsTransport::doWrite() {
    if (writeQueue_.empty()) return;
    withStream([this](auto& ws) {
        ws.async_write(net::buffer(writeQueue_.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (ec) { self->fail(ec, "write"); return; }
                self->writeQueue_.pop_front();
                if (!self->writeQueue_.empty()) self->doWrite();
            });
    });
}

void BeastWsTransport::schedulePing() {
    if (opts_.pingInterval.count() <= 0) return;
    pingTimer_.expires_after(opts_.pingInterval);
    pingTimer_.async_wait([self = shared_from_this()](beast::error_code ec) {
        if (ec || !self->open_ || self->closing_) return;
        self->withStream([&self](auto& ws) {
            ws.async_ping({}, [self](beast::error_code ec2) {
                if (ec2) { self->fail(ec2, "ping"); return; }
                self->schedulePing();
            });
        });
    });
}

void BeastWsTransport::fail(beast::error_code ec, const char* what) {
    open_ = false;
    pingTimer_.cancel();
    if (down_) return;
    // Aborts caused by our own close() are not worth reporting
    if (!(closing_ && ec == net::error::operation_aborted) && onError_) {
        onError_(std::string(what) + ": " + ec.message());
    }
    reportDown();
}

void BeastWsTransport::reportDown() {
    if (down_) return;
    down_ = true;
    open_ = false;
    if (onStatus_) onStatus_(false);
}
