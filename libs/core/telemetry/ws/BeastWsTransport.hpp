#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct TransportOptions {
    std::chrono::seconds handshakeTimeout{30};
    std::chrono::seconds pingInterval{25};   // 0 disables client pings
    bool verifyPeer = true;
};

// Beast WebSocket client over plain TCP (ws://) or TLS (wss://).
// Handlers hold a shared_ptr to the transport, so it stays alive until
// every outstanding operation has completed even after the owner drops it.
class BeastWsTransport : public WsTransport,
                         public std::enable_shared_from_this<BeastWsTransport> {
public:
    BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx, TransportOptions opts = {})
        : strand_(net::make_strand(ioc))
        , sslCtx_(sslCtx)
        , resolver_(strand_)
        , pingTimer_(strand_)
        , opts_(opts)
    {}

    void connect(const Endpoint& endpoint) override;
    void close() override;
    void send(std::string frame) override;

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onStatus(StatusCb cb) override { onStatus_ = std::move(cb); }
    void onError(ErrorCb cb) override { onError_ = std::move(cb); }

private:
    using PlainWs = websocket::stream<beast::tcp_stream>;
    using TlsWs   = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    // Callbacks
    MessageCb onMessage_;
    StatusCb  onStatus_;
    ErrorCb   onError_;

    // Beast state
    net::strand<net::io_context::executor_type> strand_;
    ssl::context& sslCtx_;
    tcp::resolver resolver_;
    std::variant<std::monostate, PlainWs, TlsWs> ws_;
    beast::flat_buffer buf_;
    net::steady_timer pingTimer_;
    std::deque<std::string> writeQueue_;
    TransportOptions opts_;

    // State
    Endpoint endpoint_;
    bool open_ = false;
    bool closing_ = false;
    bool down_ = false;     // status(false) already reported

    template <class F>
    void withStream(F&& f) {
        std::visit([&f](auto& ws) {
            if constexpr (!std::is_same_v<std::decay_t<decltype(ws)>, std::monostate>) f(ws);
        }, ws_);
    }

    // Handlers
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec);
    void onSslHandshake(beast::error_code ec);
    void onWsHandshake(beast::error_code ec);
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void doWrite();
    void schedulePing();
    void fail(beast::error_code ec, const char* what);
    void reportDown();
};
