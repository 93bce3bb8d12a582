#pragma once
#include <functional>
#include <string>
#include "telemetry/config/Endpoint.hpp"

// Pure transport interface (no protocol logic).
// One instance serves one connection attempt; it is released, not reused,
// once it reports down.
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // binary frame, owned
    using StatusCb  = std::function<void(bool)>;        // true on open, false once when down
    using ErrorCb   = std::function<void(std::string)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;

    virtual void connect(const Endpoint& endpoint) = 0;
    virtual void close() = 0;
    virtual void send(std::string frame) = 0; // serialized by implementation

    // Register before connect()
    virtual void onMessage(MessageCb) = 0;
    virtual void onStatus(StatusCb) = 0;
    virtual void onError(ErrorCb) = 0;
};
