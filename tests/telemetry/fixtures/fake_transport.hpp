#pragma once
#include "telemetry/ws/WsTransport.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/// Scriptable transport: records what the manager does and lets the test
/// play the server side (open, frames, errors, drops) synchronously.
class FakeTransport : public WsTransport {
public:
    void connect(const Endpoint& endpoint) override {
        endpoint_ = endpoint;
        ++connectCalls_;
    }

    /// Mirrors BeastWsTransport: closing a live transport reports down once.
    void close() override {
        ++closeCalls_;
        reportDown();
    }

    void send(std::string frame) override { sent_.push_back(std::move(frame)); }

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onStatus(StatusCb cb) override { onStatus_ = std::move(cb); }
    void onError(ErrorCb cb) override { onError_ = std::move(cb); }

    // --- server side -------------------------------------------------------
    void open() {
        open_ = true;
        if (onStatus_) onStatus_(true);
    }
    void deliver(const std::string& frame) {
        if (onMessage_) onMessage_(frame);
    }
    void fail(const std::string& message) {
        if (down_) return;
        if (onError_) onError_(message);
        reportDown();
    }
    /// Peer closed the connection cleanly
    void drop() { reportDown(); }

    // --- inspection --------------------------------------------------------
    const Endpoint& endpoint() const { return endpoint_; }
    const std::vector<std::string>& sent() const { return sent_; }
    int connectCalls() const { return connectCalls_; }
    int closeCalls() const { return closeCalls_; }
    bool isOpen() const { return open_ && !down_; }

private:
    MessageCb onMessage_;
    StatusCb  onStatus_;
    ErrorCb   onError_;

    Endpoint endpoint_;
    std::vector<std::string> sent_;
    int connectCalls_ = 0;
    int closeCalls_ = 0;
    bool open_ = false;
    bool down_ = false;

    void reportDown() {
        if (down_) return;
        down_ = true;
        open_ = false;
        if (onStatus_) onStatus_(false);
    }
};

/// Factory handing out FakeTransports and keeping them for inspection.
class FakeTransportFactory {
public:
    std::shared_ptr<WsTransport> operator()() {
        auto t = std::make_shared<FakeTransport>();
        created_.push_back(t);
        return t;
    }

    size_t count() const { return created_.size(); }
    FakeTransport& latest() {
        if (created_.empty()) throw std::runtime_error("FakeTransportFactory: nothing created yet");
        return *created_.back();
    }
    FakeTransport& at(size_t i) { return *created_.at(i); }

private:
    std::vector<std::shared_ptr<FakeTransport>> created_;
};
