#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include "telemetry/codec/MessageCodec.hpp"

// Holds the one desired server-side filter (all downloads, or one streamer)
// and re-asserts it on every fresh connection. The server is never assumed
// to remember a filter from a previous connection.
class SubscriptionController {
public:
    using FrameSink = std::function<void(std::string)>;

    explicit SubscriptionController(FrameSink sink) : m_sink(std::move(sink)) {}

    const std::optional<std::string>& filter() const { return m_ownerFilter; }
    bool connected() const { return m_connected; }

    ControlIntent currentIntent() const {
        if (m_ownerFilter) return SubscribeIntent{*m_ownerFilter};
        return ClearFilterIntent{};
    }

    std::string buildFilterFrame() const {
        return MessageCodec::encodeControl(currentIntent());
    }

    /// Transport just opened: emit the current filter.
    void onConnected() {
        m_connected = true;
        emitFilter();
    }

    void onDisconnected() { m_connected = false; }

    /// std::nullopt means "receive all". Emits immediately when connected.
    void setFilter(std::optional<std::string> ownerId) {
        m_ownerFilter = std::move(ownerId);
        if (m_connected) emitFilter();
    }

private:
    FrameSink m_sink;
    std::optional<std::string> m_ownerFilter;
    bool m_connected = false;

    void emitFilter() {
        if (m_sink) m_sink(buildFilterFrame());
    }
};
