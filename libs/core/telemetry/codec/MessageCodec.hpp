/*
Lookout — MessageCodec
Role: Pure protobuf encode of control frames and decode of server event frames.
Inputs/Outputs: ControlIntent → binary frame; binary frame → TelemetryEvent or an error string.
Threading: Stateless; safe to call from any thread.
Performance: One protobuf parse per frame; snapshots copy each download once.
Integration: Used by ConnectionManager (decode) and SubscriptionController (encode).
Observability: None; callers log decode failures.
Related: MessageCodec.cpp, TelemetryEvents.hpp, proto/download_progress.proto.
Assumptions: The event_type discriminator and the payload oneof always agree on the wire.
*/
#pragma once
#include <optional>
#include <string>
#include <string_view>
#include "TelemetryEvents.hpp"

struct DecodeResult {
    std::optional<TelemetryEvent> event;
    std::string error;   // set iff event is empty

    bool ok() const { return event.has_value(); }
    explicit operator bool() const { return ok(); }
};

class MessageCodec {
public:
    /// Serialize a Subscribe{ownerId} or Unsubscribe{} control frame.
    /// Throws std::runtime_error if protobuf serialization fails.
    static std::string encodeControl(const ControlIntent& intent);

    /// Decode one binary WebSocket frame. Never throws; malformed input,
    /// unknown discriminators and discriminator/payload mismatches all
    /// come back as an error result.
    static DecodeResult decodeEvent(std::string_view bytes) noexcept;
};
