#pragma once
#include <chrono>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "telemetry/model/DownloadEntity.hpp"

// ─────────────────────────────────────────────────────────────
// Decoded server → client events.
// Snapshot/Created/MetricsUpdated/terminal events mutate the projection;
// UnitCompleted, Rejected and ServerError are informational only.
// ─────────────────────────────────────────────────────────────

struct SnapshotEvent { std::vector<DownloadEntity> downloads; };

// Partial entity: identity fields only, metrics start at zero.
struct CreatedEvent {
    std::string id;
    std::string ownerId;
    std::string sessionId;
    std::string engineType;
    std::chrono::system_clock::time_point startedAt{};
};

struct MetricsUpdatedEvent {
    std::string id;
    DownloadMetrics metrics;
    std::optional<DownloadStatus> status;   // absent when the frame carries none
};

struct CompletedEvent {
    std::string id;
    std::string ownerId;
    std::string sessionId;
    uint64_t totalBytes = 0;
    double   totalDurationSecs = 0.0;
    uint32_t totalSegments = 0;
};

struct FailedEvent {
    std::string id;
    std::string ownerId;
    std::string sessionId;
    std::string error;
    bool recoverable = false;
};

struct CancelledEvent {
    std::string id;
    std::string ownerId;
    std::string sessionId;
    std::string cause;
};

struct UnitCompletedEvent {
    std::string id;
    std::string ownerId;
    std::string sessionId;
    std::string segmentPath;
    uint32_t segmentIndex = 0;
    double   durationSecs = 0.0;
    uint64_t sizeBytes = 0;
};

struct RejectedEvent {
    std::string ownerId;
    std::string sessionId;
    std::string reason;
    uint64_t retryAfterSecs = 0;
    bool recoverable = false;
};

struct ServerErrorEvent {
    std::string code;
    std::string message;
};

using TelemetryEvent = std::variant<SnapshotEvent,
                                    CreatedEvent,
                                    MetricsUpdatedEvent,
                                    CompletedEvent,
                                    FailedEvent,
                                    CancelledEvent,
                                    UnitCompletedEvent,
                                    RejectedEvent,
                                    ServerErrorEvent>;

// Short name of the event alternative, for logs and the eventDecoded signal.
inline const char* eventName(const TelemetryEvent& ev) {
    static constexpr const char* kNames[] = {
        "snapshot", "created", "metrics_updated", "completed", "failed",
        "cancelled", "unit_completed", "rejected", "error"
    };
    static_assert(std::size(kNames) == std::variant_size_v<TelemetryEvent>);
    return kNames[ev.index()];
}

// Client → server control intents
struct SubscribeIntent { std::string ownerId; };
struct ClearFilterIntent {};

using ControlIntent = std::variant<SubscribeIntent, ClearFilterIntent>;
