/*
Lookout — MessageCodec
Role: Maps between the generated protobuf types and the in-process event variant.
Inputs/Outputs: Binary frames in; TelemetryEvent / DecodeResult out.
Threading: No shared state.
Performance: Hot path is decodeEvent for progress frames.
Integration: See MessageCodec.hpp.
Observability: None.
Related: MessageCodec.hpp, download_progress.pb.h (generated).
Assumptions: proto3 defaults (empty strings, zeros) are valid field values.
*/
#include "MessageCodec.hpp"
#include "download_progress.pb.h"
#include <exception>
#include <stdexcept>
#include <type_traits>

namespace pb = download_progress;

namespace {

DownloadEntity toEntity(const pb::DownloadProgress& p) {
    DownloadEntity e;
    e.id          = p.download_id();
    e.ownerId     = p.streamer_id();
    e.sessionId   = p.session_id();
    e.engineType  = p.engine_type();
    e.downloadUrl = p.download_url();
    e.status      = parseDownloadStatus(p.status());
    e.metrics.bytesDownloaded   = p.bytes_downloaded();
    e.metrics.durationSecs      = p.duration_secs();
    e.metrics.speedBytesPerSec  = p.speed_bytes_per_sec();
    e.metrics.segmentsCompleted = p.segments_completed();
    e.metrics.mediaDurationSecs = p.media_duration_secs();
    e.metrics.playbackRatio     = p.playback_ratio();
    e.startedAt = fromEpochMillis(p.started_at_ms());
    return e;
}

MetricsUpdatedEvent toMetricsUpdate(const pb::DownloadProgress& p) {
    MetricsUpdatedEvent ev;
    ev.id = p.download_id();
    ev.metrics = toEntity(p).metrics;
    if (!p.status().empty()) {
        ev.status = parseDownloadStatus(p.status());
    }
    return ev;
}

// Discriminator each payload must be tagged with
pb::EventType expectedType(pb::WsMessage::PayloadCase c) {
    switch (c) {
        case pb::WsMessage::kSnapshot:          return pb::EVENT_TYPE_SNAPSHOT;
        case pb::WsMessage::kDownloadStarted:   return pb::EVENT_TYPE_DOWNLOAD_STARTED;
        case pb::WsMessage::kProgress:          return pb::EVENT_TYPE_PROGRESS;
        case pb::WsMessage::kSegmentCompleted:  return pb::EVENT_TYPE_SEGMENT_COMPLETED;
        case pb::WsMessage::kDownloadCompleted: return pb::EVENT_TYPE_DOWNLOAD_COMPLETED;
        case pb::WsMessage::kDownloadFailed:    return pb::EVENT_TYPE_DOWNLOAD_FAILED;
        case pb::WsMessage::kDownloadCancelled: return pb::EVENT_TYPE_DOWNLOAD_CANCELLED;
        case pb::WsMessage::kError:             return pb::EVENT_TYPE_ERROR;
        case pb::WsMessage::kDownloadRejected:  return pb::EVENT_TYPE_DOWNLOAD_REJECTED;
        case pb::WsMessage::PAYLOAD_NOT_SET:    break;
    }
    return pb::EVENT_TYPE_UNSPECIFIED;
}

TelemetryEvent toEvent(const pb::WsMessage& m) {
    switch (m.payload_case()) {
        case pb::WsMessage::kSnapshot: {
            SnapshotEvent ev;
            ev.downloads.reserve(static_cast<size_t>(m.snapshot().downloads_size()));
            for (const auto& d : m.snapshot().downloads()) {
                ev.downloads.emplace_back(toEntity(d));
            }
            return ev;
        }
        case pb::WsMessage::kDownloadStarted: {
            const auto& s = m.download_started();
            return CreatedEvent{s.download_id(), s.streamer_id(), s.session_id(),
                                s.engine_type(), fromEpochMillis(s.started_at_ms())};
        }
        case pb::WsMessage::kProgress:
            return toMetricsUpdate(m.progress());
        case pb::WsMessage::kSegmentCompleted: {
            const auto& s = m.segment_completed();
            return UnitCompletedEvent{s.download_id(), s.streamer_id(), s.session_id(),
                                      s.segment_path(), s.segment_index(),
                                      s.duration_secs(), s.size_bytes()};
        }
        case pb::WsMessage::kDownloadCompleted: {
            const auto& c = m.download_completed();
            return CompletedEvent{c.download_id(), c.streamer_id(), c.session_id(),
                                  c.total_bytes(), c.total_duration_secs(), c.total_segments()};
        }
        case pb::WsMessage::kDownloadFailed: {
            const auto& f = m.download_failed();
            return FailedEvent{f.download_id(), f.streamer_id(), f.session_id(),
                               f.error(), f.recoverable()};
        }
        case pb::WsMessage::kDownloadCancelled: {
            const auto& c = m.download_cancelled();
            return CancelledEvent{c.download_id(), c.streamer_id(), c.session_id(), c.cause()};
        }
        case pb::WsMessage::kDownloadRejected: {
            const auto& r = m.download_rejected();
            return RejectedEvent{r.streamer_id(), r.session_id(), r.reason(),
                                 r.retry_after_secs(), r.recoverable()};
        }
        case pb::WsMessage::kError:
        case pb::WsMessage::PAYLOAD_NOT_SET:
            break;
    }
    return ServerErrorEvent{m.error().code(), m.error().message()};
}

} // namespace

std::string MessageCodec::encodeControl(const ControlIntent& intent) {
    pb::ClientMessage msg;
    std::visit([&msg](const auto& i) {
        using T = std::decay_t<decltype(i)>;
        if constexpr (std::is_same_v<T, SubscribeIntent>) {
            msg.mutable_subscribe()->set_streamer_id(i.ownerId);
        } else {
            msg.mutable_unsubscribe();
        }
    }, intent);

    std::string out;
    if (!msg.SerializeToString(&out)) {
        throw std::runtime_error("MessageCodec: failed to serialize control frame");
    }
    return out;
}

DecodeResult MessageCodec::decodeEvent(std::string_view bytes) noexcept {
    DecodeResult out;
    try {
        pb::WsMessage msg;
        if (!msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            out.error = "malformed frame (" + std::to_string(bytes.size()) + " bytes)";
            return out;
        }
        if (msg.payload_case() == pb::WsMessage::PAYLOAD_NOT_SET) {
            out.error = "frame has no payload (event_type " + std::to_string(static_cast<int>(msg.event_type())) + ")";
            return out;
        }
        const pb::EventType expected = expectedType(msg.payload_case());
        if (msg.event_type() != expected) {
            out.error = "event_type " + std::to_string(static_cast<int>(msg.event_type()))
                      + " does not match payload (expected " + std::to_string(static_cast<int>(expected)) + ")";
            return out;
        }
        out.event = toEvent(msg);
    } catch (const std::exception& e) {
        out.event.reset();
        out.error = std::string("decode failed: ") + e.what();
    }
    return out;
}
