#pragma once
#include "download_progress.pb.h"
#include <cstdint>
#include <string>
#include <vector>

/// Golden server frames for the download-progress WebSocket,
/// built with the generated protobuf types exactly as the server encodes them.
namespace fixtures {

namespace pb = download_progress;

struct ProgressFields {
    std::string id;
    std::string streamer = "streamer-1";
    std::string status = "Downloading";
    uint64_t bytes = 0;
    uint64_t speed = 0;
    uint32_t segments = 0;
    double playbackRatio = 0.0;
    std::string session = "session-1";
    int64_t startedAtMs = 1700000000000;
};

inline void fillProgress(pb::DownloadProgress* p, const ProgressFields& s) {
    p->set_download_id(s.id);
    p->set_streamer_id(s.streamer);
    p->set_session_id(s.session);
    p->set_engine_type("mesio");
    p->set_status(s.status);
    p->set_bytes_downloaded(s.bytes);
    p->set_duration_secs(12.5);
    p->set_speed_bytes_per_sec(s.speed);
    p->set_segments_completed(s.segments);
    p->set_media_duration_secs(12.0);
    p->set_playback_ratio(s.playbackRatio);
    p->set_started_at_ms(s.startedAtMs);
}

inline std::string snapshot(const std::vector<ProgressFields>& downloads) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_SNAPSHOT);
    auto* snap = m.mutable_snapshot();
    for (const auto& d : downloads) fillProgress(snap->add_downloads(), d);
    return m.SerializeAsString();
}

inline std::string started(const std::string& id,
                           const std::string& streamer = "streamer-1",
                           const std::string& session = "session-1",
                           int64_t startedAtMs = 1700000000000) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_DOWNLOAD_STARTED);
    auto* s = m.mutable_download_started();
    s->set_download_id(id);
    s->set_streamer_id(streamer);
    s->set_session_id(session);
    s->set_engine_type("ffmpeg");
    s->set_started_at_ms(startedAtMs);
    return m.SerializeAsString();
}

inline std::string progress(const ProgressFields& fields) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_PROGRESS);
    fillProgress(m.mutable_progress(), fields);
    return m.SerializeAsString();
}

inline std::string completed(const std::string& id) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_DOWNLOAD_COMPLETED);
    auto* c = m.mutable_download_completed();
    c->set_download_id(id);
    c->set_streamer_id("streamer-1");
    c->set_total_bytes(1048576);
    c->set_total_duration_secs(3600.0);
    c->set_total_segments(360);
    return m.SerializeAsString();
}

inline std::string failed(const std::string& id, const std::string& error = "stream offline") {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_DOWNLOAD_FAILED);
    auto* f = m.mutable_download_failed();
    f->set_download_id(id);
    f->set_error(error);
    f->set_recoverable(true);
    return m.SerializeAsString();
}

inline std::string cancelled(const std::string& id) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_DOWNLOAD_CANCELLED);
    auto* c = m.mutable_download_cancelled();
    c->set_download_id(id);
    c->set_cause("user request");
    return m.SerializeAsString();
}

inline std::string segmentCompleted(const std::string& id, uint32_t index) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_SEGMENT_COMPLETED);
    auto* s = m.mutable_segment_completed();
    s->set_download_id(id);
    s->set_streamer_id("streamer-1");
    s->set_segment_path("/rec/streamer-1/part-" + std::to_string(index) + ".ts");
    s->set_segment_index(index);
    s->set_duration_secs(6.0);
    s->set_size_bytes(2048);
    return m.SerializeAsString();
}

inline std::string rejected(const std::string& streamer, const std::string& reason) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_DOWNLOAD_REJECTED);
    auto* r = m.mutable_download_rejected();
    r->set_streamer_id(streamer);
    r->set_reason(reason);
    r->set_retry_after_secs(60);
    r->set_recoverable(true);
    return m.SerializeAsString();
}

inline std::string serverError(const std::string& code, const std::string& message) {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_ERROR);
    auto* e = m.mutable_error();
    e->set_code(code);
    e->set_message(message);
    return m.SerializeAsString();
}

/// Length-delimited field whose declared length runs past the buffer.
inline std::string truncated() {
    return std::string("\x12\x05\x0a\x01", 4);
}

/// Progress payload tagged as a snapshot.
inline std::string mismatchedType() {
    pb::WsMessage m;
    m.set_event_type(pb::EVENT_TYPE_SNAPSHOT);
    fillProgress(m.mutable_progress(), ProgressFields{"d1"});
    return m.SerializeAsString();
}

} // namespace fixtures
