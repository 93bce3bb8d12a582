/*
Lookout — MessageCodec Tests
Role: Verify protobuf frame decode into TelemetryEvents and control frame encode
Testing Strategy: Golden protobuf fixtures → assert event alternatives and fields
Coverage: All event kinds, control intents, discriminator mismatch, malformed input
*/
#include <gtest/gtest.h>
#include "telemetry/codec/MessageCodec.hpp"
#include "fixtures/download_frames.hpp"
#include "download_progress.pb.h"

// =============================================================================
// Control Frame Encoding
// =============================================================================

TEST(MessageCodec, EncodeSubscribeCarriesStreamerId) {
    const std::string frame = MessageCodec::encodeControl(SubscribeIntent{"streamer-42"});

    download_progress::ClientMessage msg;
    ASSERT_TRUE(msg.ParseFromString(frame));
    ASSERT_EQ(msg.action_case(), download_progress::ClientMessage::kSubscribe);
    EXPECT_EQ(msg.subscribe().streamer_id(), "streamer-42");
}

TEST(MessageCodec, EncodeClearFilterIsUnsubscribe) {
    const std::string frame = MessageCodec::encodeControl(ClearFilterIntent{});

    download_progress::ClientMessage msg;
    ASSERT_TRUE(msg.ParseFromString(frame));
    EXPECT_EQ(msg.action_case(), download_progress::ClientMessage::kUnsubscribe);
}

TEST(MessageCodec, EncodingIsDeterministic) {
    EXPECT_EQ(MessageCodec::encodeControl(SubscribeIntent{"s"}),
              MessageCodec::encodeControl(SubscribeIntent{"s"}));
    EXPECT_NE(MessageCodec::encodeControl(SubscribeIntent{"s"}),
              MessageCodec::encodeControl(ClearFilterIntent{}));
}

// =============================================================================
// Event Decoding
// =============================================================================

TEST(MessageCodec, DecodeSnapshot) {
    fixtures::ProgressFields a{"d1"};
    a.bytes = 1000;
    a.speed = 250;
    fixtures::ProgressFields b{"d2", "streamer-2"};
    b.status = "Starting";

    auto result = MessageCodec::decodeEvent(fixtures::snapshot({a, b}));
    ASSERT_TRUE(result.ok()) << result.error;

    auto* snap = std::get_if<SnapshotEvent>(&*result.event);
    ASSERT_NE(snap, nullptr);
    ASSERT_EQ(snap->downloads.size(), 2);

    const auto& d1 = snap->downloads[0];
    EXPECT_EQ(d1.id, "d1");
    EXPECT_EQ(d1.ownerId, "streamer-1");
    EXPECT_EQ(d1.sessionId, "session-1");
    EXPECT_EQ(d1.engineType, "mesio");
    EXPECT_EQ(d1.status, DownloadStatus::Running);
    EXPECT_EQ(d1.metrics.bytesDownloaded, 1000u);
    EXPECT_EQ(d1.metrics.speedBytesPerSec, 250u);
    EXPECT_DOUBLE_EQ(d1.metrics.durationSecs, 12.5);
    EXPECT_EQ(toEpochMillis(d1.startedAt), 1700000000000);

    EXPECT_EQ(snap->downloads[1].id, "d2");
    EXPECT_EQ(snap->downloads[1].status, DownloadStatus::Starting);
}

TEST(MessageCodec, DecodeEmptySnapshot) {
    auto result = MessageCodec::decodeEvent(fixtures::snapshot({}));
    ASSERT_TRUE(result.ok()) << result.error;
    auto* snap = std::get_if<SnapshotEvent>(&*result.event);
    ASSERT_NE(snap, nullptr);
    EXPECT_TRUE(snap->downloads.empty());
}

TEST(MessageCodec, DecodeDownloadStarted) {
    auto result = MessageCodec::decodeEvent(fixtures::started("d9", "streamer-3", "sess-3", 1700000005000));
    ASSERT_TRUE(result.ok()) << result.error;

    auto* created = std::get_if<CreatedEvent>(&*result.event);
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->id, "d9");
    EXPECT_EQ(created->ownerId, "streamer-3");
    EXPECT_EQ(created->sessionId, "sess-3");
    EXPECT_EQ(created->engineType, "ffmpeg");
    EXPECT_EQ(toEpochMillis(created->startedAt), 1700000005000);
}

TEST(MessageCodec, DecodeProgress) {
    fixtures::ProgressFields p{"d1"};
    p.bytes = 4096;
    p.speed = 512;
    p.segments = 7;
    p.playbackRatio = 1.25;

    auto result = MessageCodec::decodeEvent(fixtures::progress(p));
    ASSERT_TRUE(result.ok()) << result.error;

    auto* update = std::get_if<MetricsUpdatedEvent>(&*result.event);
    ASSERT_NE(update, nullptr);
    EXPECT_EQ(update->id, "d1");
    EXPECT_EQ(update->metrics.bytesDownloaded, 4096u);
    EXPECT_EQ(update->metrics.speedBytesPerSec, 512u);
    EXPECT_EQ(update->metrics.segmentsCompleted, 7u);
    EXPECT_DOUBLE_EQ(update->metrics.playbackRatio, 1.25);
    ASSERT_TRUE(update->status.has_value());
    EXPECT_EQ(*update->status, DownloadStatus::Running);
}

TEST(MessageCodec, ProgressWithoutStatusLeavesStatusUnset) {
    fixtures::ProgressFields p{"d1"};
    p.status.clear();

    auto result = MessageCodec::decodeEvent(fixtures::progress(p));
    ASSERT_TRUE(result.ok()) << result.error;
    auto* update = std::get_if<MetricsUpdatedEvent>(&*result.event);
    ASSERT_NE(update, nullptr);
    EXPECT_FALSE(update->status.has_value());
}

TEST(MessageCodec, DecodeTerminalEvents) {
    auto completed = MessageCodec::decodeEvent(fixtures::completed("d1"));
    ASSERT_TRUE(completed.ok());
    auto* c = std::get_if<CompletedEvent>(&*completed.event);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->id, "d1");
    EXPECT_EQ(c->totalBytes, 1048576u);
    EXPECT_EQ(c->totalSegments, 360u);

    auto failed = MessageCodec::decodeEvent(fixtures::failed("d2", "network unreachable"));
    ASSERT_TRUE(failed.ok());
    auto* f = std::get_if<FailedEvent>(&*failed.event);
    ASSERT_NE(f, nullptr);
    EXPECT_EQ(f->id, "d2");
    EXPECT_EQ(f->error, "network unreachable");
    EXPECT_TRUE(f->recoverable);

    auto cancelled = MessageCodec::decodeEvent(fixtures::cancelled("d3"));
    ASSERT_TRUE(cancelled.ok());
    auto* x = std::get_if<CancelledEvent>(&*cancelled.event);
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->id, "d3");
    EXPECT_EQ(x->cause, "user request");
}

TEST(MessageCodec, DecodeInformationalEvents) {
    auto seg = MessageCodec::decodeEvent(fixtures::segmentCompleted("d1", 12));
    ASSERT_TRUE(seg.ok());
    auto* u = std::get_if<UnitCompletedEvent>(&*seg.event);
    ASSERT_NE(u, nullptr);
    EXPECT_EQ(u->segmentIndex, 12u);
    EXPECT_EQ(u->segmentPath, "/rec/streamer-1/part-12.ts");
    EXPECT_EQ(u->sizeBytes, 2048u);

    auto rej = MessageCodec::decodeEvent(fixtures::rejected("streamer-5", "circuit breaker open"));
    ASSERT_TRUE(rej.ok());
    auto* r = std::get_if<RejectedEvent>(&*rej.event);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->ownerId, "streamer-5");
    EXPECT_EQ(r->reason, "circuit breaker open");
    EXPECT_EQ(r->retryAfterSecs, 60u);

    auto err = MessageCodec::decodeEvent(fixtures::serverError("SUBSCRIBE_FAILED", "unknown streamer"));
    ASSERT_TRUE(err.ok());
    auto* e = std::get_if<ServerErrorEvent>(&*err.event);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->code, "SUBSCRIBE_FAILED");
    EXPECT_EQ(e->message, "unknown streamer");
    EXPECT_STREQ(eventName(*err.event), "error");
}

// =============================================================================
// Error Handling
// =============================================================================

TEST(MessageCodec, MalformedBytesAreAnError) {
    auto result = MessageCodec::decodeEvent(fixtures::truncated());
    EXPECT_FALSE(result.ok());
    EXPECT_FALSE(result.error.empty());
}

TEST(MessageCodec, EmptyFrameHasNoPayload) {
    auto result = MessageCodec::decodeEvent(std::string_view{});
    EXPECT_FALSE(result);
    EXPECT_NE(result.error.find("no payload"), std::string::npos);
}

TEST(MessageCodec, DiscriminatorMismatchIsAnError) {
    auto result = MessageCodec::decodeEvent(fixtures::mismatchedType());
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.error.find("does not match"), std::string::npos);
}

TEST(MessageCodec, UnknownDiscriminatorIsAnError) {
    download_progress::WsMessage m;
    m.set_event_type(static_cast<download_progress::EventType>(42));
    m.mutable_error()->set_code("X");
    auto result = MessageCodec::decodeEvent(m.SerializeAsString());
    EXPECT_FALSE(result.ok());
}
