/*
Lookout — SubscriptionController Tests
Role: Verify the single desired filter is emitted on connect and on change
Testing Strategy: Capture frames from the sink → decode as ClientMessage
Coverage: Default clear-filter, re-assertion per connection, changes while (dis)connected
*/
#include <gtest/gtest.h>
#include "telemetry/ws/SubscriptionController.hpp"
#include "download_progress.pb.h"
#include <vector>

namespace {

download_progress::ClientMessage parse(const std::string& frame) {
    download_progress::ClientMessage msg;
    EXPECT_TRUE(msg.ParseFromString(frame));
    return msg;
}

} // namespace

class SubscriptionControllerTest : public ::testing::Test {
protected:
    std::vector<std::string> frames;
    SubscriptionController ctrl{[this](std::string f) { frames.push_back(std::move(f)); }};
};

TEST_F(SubscriptionControllerTest, DefaultsToAllDownloads) {
    EXPECT_FALSE(ctrl.filter().has_value());
    EXPECT_TRUE(std::holds_alternative<ClearFilterIntent>(ctrl.currentIntent()));
}

TEST_F(SubscriptionControllerTest, ConnectEmitsClearFilter) {
    ctrl.onConnected();
    ASSERT_EQ(frames.size(), 1);
    EXPECT_EQ(parse(frames[0]).action_case(), download_progress::ClientMessage::kUnsubscribe);
}

TEST_F(SubscriptionControllerTest, FilterSetOfflineIsSentOnConnect) {
    ctrl.setFilter(std::string("streamer-7"));
    EXPECT_TRUE(frames.empty());

    ctrl.onConnected();
    ASSERT_EQ(frames.size(), 1);
    auto msg = parse(frames[0]);
    ASSERT_EQ(msg.action_case(), download_progress::ClientMessage::kSubscribe);
    EXPECT_EQ(msg.subscribe().streamer_id(), "streamer-7");
}

TEST_F(SubscriptionControllerTest, FilterChangeWhileConnectedIsSentImmediately) {
    ctrl.onConnected();
    ctrl.setFilter(std::string("streamer-1"));
    ctrl.setFilter(std::nullopt);

    ASSERT_EQ(frames.size(), 3);
    EXPECT_EQ(parse(frames[1]).subscribe().streamer_id(), "streamer-1");
    EXPECT_EQ(parse(frames[2]).action_case(), download_progress::ClientMessage::kUnsubscribe);
}

TEST_F(SubscriptionControllerTest, ReassertsOnEveryConnection) {
    ctrl.setFilter(std::string("streamer-2"));
    ctrl.onConnected();
    ctrl.onDisconnected();
    ctrl.onConnected();

    ASSERT_EQ(frames.size(), 2);
    EXPECT_EQ(frames[0], frames[1]);
}

TEST_F(SubscriptionControllerTest, NothingSentWhileDisconnected) {
    ctrl.onConnected();
    ctrl.onDisconnected();
    ctrl.setFilter(std::string("streamer-3"));
    EXPECT_EQ(frames.size(), 1);
    EXPECT_FALSE(ctrl.connected());
}
