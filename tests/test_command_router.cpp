// Tests for target resolution and fan-out delivery.
#include "playlink/command_router.h"

#include <gtest/gtest.h>

namespace {

// A registered device plus the far end of its connection.
struct Peer {
  std::shared_ptr<playlink::Session> session;
  std::shared_ptr<playlink::Transport> remote;
};

class CommandRouterTest : public ::testing::Test {
 protected:
  CommandRouterTest() : registry_(Quiet()), router_(registry_, Quiet()) {}

  static playlink::LogCallback Quiet() {
    return [](const std::string&) {};
  }

  Peer Add(const std::string& device_id, playlink::Role role) {
    auto pair = playlink::MakeMemoryTransportPair(device_id, "hub");
    Peer peer;
    peer.remote = pair.first;
    peer.session = std::make_shared<playlink::Session>("s-" + device_id, pair.second, Quiet());
    peer.session->SetIdentity(device_id, role);
    registry_.Register(device_id, "", role, peer.session);
    return peer;
  }

  static std::vector<playlink::Message> Received(const Peer& peer) {
    std::vector<playlink::Message> messages;
    std::string frame;
    while (peer.remote->Receive(&frame, std::chrono::milliseconds(10)) ==
           playlink::ReceiveStatus::kFrame) {
      playlink::Message message;
      if (playlink::DecodeMessage(frame, &message)) {
        messages.push_back(message);
      }
    }
    return messages;
  }

  playlink::DeviceRegistry registry_;
  playlink::CommandRouter router_;
};

}  // namespace

TEST_F(CommandRouterTest, AllResolvesToPlayersOnly) {
  auto controller = Add("ctl", playlink::Role::kController);
  auto a = Add("vp-a", playlink::Role::kPlayer);
  auto b = Add("vp-b", playlink::Role::kPlayer);

  const auto targets = router_.ResolveTargets(playlink::TargetSpec::All());
  EXPECT_EQ(targets, (std::vector<std::string>{"vp-a", "vp-b"}));
}

TEST_F(CommandRouterTest, ListDropsUnknownDuplicatesAndControllers) {
  auto controller = Add("ctl", playlink::Role::kController);
  auto a = Add("vp-a", playlink::Role::kPlayer);
  auto b = Add("vp-b", playlink::Role::kPlayer);

  const auto targets = router_.ResolveTargets(
      playlink::TargetSpec::List({"vp-b", "ghost", "ctl", "vp-b", "vp-a"}));
  EXPECT_EQ(targets, (std::vector<std::string>{"vp-b", "vp-a"}));

  EXPECT_TRUE(router_.ResolveTargets(playlink::TargetSpec::Single("ghost")).empty());
  EXPECT_TRUE(router_.ResolveTargets(playlink::TargetSpec::List({})).empty());
}

TEST_F(CommandRouterTest, DispatchDeliversCommandUnchanged) {
  auto a = Add("vp-a", playlink::Role::kPlayer);
  auto b = Add("vp-b", playlink::Role::kPlayer);

  playlink::Command command;
  command.action = playlink::CommandAction::kPlay;
  command.media_ref = "clip.mp4";
  command.format = "sphere360";
  command.target = playlink::TargetSpec::Single("vp-b");
  command.timestamp_ms = 1234;

  const auto report = router_.Dispatch(command);
  EXPECT_EQ(report.targeted, 1);
  EXPECT_EQ(report.delivered, 1);
  EXPECT_TRUE(Received(a).empty());

  const auto messages = Received(b);
  ASSERT_EQ(messages.size(), 1u);
  playlink::Command received;
  ASSERT_TRUE(playlink::ParseCommand(messages[0], &received));
  EXPECT_EQ(received.action, playlink::CommandAction::kPlay);
  EXPECT_EQ(received.media_ref, "clip.mp4");
  EXPECT_EQ(received.format, "sphere360");
  EXPECT_EQ(received.timestamp_ms, 1234);
}

TEST_F(CommandRouterTest, FailedTargetDoesNotAbortOthers) {
  auto a = Add("vp-a", playlink::Role::kPlayer);
  auto b = Add("vp-b", playlink::Role::kPlayer);
  auto c = Add("vp-c", playlink::Role::kPlayer);
  b.remote->Close();

  playlink::Command command;
  command.action = playlink::CommandAction::kStop;
  const auto report = router_.Dispatch(command);
  EXPECT_EQ(report.targeted, 3);
  EXPECT_EQ(report.delivered, 2);
  ASSERT_EQ(report.results.size(), 3u);
  EXPECT_TRUE(report.results[0].delivered);
  EXPECT_FALSE(report.results[1].delivered);
  EXPECT_FALSE(report.results[1].error.empty());
  EXPECT_TRUE(report.results[2].delivered);
  EXPECT_EQ(Received(a).size(), 1u);
  EXPECT_EQ(Received(c).size(), 1u);
}

TEST_F(CommandRouterTest, ZeroTargetsIsReportedNotAnError) {
  playlink::Command command;
  command.action = playlink::CommandAction::kPause;
  const auto report = router_.Dispatch(command);
  EXPECT_EQ(report.targeted, 0);
  EXPECT_EQ(report.delivered, 0);
}

TEST_F(CommandRouterTest, BroadcastReachesControllersOnly) {
  auto controller = Add("ctl", playlink::Role::kController);
  auto player = Add("vp-a", playlink::Role::kPlayer);

  const auto report = router_.BroadcastToControllers(playlink::MakeDeviceNotice(
      playlink::MessageType::kDeviceConnected, {"vp-a", "Headset"}));
  EXPECT_EQ(report.delivered, 1);
  const auto messages = Received(controller);
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].type, playlink::MessageType::kDeviceConnected);
  EXPECT_TRUE(Received(player).empty());
}

TEST_F(CommandRouterTest, SendToUnknownDeviceFails) {
  std::string error;
  EXPECT_FALSE(router_.SendTo("ghost", playlink::MakeHeartbeat(playlink::MessageType::kPing, 1),
                              &error));
  EXPECT_NE(error.find("ghost"), std::string::npos);
}
