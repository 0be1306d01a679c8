// Tests for heartbeat rounds and eviction of silent sessions.
#include "playlink/heartbeat.h"

#include <gtest/gtest.h>

#include <thread>

namespace {

playlink::LogCallback Quiet() {
  return [](const std::string&) {};
}

bool ReceivedPing(const std::shared_ptr<playlink::Transport>& remote) {
  std::string frame;
  while (remote->Receive(&frame, std::chrono::milliseconds(10)) ==
         playlink::ReceiveStatus::kFrame) {
    playlink::Message message;
    if (playlink::DecodeMessage(frame, &message) &&
        message.type == playlink::MessageType::kPing) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(HeartbeatTest, PingsLiveSessionsAndEvictsSilentOnes) {
  playlink::HeartbeatMonitor monitor(std::chrono::milliseconds(1000), Quiet());
  auto pair = playlink::MakeMemoryTransportPair();
  auto session = std::make_shared<playlink::Session>("s1", pair.second, Quiet());
  session->SetIdentity("vp-1", playlink::Role::kPlayer);
  monitor.Track(session);

  std::vector<playlink::HeartbeatEviction> evictions;
  monitor.evictions().Subscribe(
      [&](const playlink::HeartbeatEviction& e) { evictions.push_back(e); });

  EXPECT_TRUE(monitor.Tick().empty());
  EXPECT_TRUE(ReceivedPing(pair.first));
  EXPECT_FALSE(session->is_alive());

  // No pong before the next round: evicted.
  const auto evicted = monitor.Tick();
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0], "s1");
  EXPECT_TRUE(session->IsClosed());
  ASSERT_EQ(evictions.size(), 1u);
  EXPECT_EQ(evictions[0].device_id, "vp-1");
  EXPECT_EQ(monitor.tracked_count(), 0u);
}

TEST(HeartbeatTest, PongKeepsSessionAlive) {
  playlink::HeartbeatMonitor monitor(std::chrono::milliseconds(1000), Quiet());
  auto pair = playlink::MakeMemoryTransportPair();
  auto session = std::make_shared<playlink::Session>("s1", pair.second, Quiet());
  monitor.Track(session);

  for (int round = 0; round < 5; ++round) {
    EXPECT_TRUE(monitor.Tick().empty());
    EXPECT_TRUE(monitor.RecordPong("s1"));
  }
  EXPECT_FALSE(session->IsClosed());
  EXPECT_FALSE(monitor.RecordPong("unknown"));
}

TEST(HeartbeatTest, ClosedSessionIsUntracked) {
  playlink::HeartbeatMonitor monitor(std::chrono::milliseconds(1000), Quiet());
  auto pair = playlink::MakeMemoryTransportPair();
  auto session = std::make_shared<playlink::Session>("s1", pair.second, Quiet());
  monitor.Track(session);
  EXPECT_EQ(monitor.tracked_count(), 1u);
  session->Close();
  EXPECT_EQ(monitor.tracked_count(), 0u);
}

TEST(HeartbeatTest, BackgroundLoopEvictsWithinTwoIntervals) {
  playlink::HeartbeatMonitor monitor(std::chrono::milliseconds(50), Quiet());
  auto pair = playlink::MakeMemoryTransportPair();
  auto session = std::make_shared<playlink::Session>("s1", pair.second, Quiet());
  monitor.Track(session);
  ASSERT_TRUE(monitor.Start());
  EXPECT_TRUE(monitor.running());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!session->IsClosed() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(session->IsClosed());
  monitor.Stop();
  EXPECT_FALSE(monitor.running());
}

TEST(HeartbeatTest, StopIsPrompt) {
  playlink::HeartbeatMonitor monitor(std::chrono::seconds(30), Quiet());
  ASSERT_TRUE(monitor.Start());
  const auto begin = std::chrono::steady_clock::now();
  monitor.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
}
