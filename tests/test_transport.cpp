// Tests for framed transports and session lifecycle.
#include "playlink/transport.h"

#include "net_util.h"

#include <gtest/gtest.h>

#include <thread>

namespace {

constexpr std::chrono::milliseconds kWait{2000};

// Loopback TcpTransport pair over an ephemeral port. `max_frame_bytes`
// applies to the accepting end.
std::pair<std::shared_ptr<playlink::TcpTransport>, std::shared_ptr<playlink::TcpTransport>>
ConnectLoopback(size_t max_frame_bytes = playlink::kMaxFrameBytes) {
  playlink::internal::TcpListener listener;
  EXPECT_TRUE(listener.Open("127.0.0.1", 0)) << listener.last_error();
  std::shared_ptr<playlink::TcpTransport> client;
  std::thread connector([&]() {
    std::string error;
    client = playlink::TcpTransport::Connect("127.0.0.1", listener.port(), kWait, &error);
    EXPECT_TRUE(client) << error;
  });
  std::string peer;
  const int fd = listener.Accept(kWait, &peer);
  connector.join();
  EXPECT_GE(fd, 0);
  auto server = std::make_shared<playlink::TcpTransport>(fd, peer, max_frame_bytes);
  return {client, server};
}

}  // namespace

TEST(MemoryTransportTest, DeliversInOrderThenReportsClosed) {
  auto pair = playlink::MakeMemoryTransportPair();
  ASSERT_TRUE(pair.first->Send("one"));
  ASSERT_TRUE(pair.first->Send("two"));
  pair.first->Close();
  EXPECT_FALSE(pair.second->IsOpen());

  std::string frame;
  ASSERT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kFrame);
  EXPECT_EQ(frame, "one");
  ASSERT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kFrame);
  EXPECT_EQ(frame, "two");
  EXPECT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kClosed);
  EXPECT_FALSE(pair.second->Send("three"));
}

TEST(MemoryTransportTest, ReceiveTimesOut) {
  auto pair = playlink::MakeMemoryTransportPair();
  std::string frame;
  EXPECT_EQ(pair.second->Receive(&frame, std::chrono::milliseconds(10)),
            playlink::ReceiveStatus::kTimeout);
}

TEST(TcpTransportTest, FramesSurviveLoopback) {
  auto pair = ConnectLoopback();
  ASSERT_TRUE(pair.first && pair.second);

  const std::string big(200 * 1024, 'x');
  ASSERT_TRUE(pair.first->Send(R"({"type":"ping"})"));
  ASSERT_TRUE(pair.first->Send(big));
  ASSERT_TRUE(pair.first->Send(""));

  std::string frame;
  ASSERT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kFrame);
  EXPECT_EQ(frame, R"({"type":"ping"})");
  ASSERT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kFrame);
  EXPECT_EQ(frame, big);
  ASSERT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kFrame);
  EXPECT_TRUE(frame.empty());
}

TEST(TcpTransportTest, PeerCloseIsReported) {
  auto pair = ConnectLoopback();
  ASSERT_TRUE(pair.first && pair.second);
  pair.first->Close();
  std::string frame;
  EXPECT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kClosed);
}

TEST(TcpTransportTest, OversizedFrameClosesConnection) {
  auto pair = ConnectLoopback(1024);
  ASSERT_TRUE(pair.first && pair.second);
  ASSERT_TRUE(pair.first->Send(std::string(4096, 'y')));
  std::string frame;
  EXPECT_EQ(pair.second->Receive(&frame, kWait), playlink::ReceiveStatus::kClosed);
  EXPECT_FALSE(pair.second->close_reason().empty());
}

TEST(TcpTransportTest, ConnectFailureReportsError) {
  playlink::internal::TcpListener listener;
  ASSERT_TRUE(listener.Open("127.0.0.1", 0));
  const uint16_t port = listener.port();
  listener.Close();

  std::string error;
  auto transport = playlink::TcpTransport::Connect("127.0.0.1", port,
                                                   std::chrono::milliseconds(500), &error);
  EXPECT_FALSE(transport);
  EXPECT_FALSE(error.empty());
}

TEST(SessionTest, CloseListenersRunExactlyOnce) {
  auto pair = playlink::MakeMemoryTransportPair();
  playlink::Session session("s1", pair.second, [](const std::string&) {});
  int calls = 0;
  std::string seen;
  session.AddCloseListener([&](const std::string& id) {
    ++calls;
    seen = id;
  });
  session.Close();
  session.Close();
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(seen, "s1");
  EXPECT_TRUE(session.IsClosed());
  EXPECT_FALSE(pair.first->IsOpen());

  // Listeners added after close run immediately.
  session.AddCloseListener([&](const std::string&) { ++calls; });
  EXPECT_EQ(calls, 2);
  EXPECT_FALSE(session.Send(playlink::MakeHeartbeat(playlink::MessageType::kPing, 1)));
}

TEST(SessionTest, IdentityAndLiveness) {
  auto pair = playlink::MakeMemoryTransportPair("remote", "local");
  playlink::Session session("s1", pair.second);
  EXPECT_FALSE(session.registered());
  session.SetIdentity("vp-1", playlink::Role::kPlayer);
  EXPECT_TRUE(session.registered());
  EXPECT_EQ(session.device_id(), "vp-1");
  EXPECT_EQ(session.role(), playlink::Role::kPlayer);

  session.set_alive(false);
  session.MarkPong();
  EXPECT_TRUE(session.is_alive());
}
