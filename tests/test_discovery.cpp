// Tests for hub announcements and discovery over loopback UDP.
#include "playlink/discovery.h"
#include "playlink/hub.h"
#include "playlink/reconnecting_client.h"

#include "net_util.h"

#include <gtest/gtest.h>

#include <thread>

namespace {

constexpr std::chrono::milliseconds kWait{3000};

playlink::LogCallback Quiet() {
  return [](const std::string&) {};
}

// Reserve a loopback UDP port number that nothing is listening on.
uint16_t FreeUdpPort() {
  playlink::internal::UdpSocket socket;
  if (!socket.Open("127.0.0.1", 0, false)) {
    return 0;
  }
  return socket.port();
}

playlink::AnnouncerConfig LoopbackAnnouncer(uint16_t port) {
  playlink::AnnouncerConfig config;
  config.bind_address = "127.0.0.1";
  config.announce_address = "127.0.0.1";
  config.announce_port = port;
  config.interval = std::chrono::milliseconds(20);
  config.log_callback = Quiet();
  return config;
}

playlink::DiscoveryConfig LoopbackDiscovery(uint16_t port) {
  playlink::DiscoveryConfig config;
  config.bind_address = "127.0.0.1";
  config.announce_port = port;
  config.timeout = kWait;
  config.log_callback = Quiet();
  return config;
}

}  // namespace

TEST(AnnouncementTest, CarriesPortsAndOptionalHost) {
  playlink::HubAnnouncement announcement;
  announcement.port = 9000;
  announcement.http_port = 0;
  const std::string payload = playlink::EncodeAnnouncement(announcement);
  EXPECT_EQ(payload.find("\"host\""), std::string::npos);

  playlink::HubAnnouncement parsed;
  ASSERT_TRUE(playlink::ParseAnnouncement(payload, &parsed));
  EXPECT_TRUE(parsed.host.empty());
  EXPECT_EQ(parsed.port, 9000);
  EXPECT_EQ(parsed.http_port, 0);
  EXPECT_EQ(parsed.server_version, playlink::kServerVersion);

  announcement.host = "hub.local";
  ASSERT_TRUE(playlink::ParseAnnouncement(playlink::EncodeAnnouncement(announcement), &parsed));
  EXPECT_EQ(parsed.host, "hub.local");
}

TEST(AnnouncementTest, RejectsForeignDatagrams) {
  std::string error;
  playlink::HubAnnouncement parsed;
  EXPECT_FALSE(playlink::ParseAnnouncement("not json", &parsed, &error));
  EXPECT_FALSE(playlink::ParseAnnouncement(R"({"type":"ping","port":1})", &parsed, &error));
  EXPECT_EQ(error, "not a hub announcement");
  EXPECT_FALSE(playlink::ParseAnnouncement(
      R"({"type":"hubAnnounce","serverVersion":"1","port":0,"httpPort":1})", &parsed, &error));
  EXPECT_EQ(error, "announcement missing valid port");
  EXPECT_FALSE(playlink::ParseAnnouncement(
      R"({"type":"hubAnnounce","serverVersion":"1","port":70000,"httpPort":1})", &parsed,
      &error));
  EXPECT_FALSE(playlink::ParseAnnouncement(
      R"({"type":"hubAnnounce","port":8080,"httpPort":8081})", &parsed, &error));
  EXPECT_EQ(error, "announcement missing serverVersion");
}

TEST(HubAnnouncerTest, BroadcastsUntilStopped) {
  playlink::internal::UdpSocket listener;
  ASSERT_TRUE(listener.Open("127.0.0.1", 0, false)) << listener.last_error();

  playlink::HubAnnouncement announcement;
  announcement.port = 9100;
  announcement.http_port = 9101;
  playlink::HubAnnouncer announcer(LoopbackAnnouncer(listener.port()), announcement);
  std::string error;
  ASSERT_TRUE(announcer.Start(&error)) << error;

  for (int i = 0; i < 2; ++i) {
    std::string payload;
    sockaddr_in from{};
    ASSERT_EQ(listener.ReceiveFrom(&payload, &from, kWait), 1);
    playlink::HubAnnouncement parsed;
    ASSERT_TRUE(playlink::ParseAnnouncement(payload, &parsed, &error)) << error;
    EXPECT_EQ(parsed.port, 9100);
    EXPECT_EQ(parsed.http_port, 9101);
  }
  EXPECT_GE(announcer.announcements_sent(), 2u);

  const auto begin = std::chrono::steady_clock::now();
  announcer.Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(1));
  EXPECT_FALSE(announcer.AnnounceOnce(&error));
  EXPECT_EQ(error, "announcer not running");
}

TEST(HubAnnouncerTest, RejectsInvalidConfig) {
  playlink::AnnouncerConfig config = LoopbackAnnouncer(9000);
  config.announce_address = "broadcast";
  playlink::HubAnnouncer announcer(config, playlink::HubAnnouncement());
  std::string error;
  EXPECT_FALSE(announcer.Start(&error));
  EXPECT_EQ(error, "announce_address must be a valid IPv4 address");
  EXPECT_FALSE(announcer.running());
}

TEST(DiscoverHubTest, FillsHostFromSender) {
  const uint16_t port = FreeUdpPort();
  ASSERT_NE(port, 0);
  playlink::HubAnnouncement announcement;
  announcement.port = 9200;
  playlink::HubAnnouncer announcer(LoopbackAnnouncer(port), announcement);

  playlink::HubAnnouncement found;
  std::string error;
  bool ok = false;
  std::thread listener([&]() {
    ok = playlink::DiscoverHub(LoopbackDiscovery(port), &found, &error);
  });
  // Give the listener time to bind before the first datagram goes out.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ASSERT_TRUE(announcer.Start());
  listener.join();
  announcer.Stop();

  ASSERT_TRUE(ok) << error;
  EXPECT_EQ(found.host, "127.0.0.1");
  EXPECT_EQ(found.port, 9200);
}

TEST(DiscoverHubTest, SkipsMalformedDatagramsAndTimesOut) {
  const uint16_t port = FreeUdpPort();
  ASSERT_NE(port, 0);
  playlink::DiscoveryConfig config = LoopbackDiscovery(port);
  config.timeout = std::chrono::milliseconds(300);

  std::thread noise([port]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    playlink::internal::UdpSocket sender;
    ASSERT_TRUE(sender.Open("127.0.0.1", 0, false));
    EXPECT_TRUE(sender.SendTo(R"({"type":"status"})",
                              playlink::internal::MakeSockaddr("127.0.0.1", port), nullptr));
  });
  playlink::HubAnnouncement found;
  std::string error;
  const auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(playlink::DiscoverHub(config, &found, &error));
  noise.join();
  EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(300));
  EXPECT_NE(error.find("no hub announcement"), std::string::npos);
}

TEST(DiscoverHubTest, ClientFindsAnnouncingHub) {
  const uint16_t announce_port = FreeUdpPort();
  ASSERT_NE(announce_port, 0);

  playlink::HubConfig hub_config;
  hub_config.bind_address = "127.0.0.1";
  hub_config.port = 0;
  hub_config.http_port = 0;
  hub_config.announce_address = "127.0.0.1";
  hub_config.announce_port = announce_port;
  hub_config.announce_interval = std::chrono::milliseconds(20);
  hub_config.log_callback = Quiet();
  playlink::Hub hub(hub_config);
  ASSERT_TRUE(hub.Start()) << hub.GetLastError();

  playlink::HubAnnouncement found;
  std::string error;
  ASSERT_TRUE(playlink::DiscoverHub(LoopbackDiscovery(announce_port), &found, &error))
      << error;
  EXPECT_EQ(found.host, "127.0.0.1");
  EXPECT_EQ(found.port, hub.port());
  EXPECT_EQ(found.http_port, hub.http_port());

  playlink::ClientConfig client_config;
  client_config.host.clear();
  client_config.discover_hub = true;
  client_config.announce_port = announce_port;
  client_config.discovery_timeout = kWait;
  client_config.log_callback = Quiet();
  playlink::RegisterMessage identity;
  identity.device_id = "vp-1";
  identity.role = playlink::Role::kPlayer;
  playlink::ReconnectingClient client(client_config, identity);
  client.Connect();
  EXPECT_TRUE(client.WaitForState(playlink::ClientState::kConnected, kWait));
  client.Disconnect();
  hub.Stop();
}
