// Tests for device registration, supersession and removal.
#include "playlink/device_registry.h"

#include <gtest/gtest.h>

namespace {

std::shared_ptr<playlink::Session> MakeSession(const std::string& id) {
  auto pair = playlink::MakeMemoryTransportPair();
  return std::make_shared<playlink::Session>(id, pair.second,
                                             [](const std::string&) {});
}

}  // namespace

TEST(DeviceRegistryTest, RegisterAndUpdateEvents) {
  playlink::DeviceRegistry registry([](const std::string&) {});
  std::vector<playlink::DeviceEvent> events;
  registry.events().Subscribe(
      [&](const playlink::DeviceEvent& event) { events.push_back(event); });

  auto session = MakeSession("s1");
  auto result = registry.Register("vp-1", "Headset", playlink::Role::kPlayer, session);
  ASSERT_TRUE(result.accepted);
  EXPECT_FALSE(result.replaced_existing);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, playlink::DeviceEventType::kRegistered);
  EXPECT_EQ(events[0].device.device_name, "Headset");
  EXPECT_EQ(events[0].device.playback.state, playlink::PlaybackState::kIdle);

  playlink::PlaybackSnapshot snapshot;
  snapshot.state = playlink::PlaybackState::kPlaying;
  snapshot.current_media = "clip.mp4";
  ASSERT_TRUE(registry.UpdateStatus("vp-1", snapshot));
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[1].type, playlink::DeviceEventType::kStatusChanged);

  auto record = registry.Find("vp-1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->playback.state, playlink::PlaybackState::kPlaying);
  EXPECT_EQ(record->playback.current_media, "clip.mp4");
  EXPECT_GT(record->playback.last_update_ms, 0);

  EXPECT_FALSE(registry.UpdateStatus("ghost", snapshot));
}

TEST(DeviceRegistryTest, NameDefaultsToDeviceId) {
  playlink::DeviceRegistry registry;
  ASSERT_TRUE(
      registry.Register("vp-1", "", playlink::Role::kPlayer, MakeSession("s1")).accepted);
  EXPECT_EQ(registry.Find("vp-1")->device_name, "vp-1");
}

TEST(DeviceRegistryTest, RejectsEmptyIdAndNullSession) {
  playlink::DeviceRegistry registry;
  EXPECT_FALSE(
      registry.Register("", "x", playlink::Role::kPlayer, MakeSession("s1")).accepted);
  EXPECT_FALSE(registry.Register("vp-1", "x", playlink::Role::kPlayer, nullptr).accepted);
  EXPECT_EQ(registry.size(), 0u);
}

TEST(DeviceRegistryTest, ReRegistrationClosesPreviousSession) {
  playlink::DeviceRegistry registry([](const std::string&) {});
  auto first = MakeSession("s1");
  auto second = MakeSession("s2");
  ASSERT_TRUE(registry.Register("vp-1", "Headset", playlink::Role::kPlayer, first).accepted);

  playlink::PlaybackSnapshot snapshot;
  snapshot.state = playlink::PlaybackState::kPlaying;
  registry.UpdateStatus("vp-1", snapshot);

  auto result = registry.Register("vp-1", "", playlink::Role::kPlayer, second);
  ASSERT_TRUE(result.accepted);
  EXPECT_TRUE(result.replaced_existing);
  EXPECT_TRUE(first->IsClosed());
  EXPECT_FALSE(second->IsClosed());
  EXPECT_EQ(registry.size(), 1u);

  auto record = registry.Find("vp-1");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->session, second);
  EXPECT_EQ(record->device_name, "Headset");
  EXPECT_EQ(record->playback.state, playlink::PlaybackState::kIdle);

  // The stale session's disconnect must not remove the new registration.
  EXPECT_FALSE(registry.UnregisterSession("vp-1", "s1"));
  EXPECT_TRUE(registry.Find("vp-1").has_value());
  EXPECT_TRUE(registry.UnregisterSession("vp-1", "s2"));
  EXPECT_FALSE(registry.Find("vp-1").has_value());
}

TEST(DeviceRegistryTest, ListsAreSortedAndFilteredByRole) {
  playlink::DeviceRegistry registry;
  registry.Register("vp-2", "", playlink::Role::kPlayer, MakeSession("s1"));
  registry.Register("ctl", "", playlink::Role::kController, MakeSession("s2"));
  registry.Register("vp-1", "", playlink::Role::kPlayer, MakeSession("s3"));

  auto all = registry.List();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].device_id, "ctl");
  EXPECT_EQ(all[1].device_id, "vp-1");
  EXPECT_EQ(all[2].device_id, "vp-2");

  auto players = registry.List(playlink::Role::kPlayer);
  ASSERT_EQ(players.size(), 2u);
  EXPECT_EQ(players[0].device_id, "vp-1");
  EXPECT_EQ(registry.Count(playlink::Role::kController), 1u);
  EXPECT_EQ(registry.SessionsForRole(playlink::Role::kController).size(), 1u);
}

TEST(DeviceRegistryTest, UnregisterPublishesRemoval) {
  playlink::DeviceRegistry registry;
  std::vector<playlink::DeviceEvent> events;
  registry.events().Subscribe(
      [&](const playlink::DeviceEvent& event) { events.push_back(event); });
  registry.Register("vp-1", "", playlink::Role::kPlayer, MakeSession("s1"));
  ASSERT_TRUE(registry.Unregister("vp-1"));
  EXPECT_FALSE(registry.Unregister("vp-1"));
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events.back().type, playlink::DeviceEventType::kRemoved);
  EXPECT_EQ(events.back().device.device_id, "vp-1");
}

TEST(DeviceRegistryTest, ThrowingObserverDoesNotBlockOthers) {
  std::vector<std::string> logs;
  playlink::DeviceRegistry registry([&](const std::string& line) { logs.push_back(line); });
  int calls = 0;
  registry.events().Subscribe(
      [](const playlink::DeviceEvent&) { throw std::runtime_error("boom"); });
  registry.events().Subscribe([&](const playlink::DeviceEvent&) { ++calls; });

  ASSERT_TRUE(
      registry.Register("vp-1", "", playlink::Role::kPlayer, MakeSession("s1")).accepted);
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(logs.empty());
}

TEST(DeviceRegistryTest, LocalMediaIsStored) {
  playlink::DeviceRegistry registry;
  registry.Register("vp-1", "", playlink::Role::kPlayer, MakeSession("s1"));
  playlink::MediaItem item;
  item.filename = "a.mp4";
  item.size = 10;
  ASSERT_TRUE(registry.UpdateLocalMedia("vp-1", {item}));
  ASSERT_EQ(registry.Find("vp-1")->local_media.size(), 1u);
  EXPECT_FALSE(registry.UpdateLocalMedia("ghost", {}));
}
