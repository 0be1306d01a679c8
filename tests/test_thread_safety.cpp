// Thread safety smoke tests for concurrent registry, router and hub use.
#include "playlink/command_router.h"
#include "playlink/device_registry.h"
#include "playlink/hub.h"
#include "playlink/test_hooks.h"

#include <gtest/gtest.h>
#include <thread>

namespace {

playlink::LogCallback Quiet() {
  return [](const std::string&) {};
}

}  // namespace

TEST(ThreadSafetyTest, ConcurrentRegistryAndRouterUseIsSafe) {
  playlink::DeviceRegistry registry(Quiet());
  playlink::CommandRouter router(registry, Quiet());

  std::vector<std::shared_ptr<playlink::Transport>> remotes;
  auto add = [&](const std::string& id) {
    auto pair = playlink::MakeMemoryTransportPair(id, "hub");
    auto session = std::make_shared<playlink::Session>("s-" + id, pair.second, Quiet());
    session->SetIdentity(id, playlink::Role::kPlayer);
    registry.Register(id, id, playlink::Role::kPlayer, session);
    return pair.first;
  };

  std::thread t1([&]() {
    for (int i = 0; i < 500; ++i) {
      auto remote = add("vp-" + std::to_string(i % 10));
      remote->Close();
    }
  });
  std::thread t2([&]() {
    playlink::PlaybackSnapshot snapshot;
    for (int i = 0; i < 500; ++i) {
      snapshot.position_seconds = i;
      registry.UpdateStatus("vp-" + std::to_string(i % 10), snapshot);
    }
  });
  std::thread t3([&]() {
    playlink::Command command;
    command.action = playlink::CommandAction::kPause;
    for (int i = 0; i < 500; ++i) {
      router.Dispatch(command);
      registry.List(playlink::Role::kPlayer);
    }
  });

  t1.join();
  t2.join();
  t3.join();

  SUCCEED();
}

TEST(ThreadSafetyTest, ConcurrentHubConnectionsAreSafe) {
  playlink::HubConfig config;
  config.enable_tcp = false;
  config.enable_http = false;
  config.log_callback = Quiet();
  playlink::Hub hub(config);
  ASSERT_TRUE(hub.Start());

  auto controller = playlink::test::ConnectPeer(hub, "ctl");
  ASSERT_TRUE(controller->Register("ctl", playlink::Role::kController));

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&hub, t]() {
      for (int i = 0; i < 20; ++i) {
        const std::string id = "vp-" + std::to_string(t) + "-" + std::to_string(i % 3);
        auto peer = playlink::test::ConnectPeer(hub, id);
        peer->Register(id, playlink::Role::kPlayer);
        playlink::StatusMessage status;
        status.playback.state = playlink::PlaybackState::kPlaying;
        peer->Send(playlink::ToMessage(status));
        peer->Close();
      }
    });
  }
  std::thread ticker([&hub]() {
    for (int i = 0; i < 20; ++i) {
      hub.GetHealth();
      hub.GetMetrics();
    }
  });

  for (auto& thread : threads) {
    thread.join();
  }
  ticker.join();
  controller->Drain();
  hub.Stop();

  EXPECT_EQ(hub.GetHealth().device_count, 0u);
}
