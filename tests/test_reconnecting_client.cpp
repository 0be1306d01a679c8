// Tests for the reconnecting participant client.
#include "playlink/reconnecting_client.h"
#include "playlink/device_registry.h"
#include "playlink/test_hooks.h"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace {

constexpr std::chrono::milliseconds kWait{3000};

playlink::LogCallback Quiet() {
  return [](const std::string&) {};
}

playlink::HubConfig InMemoryHubConfig() {
  playlink::HubConfig config;
  config.enable_tcp = false;
  config.enable_http = false;
  config.log_callback = Quiet();
  return config;
}

playlink::ClientConfig FastClientConfig() {
  playlink::ClientConfig config;
  config.backoff_unit = std::chrono::milliseconds(10);
  config.backoff_cap = std::chrono::milliseconds(40);
  config.ack_timeout = std::chrono::milliseconds(1000);
  config.receive_poll = std::chrono::milliseconds(20);
  config.log_callback = Quiet();
  return config;
}

playlink::RegisterMessage PlayerIdentity(const std::string& id) {
  playlink::RegisterMessage identity;
  identity.device_id = id;
  identity.device_name = "Test Player";
  identity.role = playlink::Role::kPlayer;
  return identity;
}

// Connects clients to an in-process hub and remembers the hub-side ends.
class HubConnector {
 public:
  explicit HubConnector(playlink::Hub& hub) : hub_(hub) {}

  playlink::Connector connector() {
    return [this](std::string*) {
      auto pair = playlink::MakeMemoryTransportPair("client", "hub");
      {
        std::lock_guard<std::mutex> lock(mutex_);
        hub_ends_.push_back(pair.second);
      }
      ++connects_;
      hub_.AddConnection(pair.second);
      return pair.first;
    };
  }

  void DropAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& end : hub_ends_) {
      end->Close();
    }
  }

  int connects() const { return connects_.load(); }

 private:
  playlink::Hub& hub_;
  std::mutex mutex_;
  std::vector<std::shared_ptr<playlink::Transport>> hub_ends_;
  std::atomic<int> connects_{0};
};

}  // namespace

TEST(ReconnectDelayTest, DoublesUpToCap) {
  const std::chrono::milliseconds unit(1000);
  const std::chrono::milliseconds cap(30000);
  std::vector<int64_t> delays;
  for (int attempt = 1; attempt <= 7; ++attempt) {
    delays.push_back(playlink::ReconnectDelay(attempt, unit, cap).count());
  }
  EXPECT_EQ(delays, (std::vector<int64_t>{1000, 2000, 4000, 8000, 16000, 30000, 30000}));
  EXPECT_EQ(playlink::ReconnectDelay(100, unit, cap), cap);
}

TEST(ReconnectingClientTest, ConnectsAfterRegistration) {
  playlink::Hub hub(InMemoryHubConfig());
  ASSERT_TRUE(hub.Start());
  HubConnector connector(hub);

  playlink::ReconnectingClient client(FastClientConfig(), PlayerIdentity("vp-1"),
                                      connector.connector());
  std::atomic<int> welcomes{0};
  client.messages().Subscribe([&](const playlink::Message& message) {
    if (message.type == playlink::MessageType::kWelcome) {
      ++welcomes;
    }
  });

  std::string error;
  EXPECT_FALSE(client.Send(playlink::MakeHeartbeat(playlink::MessageType::kPing, 1), &error));
  EXPECT_EQ(error, "not connected");

  client.Connect();
  ASSERT_TRUE(client.WaitForState(playlink::ClientState::kConnected, kWait));
  EXPECT_EQ(welcomes.load(), 1);
  EXPECT_TRUE(playlink::test::GetRegistry(hub).Find("vp-1").has_value());

  playlink::StatusMessage status;
  status.playback.state = playlink::PlaybackState::kPlaying;
  EXPECT_TRUE(client.Send(playlink::ToMessage(status)));

  client.Disconnect();
  EXPECT_EQ(client.state(), playlink::ClientState::kDisconnected);
  hub.Stop();
}

TEST(ReconnectingClientTest, ReconnectsAfterDrop) {
  playlink::Hub hub(InMemoryHubConfig());
  ASSERT_TRUE(hub.Start());
  HubConnector connector(hub);

  playlink::ReconnectingClient client(FastClientConfig(), PlayerIdentity("vp-1"),
                                      connector.connector());
  std::mutex mutex;
  std::vector<playlink::ClientStateChange> changes;
  client.state_changes().Subscribe([&](const playlink::ClientStateChange& change) {
    std::lock_guard<std::mutex> lock(mutex);
    changes.push_back(change);
  });

  client.Connect();
  ASSERT_TRUE(client.WaitForState(playlink::ClientState::kConnected, kWait));
  connector.DropAll();

  const auto deadline = std::chrono::steady_clock::now() + kWait;
  while (connector.connects() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_TRUE(client.WaitForState(playlink::ClientState::kConnected, kWait));
  EXPECT_EQ(connector.connects(), 2);
  EXPECT_EQ(client.attempt(), 0);

  {
    std::lock_guard<std::mutex> lock(mutex);
    bool saw_retry = false;
    for (const auto& change : changes) {
      if (change.state == playlink::ClientState::kReconnecting) {
        saw_retry = true;
        EXPECT_EQ(change.attempt, 1);
      }
    }
    EXPECT_TRUE(saw_retry);
  }
  client.Disconnect();
  hub.Stop();
}

TEST(ReconnectingClientTest, GivesUpAfterMaxAttempts) {
  std::atomic<int> calls{0};
  auto failing = [&](std::string* error) -> std::shared_ptr<playlink::Transport> {
    ++calls;
    *error = "refused";
    return nullptr;
  };
  playlink::ClientConfig config = FastClientConfig();
  config.max_reconnect_attempts = 3;
  playlink::ReconnectingClient client(config, PlayerIdentity("vp-1"), failing);

  std::mutex mutex;
  std::vector<playlink::ClientStateChange> changes;
  client.state_changes().Subscribe([&](const playlink::ClientStateChange& change) {
    std::lock_guard<std::mutex> lock(mutex);
    changes.push_back(change);
  });

  client.Connect();
  const auto deadline = std::chrono::steady_clock::now() + kWait;
  bool gave_up = false;
  while (!gave_up && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    std::lock_guard<std::mutex> lock(mutex);
    gave_up = !changes.empty() && changes.back().gave_up;
  }
  ASSERT_TRUE(gave_up);
  EXPECT_EQ(calls.load(), 4);
  EXPECT_EQ(client.state(), playlink::ClientState::kDisconnected);

  std::lock_guard<std::mutex> lock(mutex);
  std::vector<int> attempts;
  for (const auto& change : changes) {
    if (change.state == playlink::ClientState::kReconnecting) {
      attempts.push_back(change.attempt);
    }
  }
  EXPECT_EQ(attempts, (std::vector<int>{1, 2, 3}));
}

TEST(ReconnectingClientTest, DisconnectCancelsPendingRetry) {
  std::atomic<int> calls{0};
  auto failing = [&](std::string* error) -> std::shared_ptr<playlink::Transport> {
    ++calls;
    *error = "refused";
    return nullptr;
  };
  playlink::ClientConfig config = FastClientConfig();
  config.backoff_unit = std::chrono::milliseconds(10000);
  config.backoff_cap = std::chrono::milliseconds(10000);
  playlink::ReconnectingClient client(config, PlayerIdentity("vp-1"), failing);

  client.Connect();
  ASSERT_TRUE(client.WaitForState(playlink::ClientState::kReconnecting, kWait));
  const auto begin = std::chrono::steady_clock::now();
  client.Disconnect();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
  EXPECT_EQ(client.state(), playlink::ClientState::kDisconnected);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(calls.load(), 1);
}

TEST(ReconnectingClientTest, ConnectDuringRetryKeepsBackoff) {
  using Clock = std::chrono::steady_clock;
  std::mutex mutex;
  std::condition_variable cv;
  int calls = 0;
  bool in_second_attempt = false;
  Clock::time_point second_done;
  Clock::time_point third_start;
  auto failing = [&](std::string* error) -> std::shared_ptr<playlink::Transport> {
    int call = 0;
    {
      std::lock_guard<std::mutex> lock(mutex);
      call = ++calls;
      if (call == 2) {
        in_second_attempt = true;
      } else if (call == 3) {
        third_start = Clock::now();
      }
    }
    cv.notify_all();
    if (call == 2) {
      std::this_thread::sleep_for(std::chrono::milliseconds(150));
      std::lock_guard<std::mutex> lock(mutex);
      second_done = Clock::now();
    }
    *error = "refused";
    return nullptr;
  };
  playlink::ClientConfig config = FastClientConfig();
  config.backoff_unit = std::chrono::milliseconds(200);
  config.backoff_cap = std::chrono::milliseconds(5000);
  config.max_reconnect_attempts = 2;
  playlink::ReconnectingClient client(config, PlayerIdentity("vp-1"), failing);

  std::vector<playlink::ClientStateChange> changes;
  client.state_changes().Subscribe([&](const playlink::ClientStateChange& change) {
    std::lock_guard<std::mutex> lock(mutex);
    changes.push_back(change);
  });

  client.Connect();
  {
    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, kWait, [&]() { return in_second_attempt; }));
  }
  EXPECT_EQ(client.state(), playlink::ClientState::kConnecting);
  client.Connect();

  {
    std::unique_lock<std::mutex> lock(mutex);
    ASSERT_TRUE(cv.wait_for(lock, kWait, [&]() { return calls >= 3; }));
  }
  client.Disconnect();

  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(calls, 3);
  // Attempt 2 backs off 2 units even though Connect() was called during it.
  EXPECT_GE(third_start - second_done, std::chrono::milliseconds(400));

  std::vector<playlink::ClientState> states;
  for (const auto& change : changes) {
    states.push_back(change.state);
  }
  ASSERT_GE(states.size(), 4u);
  EXPECT_EQ(states[0], playlink::ClientState::kConnecting);
  EXPECT_EQ(states[1], playlink::ClientState::kReconnecting);
  EXPECT_EQ(states[2], playlink::ClientState::kConnecting);
  EXPECT_EQ(changes[2].attempt, 1);
  EXPECT_EQ(states[3], playlink::ClientState::kReconnecting);
}

TEST(ReconnectingClientTest, RejectedRegistrationIsReported) {
  playlink::Hub hub(InMemoryHubConfig());
  ASSERT_TRUE(hub.Start());
  HubConnector connector(hub);

  std::mutex mutex;
  std::vector<std::string> logs;
  playlink::ClientConfig config = FastClientConfig();
  config.max_reconnect_attempts = 0;
  config.log_callback = [&](const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex);
    logs.push_back(line);
  };
  playlink::ReconnectingClient client(config, PlayerIdentity(""), connector.connector());

  std::atomic<bool> gave_up{false};
  client.state_changes().Subscribe([&](const playlink::ClientStateChange& change) {
    if (change.gave_up) {
      gave_up = true;
    }
  });
  client.Connect();
  const auto deadline = std::chrono::steady_clock::now() + kWait;
  while (!gave_up && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_TRUE(gave_up.load());

  std::lock_guard<std::mutex> lock(mutex);
  bool rejected = false;
  for (const auto& line : logs) {
    rejected = rejected || line.find("registration rejected") != std::string::npos;
  }
  EXPECT_TRUE(rejected);
  hub.Stop();
}

TEST(ReconnectingClientTest, AnswersHubPings) {
  playlink::Hub hub(InMemoryHubConfig());
  ASSERT_TRUE(hub.Start());
  HubConnector connector(hub);
  playlink::ReconnectingClient client(FastClientConfig(), PlayerIdentity("vp-1"),
                                      connector.connector());
  client.Connect();
  ASSERT_TRUE(client.WaitForState(playlink::ClientState::kConnected, kWait));

  for (int round = 0; round < 3; ++round) {
    const uint64_t received = hub.GetMetrics().messages_received;
    EXPECT_TRUE(playlink::test::TickHeartbeat(hub).empty());
    const auto deadline = std::chrono::steady_clock::now() + kWait;
    while (hub.GetMetrics().messages_received == received &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
  EXPECT_EQ(client.state(), playlink::ClientState::kConnected);
  EXPECT_TRUE(playlink::test::GetRegistry(hub).Find("vp-1").has_value());
  client.Disconnect();
  hub.Stop();
}
