// Tests for the HTTP byte-stream endpoint.
#include "playlink/http_server.h"

#include "net_util.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

#include <sys/socket.h>

namespace {

namespace fs = std::filesystem;

constexpr std::chrono::milliseconds kWait{2000};

struct RawResponse {
  int status = 0;
  std::string head;
  std::string body;
};

// Sends `request` verbatim and reads until the server closes.
RawResponse RoundTrip(uint16_t port, const std::string& request) {
  RawResponse response;
  std::string error;
  const int fd = playlink::internal::ConnectTcp("127.0.0.1", port, kWait, &error);
  EXPECT_GE(fd, 0) << error;
  if (fd < 0) {
    return response;
  }
  EXPECT_TRUE(playlink::internal::SendAll(fd, request.data(), request.size(), &error));
  std::string raw;
  char buffer[4096];
  while (playlink::internal::WaitReadable(fd, kWait) > 0) {
    const ssize_t bytes = ::recv(fd, buffer, sizeof(buffer), 0);
    if (bytes <= 0) {
      break;
    }
    raw.append(buffer, static_cast<size_t>(bytes));
  }
  playlink::internal::CloseFd(fd);

  const size_t end = raw.find("\r\n\r\n");
  if (end == std::string::npos) {
    return response;
  }
  response.head = raw.substr(0, end);
  response.body = raw.substr(end + 4);
  response.status = std::atoi(raw.substr(9, 3).c_str());
  return response;
}

RawResponse Get(uint16_t port, const std::string& target, const std::string& extra = {}) {
  return RoundTrip(port, "GET " + target + " HTTP/1.1\r\nHost: test\r\n" + extra + "\r\n");
}

class HttpServerTest : public ::testing::Test {
 protected:
  HttpServerTest() {
    std::random_device rd;
    root_ = fs::temp_directory_path() / ("playlink-http-" + std::to_string(rd()));
    fs::create_directories(root_);
    std::ofstream out(root_ / "clip.mp4", std::ios::binary);
    for (int i = 0; i < 5000; ++i) {
      out.put(static_cast<char>('a' + i % 26));
    }
    out.close();

    playlink::TransferConfig transfer_config;
    transfer_config.media_root = root_.string();
    transfer_config.log_callback = Quiet();
    coordinator_ = std::make_unique<playlink::TransferCoordinator>(transfer_config);

    playlink::HttpServerConfig config;
    config.bind_address = "127.0.0.1";
    config.port = 0;
    config.request_timeout = std::chrono::milliseconds(500);
    config.log_callback = Quiet();
    server_ = std::make_unique<playlink::HttpServer>(config, *coordinator_);
  }

  ~HttpServerTest() override {
    server_->Stop();
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  static playlink::LogCallback Quiet() {
    return [](const std::string&) {};
  }

  void StartServer() {
    std::string error;
    ASSERT_TRUE(server_->Start(&error)) << error;
    ASSERT_NE(server_->port(), 0);
  }

  fs::path root_;
  std::unique_ptr<playlink::TransferCoordinator> coordinator_;
  std::unique_ptr<playlink::HttpServer> server_;
};

}  // namespace

TEST(HttpRequestTest, ParsesRequestHead) {
  playlink::HttpRequest request;
  ASSERT_TRUE(playlink::ParseHttpRequest(
      "GET /download/t1/my%20clip.mp4?x=1 HTTP/1.1\r\nRange:  bytes=10-\r\n"
      "X-Other: y\r\n\r\n",
      &request));
  EXPECT_EQ(request.method, "GET");
  EXPECT_EQ(request.path, "/download/t1/my clip.mp4");
  EXPECT_EQ(request.Header("range"), "bytes=10-");
  EXPECT_EQ(request.Header("x-other"), "y");
  EXPECT_EQ(request.Header("missing"), "");

  std::string error;
  EXPECT_FALSE(playlink::ParseHttpRequest("GARBAGE\r\n\r\n", &request, &error));
  EXPECT_FALSE(playlink::ParseHttpRequest("GET x HTTP/1.1\r\n\r\n", &request, &error));
  EXPECT_FALSE(playlink::ParseHttpRequest("GET /a HTTP/1.1\r\nnocolon\r\n\r\n", &request,
                                          &error));
}

TEST(HttpRequestTest, MimeTypesByExtension) {
  EXPECT_STREQ(playlink::MimeTypeForFilename("a.mp4"), "video/mp4");
  EXPECT_STREQ(playlink::MimeTypeForFilename("a.MOV"), "video/quicktime");
  EXPECT_STREQ(playlink::MimeTypeForFilename("a.webm"), "video/webm");
  EXPECT_STREQ(playlink::MimeTypeForFilename("README"), "application/octet-stream");
}

TEST_F(HttpServerTest, ServesWholeFile) {
  StartServer();
  const auto offer = coordinator_->Offer("clip.mp4", "", "vp-1");
  ASSERT_TRUE(offer.ok) << offer.error;

  const auto response = Get(server_->port(), offer.download_path);
  EXPECT_EQ(response.status, 200);
  EXPECT_NE(response.head.find("Content-Length: 5000"), std::string::npos);
  EXPECT_NE(response.head.find("Content-Type: video/mp4"), std::string::npos);
  EXPECT_NE(response.head.find("Accept-Ranges: bytes"), std::string::npos);
  ASSERT_EQ(response.body.size(), 5000u);
  EXPECT_EQ(response.body[27], 'b');

  const auto transfer = coordinator_->Find(offer.transfer_id);
  ASSERT_TRUE(transfer.has_value());
  EXPECT_EQ(transfer->state, playlink::TransferState::kCompleted);
}

TEST_F(HttpServerTest, ServesPartialContent) {
  StartServer();
  const auto offer = coordinator_->Offer("clip.mp4", "", "vp-1");
  ASSERT_TRUE(offer.ok);

  const auto response = Get(server_->port(), offer.download_path, "Range: bytes=1000-1999\r\n");
  EXPECT_EQ(response.status, 206);
  EXPECT_NE(response.head.find("Content-Range: bytes 1000-1999/5000"), std::string::npos);
  EXPECT_NE(response.head.find("Content-Length: 1000"), std::string::npos);
  ASSERT_EQ(response.body.size(), 1000u);
  EXPECT_EQ(response.body[0], static_cast<char>('a' + 1000 % 26));
  EXPECT_EQ(coordinator_->Find(offer.transfer_id)->state,
            playlink::TransferState::kDownloading);
}

TEST_F(HttpServerTest, RejectsUnsatisfiableRange) {
  StartServer();
  const auto offer = coordinator_->Offer("clip.mp4", "", "vp-1");
  ASSERT_TRUE(offer.ok);

  const auto response = Get(server_->port(), offer.download_path, "Range: bytes=6000-\r\n");
  EXPECT_EQ(response.status, 416);
  EXPECT_NE(response.head.find("Content-Range: bytes */5000"), std::string::npos);
}

TEST_F(HttpServerTest, UnknownOrFinishedTransferIsNotFound) {
  StartServer();
  EXPECT_EQ(Get(server_->port(), "/download/nope/clip.mp4").status, 404);

  const auto offer = coordinator_->Offer("clip.mp4", "", "vp-1");
  ASSERT_TRUE(offer.ok);
  EXPECT_EQ(Get(server_->port(), "/download/" + offer.transfer_id + "/other.mp4").status,
            404);
  coordinator_->Cancel(offer.transfer_id);
  EXPECT_EQ(Get(server_->port(), offer.download_path).status, 404);
  EXPECT_EQ(Get(server_->port(), "/nowhere").status, 404);
}

TEST_F(HttpServerTest, OnlyGetIsAllowed) {
  StartServer();
  const auto response =
      RoundTrip(server_->port(), "POST /files HTTP/1.1\r\nContent-Length: 0\r\n\r\n");
  EXPECT_EQ(response.status, 405);
  EXPECT_NE(response.head.find("Allow: GET"), std::string::npos);
}

TEST_F(HttpServerTest, ListsActiveTransfers) {
  StartServer();
  const auto offer = coordinator_->Offer("clip.mp4", "", "vp-1");
  ASSERT_TRUE(offer.ok);

  const auto response = Get(server_->port(), "/files");
  ASSERT_EQ(response.status, 200);
  const auto body = nlohmann::json::parse(response.body);
  ASSERT_EQ(body["files"].size(), 1u);
  EXPECT_EQ(body["files"][0]["transferId"], offer.transfer_id);
  EXPECT_EQ(body["files"][0]["filename"], "clip.mp4");
  EXPECT_EQ(body["files"][0]["totalBytes"], 5000);
  EXPECT_EQ(body["files"][0]["state"], "pending");
}

TEST_F(HttpServerTest, JsonRoutesAndFailingHandlers) {
  server_->AddJsonRoute("/health", []() { return nlohmann::json{{"status", "healthy"}}; });
  server_->AddJsonRoute("/broken", []() -> nlohmann::json {
    throw std::runtime_error("boom");
  });
  StartServer();

  auto response = Get(server_->port(), "/health");
  ASSERT_EQ(response.status, 200);
  EXPECT_EQ(nlohmann::json::parse(response.body)["status"], "healthy");

  response = Get(server_->port(), "/broken");
  EXPECT_EQ(response.status, 500);
}

TEST_F(HttpServerTest, IncompleteRequestTimesOut) {
  StartServer();
  const auto response = RoundTrip(server_->port(), "GET /files HTTP/1.1\r\n");
  EXPECT_EQ(response.status, 400);
}

TEST_F(HttpServerTest, StartRejectsInvalidConfig) {
  playlink::HttpServerConfig config;
  config.bind_address = "not-an-address";
  config.log_callback = Quiet();
  playlink::HttpServer server(config, *coordinator_);
  std::string error;
  EXPECT_FALSE(server.Start(&error));
  EXPECT_NE(error.find("bind_address"), std::string::npos);
  EXPECT_FALSE(server.running());
}
