// Example: simulated player that follows hub commands and downloads files.
#include "playlink/download_client.h"
#include "playlink/reconnecting_client.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " <device_id> [device_name] [--host HOST] [--port N] [--discover]"
            << " [--dir DIR]\n";
}

// Playback state the simulated headset reports back to controllers.
class SimulatedPlayer {
 public:
  SimulatedPlayer(playlink::ReconnectingClient& client, playlink::DownloadClient& downloads,
                  std::string media_dir)
      : client_(client), downloads_(downloads), media_dir_(std::move(media_dir)) {}

  void OnMessage(const playlink::Message& message) {
    std::string error;
    switch (message.type) {
      case playlink::MessageType::kCommand: {
        playlink::Command command;
        if (!playlink::ParseCommand(message, &command, &error)) {
          std::cerr << "Bad command: " << error << std::endl;
          return;
        }
        Apply(command);
        break;
      }
      case playlink::MessageType::kDownload: {
        playlink::DownloadMessage download;
        if (!playlink::ParseDownload(message, &download, &error)) {
          std::cerr << "Bad download: " << error << std::endl;
          return;
        }
        std::cout << "Downloading " << download.filename << " (" << download.file_size
                  << " bytes)" << std::endl;
        if (!downloads_.Start(download.download_url, download.filename, download.file_size,
                              download.transfer_id, &error)) {
          std::cerr << "Download rejected: " << error << std::endl;
        }
        break;
      }
      case playlink::MessageType::kDeleteMedia: {
        playlink::DeleteMediaMessage request;
        if (!playlink::ParseDeleteMedia(message, &request, &error)) {
          std::cerr << "Bad deleteMedia: " << error << std::endl;
          return;
        }
        Delete(request.filename);
        break;
      }
      case playlink::MessageType::kError:
        std::cerr << "Hub error: " << message.body.value("message", std::string()) << std::endl;
        break;
      default:
        break;
    }
  }

  void OnDownload(const playlink::DownloadRecord& record) {
    playlink::TransferProgressMessage report;
    report.transfer_id = record.transfer_id;
    report.filename = record.filename;
    report.status = record.status;
    report.progress = record.progress();
    report.bytes_transferred = record.bytes_downloaded;
    report.total_bytes = record.total_bytes;
    report.error = record.error;
    Report(playlink::ToMessage(report));
    if (record.status == playlink::TransferStatus::kCompleted) {
      std::cout << "Saved " << record.saved_path << std::endl;
      SendLocalMedia();
    } else if (record.status == playlink::TransferStatus::kFailed) {
      std::cout << "Download of " << record.filename << " failed: " << record.error
                << std::endl;
    }
  }

  void SendLocalMedia() {
    playlink::LocalMediaMessage media;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(media_dir_, ec)) {
      if (!entry.is_regular_file(ec) || entry.path().extension() == ".part") {
        continue;
      }
      playlink::MediaItem item;
      item.filename = entry.path().filename().string();
      item.size = static_cast<uint64_t>(entry.file_size(ec));
      media.items.push_back(std::move(item));
    }
    Report(playlink::ToMessage(media));
  }

 private:
  void Apply(const playlink::Command& command) {
    playlink::StatusMessage status;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      switch (command.action) {
        case playlink::CommandAction::kPlay:
        case playlink::CommandAction::kChange:
          playback_.state = playlink::PlaybackState::kPlaying;
          playback_.current_media = command.media_ref.empty() ? command.url : command.media_ref;
          playback_.immersive = !command.format.empty() && command.format != "mono2d";
          playback_.position_seconds = 0.0;
          break;
        case playlink::CommandAction::kPause:
          playback_.state = playlink::PlaybackState::kPaused;
          break;
        case playlink::CommandAction::kResume:
          playback_.state = playlink::PlaybackState::kPlaying;
          break;
        case playlink::CommandAction::kStop:
          playback_ = playlink::PlaybackSnapshot();
          playback_.state = playlink::PlaybackState::kStopped;
          break;
        default:
          return;
      }
      status.playback = playback_;
    }
    std::cout << "Command " << playlink::ToString(command.action) << " -> "
              << playlink::ToString(status.playback.state) << std::endl;
    Report(playlink::ToMessage(status));
  }

  void Delete(const std::string& filename) {
    playlink::DeleteMediaResultMessage result;
    result.filename = filename;
    const std::string safe = playlink::SanitizeFilename(filename);
    std::error_code ec;
    result.success = !safe.empty() &&
                     std::filesystem::remove(std::filesystem::path(media_dir_) / safe, ec);
    result.message = result.success ? "deleted" : (ec ? ec.message() : "file not found");
    std::cout << "Delete " << filename << ": " << result.message << std::endl;
    Report(playlink::ToMessage(result));
    SendLocalMedia();
  }

  void Report(const playlink::Message& message) {
    std::string error;
    if (!client_.Send(message, &error)) {
      std::cerr << "Report dropped: " << error << std::endl;
    }
  }

  playlink::ReconnectingClient& client_;
  playlink::DownloadClient& downloads_;
  std::string media_dir_;
  std::mutex mutex_;
  playlink::PlaybackSnapshot playback_;
};

}  // namespace

int main(int argc, char** argv) {
  playlink::ClientConfig config;
  if (const char* host = std::getenv("PLAYLINK_HOST")) {
    config.host = host;
  }
  if (const char* port = std::getenv("PLAYLINK_PORT")) {
    config.port = static_cast<uint16_t>(std::atoi(port));
  }
  playlink::RegisterMessage identity;
  identity.role = playlink::Role::kPlayer;
  std::string media_dir = "player_media";

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--host" && i + 1 < argc) {
      config.host = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      config.port = static_cast<uint16_t>(std::atoi(argv[++i]));
    } else if (arg == "--discover") {
      config.discover_hub = true;
    } else if (arg == "--dir" && i + 1 < argc) {
      media_dir = argv[++i];
    } else if (arg[0] == '-') {
      PrintUsage(argv[0]);
      return 1;
    } else if (identity.device_id.empty()) {
      identity.device_id = arg;
    } else {
      identity.device_name = arg;
    }
  }
  if (identity.device_id.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }

  playlink::DownloadConfig download_config;
  download_config.directory = media_dir;
  playlink::DownloadClient downloads(download_config);
  playlink::ReconnectingClient client(config, identity);
  SimulatedPlayer player(client, downloads, media_dir);

  client.messages().Subscribe(
      [&player](const playlink::Message& message) { player.OnMessage(message); });
  downloads.progress().Subscribe(
      [&player](const playlink::DownloadRecord& record) { player.OnDownload(record); });
  client.state_changes().Subscribe([&player](const playlink::ClientStateChange& change) {
    std::cout << "Connection " << playlink::ToString(change.state);
    if (change.attempt > 0) {
      std::cout << " (attempt " << change.attempt << ")";
    }
    if (!change.reason.empty()) {
      std::cout << ": " << change.reason;
    }
    std::cout << std::endl;
    if (change.state == playlink::ClientState::kConnected) {
      player.SendLocalMedia();
    }
    if (change.gave_up) {
      std::cout << "Giving up; press Enter to exit." << std::endl;
    }
  });

  client.Connect();
  std::cout << "Player " << identity.device_id << " connecting to ";
  if (config.discover_hub) {
    std::cout << "the first announced hub";
  } else {
    std::cout << config.host << ":" << config.port;
  }
  std::cout << ". Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  client.Disconnect();
  downloads.Cancel();
  return 0;
}
