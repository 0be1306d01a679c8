// Example: interactive controller that sends commands and prints player reports.
#include "playlink/reconnecting_client.h"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace {

void PrintHelp() {
  std::cout << "Commands:\n"
            << "  play <media> [device|all] [format]\n"
            << "  change <media> [device|all] [format]\n"
            << "  pause|resume|stop [device|all]\n"
            << "  download <path> [device|all]\n"
            << "  delete <filename> [device|all]\n"
            << "  help, quit\n";
}

void PrintMessage(const playlink::Message& message) {
  switch (message.type) {
    case playlink::MessageType::kRegistered: {
      playlink::RegisteredMessage registered;
      if (playlink::ParseRegistered(message, &registered)) {
        std::cout << registered.message << "; players online: " << registered.devices.size()
                  << std::endl;
        for (const auto& device : registered.devices) {
          std::cout << " - " << device.device_id << " (" << device.device_name << ") "
                    << playlink::ToString(device.playback.state) << std::endl;
        }
      }
      break;
    }
    case playlink::MessageType::kDeviceConnected:
    case playlink::MessageType::kDeviceDisconnected: {
      playlink::DeviceNotice notice;
      if (playlink::ParseDeviceNotice(message, &notice)) {
        std::cout << "device "
                  << (message.type == playlink::MessageType::kDeviceConnected ? "connected"
                                                                               : "disconnected")
                  << ": " << notice.device_id << " (" << notice.device_name << ")" << std::endl;
      }
      break;
    }
    case playlink::MessageType::kStatus: {
      playlink::StatusMessage status;
      if (playlink::ParseStatus(message, &status)) {
        std::cout << "status " << status.device_id << ": "
                  << playlink::ToString(status.playback.state);
        if (!status.playback.current_media.empty()) {
          std::cout << " " << status.playback.current_media;
        }
        std::cout << std::endl;
      }
      break;
    }
    case playlink::MessageType::kCommandAck: {
      playlink::CommandAckMessage ack;
      if (playlink::ParseCommandAck(message, &ack)) {
        std::cout << playlink::ToString(ack.action) << " delivered to " << ack.delivered_count
                  << "/" << ack.target_count << " device(s)" << std::endl;
      }
      break;
    }
    case playlink::MessageType::kTransferProgress: {
      playlink::TransferProgressMessage report;
      if (playlink::ParseTransferProgress(message, &report)) {
        std::cout << "transfer " << report.filename << " on " << report.device_id << ": "
                  << playlink::ToString(report.status) << " " << std::fixed
                  << std::setprecision(0) << report.progress * 100.0 << "%";
        if (!report.error.empty()) {
          std::cout << " (" << report.error << ")";
        }
        std::cout << std::endl;
      }
      break;
    }
    case playlink::MessageType::kDeleteMediaResult: {
      playlink::DeleteMediaResultMessage result;
      if (playlink::ParseDeleteMediaResult(message, &result)) {
        std::cout << "delete " << result.filename << " on " << result.device_id << ": "
                  << (result.success ? "ok" : "failed") << " " << result.message << std::endl;
      }
      break;
    }
    case playlink::MessageType::kLocalMedia: {
      playlink::LocalMediaMessage media;
      if (playlink::ParseLocalMedia(message, &media)) {
        std::cout << "media on " << media.device_id << ": " << media.items.size()
                  << " file(s)" << std::endl;
        for (const auto& item : media.items) {
          std::cout << " - " << item.filename << " (" << item.size << " bytes)" << std::endl;
        }
      }
      break;
    }
    case playlink::MessageType::kError:
      std::cout << "error: " << message.body.value("message", std::string()) << std::endl;
      break;
    default:
      break;
  }
}

// Parses one input line into a command. Returns false with `error` set on bad input.
bool ParseLine(const std::string& line, playlink::Command* command, std::string* error) {
  std::istringstream in(line);
  std::string verb;
  in >> verb;
  if (!playlink::ParseCommandAction(verb == "delete" ? "deleteMedia" : verb,
                                    &command->action)) {
    *error = "unknown command: " + verb;
    return false;
  }
  const bool needs_media = command->action == playlink::CommandAction::kPlay ||
                           command->action == playlink::CommandAction::kChange ||
                           command->action == playlink::CommandAction::kDownload ||
                           command->action == playlink::CommandAction::kDeleteMedia;
  if (needs_media && !(in >> command->media_ref)) {
    *error = verb + " needs a media argument";
    return false;
  }
  std::string target;
  if (in >> target && target != "all") {
    command->target = playlink::TargetSpec::Single(target);
  }
  in >> command->format;
  if (!command->format.empty() && !playlink::IsValidVideoFormat(command->format)) {
    *error = "unknown format: " + command->format;
    return false;
  }
  return true;
}

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
  identity.device_id = "controller-cli";
  identity.device_name = "Command Line Controller";
  identity.role = playlink::Role::kController;
  if (argc > 1 && std::string(argv[1]) == "--discover") {
    config.discover_hub = true;
  } else {
    if (argc > 1) {
      config.host = argv[1];
    }
    if (argc > 2) {
      config.port = static_cast<uint16_t>(std::atoi(argv[2]));
    }
  }
  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }

  playlink::ReconnectingClient client(config, identity);
  client.messages().Subscribe(PrintMessage);
  client.state_changes().Subscribe([](const playlink::ClientStateChange& change) {
    std::cout << "connection " << playlink::ToString(change.state);
    if (!change.reason.empty()) {
      std::cout << ": " << change.reason;
    }
    std::cout << std::endl;
  });

  client.Connect();
  if (!client.WaitForState(playlink::ClientState::kConnected, std::chrono::seconds(10))) {
    if (config.discover_hub) {
      std::cerr << "Failed to find and connect to a hub" << std::endl;
    } else {
      std::cerr << "Failed to connect to " << config.host << ":" << config.port << std::endl;
    }
    client.Disconnect();
    return 1;
  }
  PrintHelp();

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    if (line == "quit" || line == "exit") {
      break;
    }
    if (line == "help") {
      PrintHelp();
      continue;
    }
    playlink::Command command;
    if (!ParseLine(line, &command, &error)) {
      std::cout << error << std::endl;
      continue;
    }
    command.timestamp_ms = playlink::NowMillis();
    if (!client.Send(playlink::ToMessage(command), &error)) {
      std::cout << "send failed: " << error << std::endl;
    }
  }
  client.Disconnect();
  return 0;
}
