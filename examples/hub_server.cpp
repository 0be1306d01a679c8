// Example: run a relay hub serving files from a media directory.
#include "playlink/hub.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [media_root] [--port N] [--http-port N] [--advertise HOST]"
            << " [--no-announce]\n"
            << "  PLAYLINK_HOST and PLAYLINK_PORT override the bind address and port.\n";
}

bool ParsePort(const std::string& text, uint16_t* out) {
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || value < 0 || value > 65535) {
    return false;
  }
  *out = static_cast<uint16_t>(value);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  playlink::HubConfig config;
  if (const char* host = std::getenv("PLAYLINK_HOST")) {
    config.bind_address = host;
  }
  if (const char* port = std::getenv("PLAYLINK_PORT")) {
    if (!ParsePort(port, &config.port)) {
      std::cerr << "Invalid PLAYLINK_PORT: " << port << std::endl;
      return 1;
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--port" || arg == "--http-port" || arg == "--advertise") && i + 1 < argc) {
      const std::string value = argv[++i];
      if (arg == "--advertise") {
        config.advertised_host = value;
      } else if (!ParsePort(value, arg == "--port" ? &config.port : &config.http_port)) {
        std::cerr << "Invalid port: " << value << std::endl;
        return 1;
      }
    } else if (arg == "--no-announce") {
      config.enable_announce = false;
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    } else if (arg[0] == '-') {
      PrintUsage(argv[0]);
      return 1;
    } else {
      config.media_root = arg;
    }
  }

  playlink::Hub hub(config);
  if (!hub.Start()) {
    std::cerr << "Failed to start hub: " << hub.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Hub listening on " << config.bind_address << ":" << hub.port()
            << ", transfers on port " << hub.http_port() << ", media root "
            << config.media_root << std::endl;
  if (config.enable_announce) {
    std::cout << "Announcing on UDP port " << config.announce_port << std::endl;
  }
  std::cout << "Health: http://127.0.0.1:" << hub.http_port() << "/health" << std::endl;
  std::cout << "Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);

  const auto health = hub.GetHealth();
  const auto metrics = hub.GetMetrics();
  std::cout << "Players: " << health.device_count
            << " controllers: " << health.controller_count
            << " received: " << metrics.messages_received
            << " sent: " << metrics.messages_sent
            << " protocol errors: " << metrics.protocol_errors
            << " evictions: " << metrics.evictions << std::endl;
  hub.Stop();
  return 0;
}
