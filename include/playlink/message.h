#pragma once

#include "playlink/types.h"

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace playlink {

/**
 * Message type discriminators carried in the `type` field of every frame.
 */
enum class MessageType {
  kRegister,
  kRegistered,
  kWelcome,
  kCommand,
  kCommandAck,
  kStatus,
  kDeviceConnected,
  kDeviceDisconnected,
  kPing,
  kPong,
  kError,
  kDownload,
  kTransferProgress,
  kDeleteMedia,
  kDeleteMediaResult,
  kLocalMedia,
};

const char* ToString(MessageType type);
bool ParseMessageType(const std::string& text, MessageType* out);

/**
 * One decoded frame: its discriminator plus the full JSON object
 * (including the `type` field).
 */
struct Message {
  MessageType type = MessageType::kError;
  nlohmann::json body = nlohmann::json::object();
};

/**
 * Decode a frame into a Message.
 *
 * @param frame Raw frame text (one JSON object).
 * @param out Decoded message.
 * @param error Optional output describing why decoding failed.
 * @return false for malformed JSON, non-object payloads, or unknown types.
 */
bool DecodeMessage(const std::string& frame, Message* out,
                   std::string* error = nullptr);

/// Serialize a message to frame text.
std::string EncodeMessage(const Message& message);

/**
 * Registration handshake sent by every participant after connecting.
 */
struct RegisterMessage {
  std::string device_id;
  std::string device_name;
  Role role = Role::kPlayer;
};

/**
 * Device entry included in `registered` replies and health listings.
 */
struct DeviceSummary {
  std::string device_id;
  std::string device_name;
  Role role = Role::kPlayer;
  PlaybackSnapshot playback;
};

struct RegisteredMessage {
  std::string device_id;
  std::string message;
  /// Present for controllers: players registered at the time of the ack.
  std::vector<DeviceSummary> devices;
};

struct WelcomeMessage {
  std::string message;
  std::string server_version;
};

struct CommandAckMessage {
  CommandAction action = CommandAction::kStop;
  int target_count = 0;
  int delivered_count = 0;
  int64_t timestamp_ms = 0;
};

struct StatusMessage {
  std::string device_id;
  std::string device_name;
  PlaybackSnapshot playback;
};

/// Payload of deviceConnected / deviceDisconnected notifications.
struct DeviceNotice {
  std::string device_id;
  std::string device_name;
};

struct ErrorMessage {
  std::string message;
  int64_t timestamp_ms = 0;
};

/// Hub -> player instruction to fetch a payload over the byte-stream channel.
struct DownloadMessage {
  std::string transfer_id;
  std::string download_url;
  std::string filename;
  uint64_t file_size = 0;
};

struct TransferProgressMessage {
  std::string device_id;
  std::string transfer_id;
  std::string filename;
  TransferStatus status = TransferStatus::kStarted;
  /// Fraction complete in [0.0, 1.0].
  double progress = 0.0;
  uint64_t bytes_transferred = 0;
  uint64_t total_bytes = 0;
  std::string error;
};

struct DeleteMediaMessage {
  std::string filename;
};

struct DeleteMediaResultMessage {
  std::string device_id;
  std::string filename;
  bool success = false;
  std::string message;
};

struct LocalMediaMessage {
  std::string device_id;
  std::vector<MediaItem> items;
};

Message ToMessage(const RegisterMessage& value);
Message ToMessage(const RegisteredMessage& value);
Message ToMessage(const WelcomeMessage& value);
Message ToMessage(const Command& value);
Message ToMessage(const CommandAckMessage& value);
Message ToMessage(const StatusMessage& value);
Message ToMessage(const ErrorMessage& value);
Message ToMessage(const DownloadMessage& value);
Message ToMessage(const TransferProgressMessage& value);
Message ToMessage(const DeleteMediaMessage& value);
Message ToMessage(const DeleteMediaResultMessage& value);
Message ToMessage(const LocalMediaMessage& value);

/// Build a deviceConnected or deviceDisconnected message.
Message MakeDeviceNotice(MessageType type, const DeviceNotice& notice);
/// Build a ping or pong carrying `timestamp_ms`.
Message MakeHeartbeat(MessageType type, int64_t timestamp_ms);

// Typed parsers. Each returns false and fills `error` when a required field
// is missing or has the wrong type, or when the message has another type.
bool ParseRegister(const Message& message, RegisterMessage* out,
                   std::string* error = nullptr);
bool ParseRegistered(const Message& message, RegisteredMessage* out,
                     std::string* error = nullptr);
bool ParseWelcome(const Message& message, WelcomeMessage* out,
                  std::string* error = nullptr);
bool ParseCommand(const Message& message, Command* out,
                  std::string* error = nullptr);
bool ParseCommandAck(const Message& message, CommandAckMessage* out,
                     std::string* error = nullptr);
bool ParseStatus(const Message& message, StatusMessage* out,
                 std::string* error = nullptr);
bool ParseDeviceNotice(const Message& message, DeviceNotice* out,
                       std::string* error = nullptr);
bool ParseError(const Message& message, ErrorMessage* out,
                std::string* error = nullptr);
bool ParseDownload(const Message& message, DownloadMessage* out,
                   std::string* error = nullptr);
bool ParseTransferProgress(const Message& message, TransferProgressMessage* out,
                           std::string* error = nullptr);
bool ParseDeleteMedia(const Message& message, DeleteMediaMessage* out,
                      std::string* error = nullptr);
bool ParseDeleteMediaResult(const Message& message, DeleteMediaResultMessage* out,
                            std::string* error = nullptr);
bool ParseLocalMedia(const Message& message, LocalMediaMessage* out,
                     std::string* error = nullptr);

nlohmann::json ToJson(const PlaybackSnapshot& snapshot);
nlohmann::json ToJson(const DeviceSummary& summary);

}  // namespace playlink
