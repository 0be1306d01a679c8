#include "playlink/message.h"

#include <algorithm>
#include <utility>

namespace playlink {
namespace {

using nlohmann::json;

constexpr const char* kTargetAll = "all";

bool Fail(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
  return false;
}

bool ExpectType(const Message& message, MessageType type, std::string* error) {
  if (message.type != type) {
    return Fail(error, std::string("expected ") + ToString(type) + " message, got " +
                           ToString(message.type));
  }
  if (!message.body.is_object()) {
    return Fail(error, "message body must be an object");
  }
  return true;
}

// Required string field.
bool ReadString(const json& body, const char* key, std::string* out,
                std::string* error) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    return Fail(error, std::string("missing or invalid field: ") + key);
  }
  *out = it->get<std::string>();
  return true;
}

// Optional string field; absent or null leaves `out` untouched.
bool ReadOptionalString(const json& body, const char* key, std::string* out,
                        std::string* error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return Fail(error, std::string("field must be a string: ") + key);
  }
  *out = it->get<std::string>();
  return true;
}

// Optional string looked up under a primary key, then a legacy alias.
bool ReadAliasedString(const json& body, const char* key, const char* alias,
                       std::string* out, std::string* error) {
  if (body.contains(key)) {
    return ReadOptionalString(body, key, out, error);
  }
  return ReadOptionalString(body, alias, out, error);
}

bool ReadOptionalBool(const json& body, const char* key, bool* out,
                      std::string* error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_boolean()) {
    return Fail(error, std::string("field must be a boolean: ") + key);
  }
  *out = it->get<bool>();
  return true;
}

bool ReadOptionalDouble(const json& body, const char* key, double* out,
                        std::string* error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number()) {
    return Fail(error, std::string("field must be a number: ") + key);
  }
  *out = it->get<double>();
  return true;
}

bool ReadOptionalInt64(const json& body, const char* key, int64_t* out,
                       std::string* error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number()) {
    return Fail(error, std::string("field must be a number: ") + key);
  }
  *out = it->is_number_float() ? static_cast<int64_t>(it->get<double>())
                               : it->get<int64_t>();
  return true;
}

bool ReadOptionalUint64(const json& body, const char* key, uint64_t* out,
                        std::string* error) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) {
    return true;
  }
  if (it->is_number_unsigned()) {
    *out = it->get<uint64_t>();
    return true;
  }
  if (it->is_number_integer() && it->get<int64_t>() >= 0) {
    *out = static_cast<uint64_t>(it->get<int64_t>());
    return true;
  }
  if (it->is_number_float() && it->get<double>() >= 0.0) {
    *out = static_cast<uint64_t>(it->get<double>());
    return true;
  }
  return Fail(error, std::string("field must be a non-negative number: ") + key);
}

bool ReadOptionalInt(const json& body, const char* key, int* out,
                     std::string* error) {
  int64_t value = *out;
  if (!ReadOptionalInt64(body, key, &value, error)) {
    return false;
  }
  *out = static_cast<int>(value);
  return true;
}

Message MakeMessage(MessageType type) {
  Message message;
  message.type = type;
  message.body = json::object();
  message.body["type"] = ToString(type);
  return message;
}

bool ParseSnapshot(const json& body, PlaybackSnapshot* out, std::string* error) {
  if (!body.is_object()) {
    return Fail(error, "device state must be an object");
  }
  std::string state_text = ToString(PlaybackState::kIdle);
  if (!ReadAliasedString(body, "playbackState", "state", &state_text, error)) {
    return false;
  }
  if (!ParsePlaybackState(state_text, &out->state)) {
    return Fail(error, "unknown playback state: " + state_text);
  }
  return ReadAliasedString(body, "currentMedia", "currentVideo",
                           &out->current_media, error) &&
         ReadOptionalBool(body, "immersiveMode", &out->immersive, error) &&
         ReadOptionalDouble(body, "positionSeconds", &out->position_seconds, error) &&
         ReadOptionalInt64(body, "lastUpdate", &out->last_update_ms, error);
}

bool ParseSummary(const json& body, DeviceSummary* out, std::string* error) {
  if (!body.is_object()) {
    return Fail(error, "device entry must be an object");
  }
  if (!ReadString(body, "deviceId", &out->device_id, error) ||
      !ReadOptionalString(body, "deviceName", &out->device_name, error)) {
    return false;
  }
  std::string role_text = ToString(Role::kPlayer);
  if (!ReadOptionalString(body, "deviceType", &role_text, error)) {
    return false;
  }
  if (!ParseRole(role_text, &out->role)) {
    return Fail(error, "unknown device type: " + role_text);
  }
  auto state = body.find("state");
  if (state != body.end() && !state->is_null()) {
    return ParseSnapshot(*state, &out->playback, error);
  }
  return true;
}

}  // namespace

const char* ToString(MessageType type) {
  switch (type) {
    case MessageType::kRegister:
      return "register";
    case MessageType::kRegistered:
      return "registered";
    case MessageType::kWelcome:
      return "welcome";
    case MessageType::kCommand:
      return "command";
    case MessageType::kCommandAck:
      return "commandAck";
    case MessageType::kStatus:
      return "status";
    case MessageType::kDeviceConnected:
      return "deviceConnected";
    case MessageType::kDeviceDisconnected:
      return "deviceDisconnected";
    case MessageType::kPing:
      return "ping";
    case MessageType::kPong:
      return "pong";
    case MessageType::kError:
      return "error";
    case MessageType::kDownload:
      return "download";
    case MessageType::kTransferProgress:
      return "transferProgress";
    case MessageType::kDeleteMedia:
      return "deleteMedia";
    case MessageType::kDeleteMediaResult:
      return "deleteMediaResult";
    case MessageType::kLocalMedia:
      return "localMedia";
  }
  return "error";
}

bool ParseMessageType(const std::string& text, MessageType* out) {
  if (!out) {
    return false;
  }
  static const std::pair<const char*, MessageType> kTypes[] = {
      {"register", MessageType::kRegister},
      {"registered", MessageType::kRegistered},
      {"welcome", MessageType::kWelcome},
      {"command", MessageType::kCommand},
      {"commandAck", MessageType::kCommandAck},
      {"status", MessageType::kStatus},
      {"deviceConnected", MessageType::kDeviceConnected},
      {"deviceDisconnected", MessageType::kDeviceDisconnected},
      {"ping", MessageType::kPing},
      {"pong", MessageType::kPong},
      {"error", MessageType::kError},
      {"download", MessageType::kDownload},
      {"transferProgress", MessageType::kTransferProgress},
      {"deleteMedia", MessageType::kDeleteMedia},
      {"deleteMediaResult", MessageType::kDeleteMediaResult},
      {"localMedia", MessageType::kLocalMedia},
  };
  for (const auto& entry : kTypes) {
    if (text == entry.first) {
      *out = entry.second;
      return true;
    }
  }
  return false;
}

bool DecodeMessage(const std::string& frame, Message* out, std::string* error) {
  if (!out) {
    return Fail(error, "no output message");
  }
  json body = json::parse(frame, nullptr, false);
  if (body.is_discarded()) {
    return Fail(error, "invalid JSON message");
  }
  if (!body.is_object()) {
    return Fail(error, "message must be a JSON object");
  }
  auto type_it = body.find("type");
  if (type_it == body.end() || !type_it->is_string()) {
    return Fail(error, "missing message type");
  }
  const std::string type_text = type_it->get<std::string>();
  MessageType type;
  if (!ParseMessageType(type_text, &type)) {
    return Fail(error, "unknown message type: " + type_text);
  }
  out->type = type;
  out->body = std::move(body);
  return true;
}

std::string EncodeMessage(const Message& message) {
  json body = message.body.is_object() ? message.body : json::object();
  body["type"] = ToString(message.type);
  return body.dump();
}

nlohmann::json ToJson(const PlaybackSnapshot& snapshot) {
  json state = json::object();
  state["playbackState"] = ToString(snapshot.state);
  state["currentMedia"] = snapshot.current_media.empty()
                              ? json(nullptr)
                              : json(snapshot.current_media);
  state["immersiveMode"] = snapshot.immersive;
  state["positionSeconds"] = snapshot.position_seconds;
  state["lastUpdate"] = snapshot.last_update_ms;
  return state;
}

nlohmann::json ToJson(const DeviceSummary& summary) {
  json entry = json::object();
  entry["deviceId"] = summary.device_id;
  entry["deviceName"] = summary.device_name;
  entry["deviceType"] = ToString(summary.role);
  entry["state"] = ToJson(summary.playback);
  return entry;
}

Message ToMessage(const RegisterMessage& value) {
  Message message = MakeMessage(MessageType::kRegister);
  message.body["deviceId"] = value.device_id;
  message.body["deviceName"] = value.device_name;
  message.body["deviceType"] = ToString(value.role);
  return message;
}

Message ToMessage(const RegisteredMessage& value) {
  Message message = MakeMessage(MessageType::kRegistered);
  message.body["deviceId"] = value.device_id;
  message.body["message"] = value.message;
  if (!value.devices.empty()) {
    json devices = json::array();
    for (const auto& device : value.devices) {
      devices.push_back(ToJson(device));
    }
    message.body["devices"] = std::move(devices);
  }
  return message;
}

Message ToMessage(const WelcomeMessage& value) {
  Message message = MakeMessage(MessageType::kWelcome);
  message.body["message"] = value.message;
  message.body["serverVersion"] = value.server_version;
  return message;
}

Message ToMessage(const Command& value) {
  Message message = MakeMessage(MessageType::kCommand);
  message.body["action"] = ToString(value.action);
  if (!value.media_ref.empty()) {
    message.body["mediaRef"] = value.media_ref;
  }
  if (!value.url.empty()) {
    message.body["url"] = value.url;
  }
  if (!value.format.empty()) {
    message.body["format"] = value.format;
  }
  json targets = json::array();
  if (value.target.kind == TargetSpec::Kind::kAll) {
    targets.push_back(kTargetAll);
  } else {
    for (const auto& id : value.target.ids) {
      targets.push_back(id);
    }
  }
  message.body["targetDevices"] = std::move(targets);
  message.body["timestamp"] = value.timestamp_ms;
  return message;
}

Message ToMessage(const CommandAckMessage& value) {
  Message message = MakeMessage(MessageType::kCommandAck);
  message.body["action"] = ToString(value.action);
  message.body["targetCount"] = value.target_count;
  message.body["deliveredCount"] = value.delivered_count;
  message.body["timestamp"] = value.timestamp_ms;
  return message;
}

Message ToMessage(const StatusMessage& value) {
  Message message = MakeMessage(MessageType::kStatus);
  message.body["deviceId"] = value.device_id;
  message.body["deviceName"] = value.device_name;
  message.body["state"] = ToString(value.playback.state);
  message.body["currentMedia"] = value.playback.current_media.empty()
                                     ? json(nullptr)
                                     : json(value.playback.current_media);
  message.body["immersiveMode"] = value.playback.immersive;
  message.body["positionSeconds"] = value.playback.position_seconds;
  if (value.playback.last_update_ms != 0) {
    message.body["lastUpdate"] = value.playback.last_update_ms;
  }
  return message;
}

Message ToMessage(const ErrorMessage& value) {
  Message message = MakeMessage(MessageType::kError);
  message.body["message"] = value.message;
  message.body["timestamp"] = value.timestamp_ms;
  return message;
}

Message ToMessage(const DownloadMessage& value) {
  Message message = MakeMessage(MessageType::kDownload);
  message.body["transferId"] = value.transfer_id;
  message.body["downloadUrl"] = value.download_url;
  message.body["filename"] = value.filename;
  message.body["fileSize"] = value.file_size;
  return message;
}

Message ToMessage(const TransferProgressMessage& value) {
  Message message = MakeMessage(MessageType::kTransferProgress);
  message.body["deviceId"] = value.device_id;
  if (!value.transfer_id.empty()) {
    message.body["transferId"] = value.transfer_id;
  }
  message.body["filename"] = value.filename;
  message.body["status"] = ToString(value.status);
  message.body["progress"] = value.progress;
  message.body["bytesTransferred"] = value.bytes_transferred;
  message.body["totalBytes"] = value.total_bytes;
  if (!value.error.empty()) {
    message.body["error"] = value.error;
  }
  return message;
}

Message ToMessage(const DeleteMediaMessage& value) {
  Message message = MakeMessage(MessageType::kDeleteMedia);
  message.body["filename"] = value.filename;
  return message;
}

Message ToMessage(const DeleteMediaResultMessage& value) {
  Message message = MakeMessage(MessageType::kDeleteMediaResult);
  message.body["deviceId"] = value.device_id;
  message.body["filename"] = value.filename;
  message.body["success"] = value.success;
  message.body["message"] = value.message;
  return message;
}

Message ToMessage(const LocalMediaMessage& value) {
  Message message = MakeMessage(MessageType::kLocalMedia);
  message.body["deviceId"] = value.device_id;
  json items = json::array();
  for (const auto& item : value.items) {
    json entry = json::object();
    entry["filename"] = item.filename;
    entry["size"] = item.size;
    if (!item.format.empty()) {
      entry["format"] = item.format;
    }
    items.push_back(std::move(entry));
  }
  message.body["items"] = std::move(items);
  return message;
}

Message MakeDeviceNotice(MessageType type, const DeviceNotice& notice) {
  Message message = MakeMessage(type);
  message.body["deviceId"] = notice.device_id;
  message.body["deviceName"] = notice.device_name;
  return message;
}

Message MakeHeartbeat(MessageType type, int64_t timestamp_ms) {
  Message message = MakeMessage(type);
  message.body["timestamp"] = timestamp_ms;
  return message;
}

bool ParseRegister(const Message& message, RegisterMessage* out,
                   std::string* error) {
  if (!out || !ExpectType(message, MessageType::kRegister, error)) {
    return false;
  }
  RegisterMessage parsed;
  std::string role_text;
  if (!ReadString(message.body, "deviceId", &parsed.device_id, error) ||
      !ReadOptionalString(message.body, "deviceName", &parsed.device_name, error) ||
      !ReadString(message.body, "deviceType", &role_text, error)) {
    return false;
  }
  if (parsed.device_id.empty()) {
    return Fail(error, "deviceId must not be empty");
  }
  if (!ParseRole(role_text, &parsed.role)) {
    return Fail(error, "unknown device type: " + role_text);
  }
  *out = std::move(parsed);
  return true;
}

bool ParseRegistered(const Message& message, RegisteredMessage* out,
                     std::string* error) {
  if (!out || !ExpectType(message, MessageType::kRegistered, error)) {
    return false;
  }
  RegisteredMessage parsed;
  if (!ReadString(message.body, "deviceId", &parsed.device_id, error) ||
      !ReadOptionalString(message.body, "message", &parsed.message, error)) {
    return false;
  }
  auto devices = message.body.find("devices");
  if (devices != message.body.end() && !devices->is_null()) {
    if (!devices->is_array()) {
      return Fail(error, "devices must be an array");
    }
    for (const auto& entry : *devices) {
      DeviceSummary summary;
      if (!ParseSummary(entry, &summary, error)) {
        return false;
      }
      parsed.devices.push_back(std::move(summary));
    }
  }
  *out = std::move(parsed);
  return true;
}

bool ParseWelcome(const Message& message, WelcomeMessage* out,
                  std::string* error) {
  if (!out || !ExpectType(message, MessageType::kWelcome, error)) {
    return false;
  }
  WelcomeMessage parsed;
  if (!ReadString(message.body, "message", &parsed.message, error) ||
      !ReadOptionalString(message.body, "serverVersion", &parsed.server_version,
                          error)) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

bool ParseCommand(const Message& message, Command* out, std::string* error) {
  if (!out || !ExpectType(message, MessageType::kCommand, error)) {
    return false;
  }
  Command parsed;
  std::string action_text;
  if (!ReadString(message.body, "action", &action_text, error)) {
    return Fail(error, "missing action in command");
  }
  if (!ParseCommandAction(action_text, &parsed.action)) {
    return Fail(error, "invalid action: " + action_text);
  }
  if (!ReadAliasedString(message.body, "mediaRef", "videoUrl", &parsed.media_ref,
                         error) ||
      !ReadOptionalString(message.body, "url", &parsed.url, error) ||
      !ReadAliasedString(message.body, "format", "videoFormat", &parsed.format,
                         error) ||
      !ReadOptionalInt64(message.body, "timestamp", &parsed.timestamp_ms, error)) {
    return false;
  }
  if (!parsed.format.empty() && !IsValidVideoFormat(parsed.format)) {
    return Fail(error, "invalid format: " + parsed.format);
  }
  if ((parsed.action == CommandAction::kDownload ||
       parsed.action == CommandAction::kDeleteMedia) &&
      parsed.media_ref.empty()) {
    return Fail(error, std::string(ToString(parsed.action)) + " requires mediaRef");
  }

  auto single = message.body.find("targetDevice");
  auto targets = message.body.find("targetDevices");
  if (targets != message.body.end() && !targets->is_null()) {
    if (!targets->is_array()) {
      return Fail(error, "targetDevices must be an array");
    }
    std::vector<std::string> ids;
    bool all = false;
    for (const auto& entry : *targets) {
      if (!entry.is_string()) {
        return Fail(error, "targetDevices entries must be strings");
      }
      const std::string id = entry.get<std::string>();
      if (id == kTargetAll) {
        all = true;
      }
      ids.push_back(id);
    }
    parsed.target = all ? TargetSpec::All() : TargetSpec::List(std::move(ids));
  } else if (single != message.body.end() && !single->is_null()) {
    if (!single->is_string()) {
      return Fail(error, "targetDevice must be a string");
    }
    parsed.target = TargetSpec::Single(single->get<std::string>());
  } else {
    parsed.target = TargetSpec::All();
  }
  *out = std::move(parsed);
  return true;
}

bool ParseCommandAck(const Message& message, CommandAckMessage* out,
                     std::string* error) {
  if (!out || !ExpectType(message, MessageType::kCommandAck, error)) {
    return false;
  }
  CommandAckMessage parsed;
  std::string action_text;
  if (!ReadString(message.body, "action", &action_text, error)) {
    return false;
  }
  if (!ParseCommandAction(action_text, &parsed.action)) {
    return Fail(error, "invalid action: " + action_text);
  }
  if (!ReadOptionalInt(message.body, "targetCount", &parsed.target_count, error) ||
      !ReadOptionalInt(message.body, "deliveredCount", &parsed.delivered_count,
                       error) ||
      !ReadOptionalInt64(message.body, "timestamp", &parsed.timestamp_ms, error)) {
    return false;
  }
  *out = parsed;
  return true;
}

bool ParseStatus(const Message& message, StatusMessage* out, std::string* error) {
  if (!out || !ExpectType(message, MessageType::kStatus, error)) {
    return false;
  }
  StatusMessage parsed;
  std::string state_text;
  if (!ReadOptionalString(message.body, "deviceId", &parsed.device_id, error) ||
      !ReadOptionalString(message.body, "deviceName", &parsed.device_name, error) ||
      !ReadString(message.body, "state", &state_text, error)) {
    return false;
  }
  if (!ParsePlaybackState(state_text, &parsed.playback.state)) {
    return Fail(error, "unknown playback state: " + state_text);
  }
  if (!ReadAliasedString(message.body, "currentMedia", "currentVideo",
                         &parsed.playback.current_media, error) ||
      !ReadOptionalBool(message.body, "immersiveMode", &parsed.playback.immersive,
                        error) ||
      !ReadOptionalInt64(message.body, "lastUpdate", &parsed.playback.last_update_ms,
                         error)) {
    return false;
  }
  const char* position_key =
      message.body.contains("positionSeconds") ? "positionSeconds" : "currentTime";
  if (!ReadOptionalDouble(message.body, position_key,
                          &parsed.playback.position_seconds, error)) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

bool ParseDeviceNotice(const Message& message, DeviceNotice* out,
                       std::string* error) {
  if (!out) {
    return false;
  }
  if (message.type != MessageType::kDeviceConnected &&
      message.type != MessageType::kDeviceDisconnected) {
    return Fail(error, std::string("expected device notice, got ") +
                           ToString(message.type));
  }
  DeviceNotice parsed;
  if (!ReadString(message.body, "deviceId", &parsed.device_id, error) ||
      !ReadOptionalString(message.body, "deviceName", &parsed.device_name, error)) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

bool ParseError(const Message& message, ErrorMessage* out, std::string* error) {
  if (!out || !ExpectType(message, MessageType::kError, error)) {
    return false;
  }
  ErrorMessage parsed;
  if (!ReadString(message.body, "message", &parsed.message, error) ||
      !ReadOptionalInt64(message.body, "timestamp", &parsed.timestamp_ms, error)) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

bool ParseDownload(const Message& message, DownloadMessage* out,
                   std::string* error) {
  if (!out || !ExpectType(message, MessageType::kDownload, error)) {
    return false;
  }
  DownloadMessage parsed;
  if (!ReadOptionalString(message.body, "transferId", &parsed.transfer_id, error) ||
      !ReadString(message.body, "filename", &parsed.filename, error) ||
      !ReadOptionalUint64(message.body, "fileSize", &parsed.file_size, error)) {
    return false;
  }
  // Older hubs sent a bare path instead of a full URL.
  if (!ReadAliasedString(message.body, "downloadUrl", "path", &parsed.download_url,
                         error)) {
    return false;
  }
  if (parsed.download_url.empty()) {
    return Fail(error, "missing or invalid field: downloadUrl");
  }
  *out = std::move(parsed);
  return true;
}

bool ParseTransferProgress(const Message& message, TransferProgressMessage* out,
                           std::string* error) {
  if (!out || !ExpectType(message, MessageType::kTransferProgress, error)) {
    return false;
  }
  TransferProgressMessage parsed;
  std::string status_text;
  if (!ReadOptionalString(message.body, "deviceId", &parsed.device_id, error) ||
      !ReadOptionalString(message.body, "transferId", &parsed.transfer_id, error) ||
      !ReadString(message.body, "filename", &parsed.filename, error) ||
      !ReadString(message.body, "status", &status_text, error)) {
    return false;
  }
  if (!ParseTransferStatus(status_text, &parsed.status)) {
    return Fail(error, "unknown transfer status: " + status_text);
  }
  if (!ReadOptionalDouble(message.body, "progress", &parsed.progress, error) ||
      !ReadOptionalUint64(message.body, "bytesTransferred",
                          &parsed.bytes_transferred, error) ||
      !ReadOptionalUint64(message.body, "totalBytes", &parsed.total_bytes, error) ||
      !ReadOptionalString(message.body, "error", &parsed.error, error)) {
    return false;
  }
  parsed.progress = std::min(1.0, std::max(0.0, parsed.progress));
  *out = std::move(parsed);
  return true;
}

bool ParseDeleteMedia(const Message& message, DeleteMediaMessage* out,
                      std::string* error) {
  if (!out || !ExpectType(message, MessageType::kDeleteMedia, error)) {
    return false;
  }
  DeleteMediaMessage parsed;
  if (!ReadString(message.body, "filename", &parsed.filename, error)) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

bool ParseDeleteMediaResult(const Message& message, DeleteMediaResultMessage* out,
                            std::string* error) {
  if (!out || !ExpectType(message, MessageType::kDeleteMediaResult, error)) {
    return false;
  }
  DeleteMediaResultMessage parsed;
  auto success = message.body.find("success");
  if (success == message.body.end() || !success->is_boolean()) {
    return Fail(error, "missing or invalid field: success");
  }
  parsed.success = success->get<bool>();
  if (!ReadOptionalString(message.body, "deviceId", &parsed.device_id, error) ||
      !ReadString(message.body, "filename", &parsed.filename, error) ||
      !ReadOptionalString(message.body, "message", &parsed.message, error)) {
    return false;
  }
  *out = std::move(parsed);
  return true;
}

bool ParseLocalMedia(const Message& message, LocalMediaMessage* out,
                     std::string* error) {
  if (!out || !ExpectType(message, MessageType::kLocalMedia, error)) {
    return false;
  }
  LocalMediaMessage parsed;
  if (!ReadOptionalString(message.body, "deviceId", &parsed.device_id, error)) {
    return false;
  }
  // Older players send the list under "videos".
  auto items = message.body.find("items");
  if (items == message.body.end()) {
    items = message.body.find("videos");
  }
  if (items == message.body.end() || !items->is_array()) {
    return Fail(error, "missing or invalid field: items");
  }
  for (const auto& entry : *items) {
    if (!entry.is_object()) {
      return Fail(error, "media entries must be objects");
    }
    MediaItem item;
    if (!ReadString(entry, "filename", &item.filename, error) ||
        !ReadOptionalUint64(entry, "size", &item.size, error) ||
        !ReadOptionalString(entry, "format", &item.format, error)) {
      return false;
    }
    parsed.items.push_back(std::move(item));
  }
  *out = std::move(parsed);
  return true;
}

}  // namespace playlink
