#include "playlink/types.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <utility>

namespace playlink {
namespace {

constexpr std::array<const char*, 8> kVideoFormats = {
    "mono2d",           "sbs3d",     "ou3d",        "hemisphere180",
    "hemisphere180sbs", "sphere360", "sphere360ou", "sphere360sbs",
};

}  // namespace

const char* ToString(Role role) {
  switch (role) {
    case Role::kController:
      return "controller";
    case Role::kPlayer:
      return "player";
  }
  return "player";
}

const char* ToString(PlaybackState state) {
  switch (state) {
    case PlaybackState::kIdle:
      return "idle";
    case PlaybackState::kLoading:
      return "loading";
    case PlaybackState::kPlaying:
      return "playing";
    case PlaybackState::kPaused:
      return "paused";
    case PlaybackState::kStopped:
      return "stopped";
    case PlaybackState::kError:
      return "error";
  }
  return "error";
}

const char* ToString(CommandAction action) {
  switch (action) {
    case CommandAction::kPlay:
      return "play";
    case CommandAction::kPause:
      return "pause";
    case CommandAction::kResume:
      return "resume";
    case CommandAction::kChange:
      return "change";
    case CommandAction::kStop:
      return "stop";
    case CommandAction::kDownload:
      return "download";
    case CommandAction::kDeleteMedia:
      return "deleteMedia";
  }
  return "stop";
}

const char* ToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::kStarted:
      return "started";
    case TransferStatus::kDownloading:
      return "downloading";
    case TransferStatus::kCompleted:
      return "completed";
    case TransferStatus::kFailed:
      return "failed";
  }
  return "failed";
}

bool ParseRole(const std::string& text, Role* out) {
  if (!out) {
    return false;
  }
  if (text == "controller") {
    *out = Role::kController;
    return true;
  }
  // Older players register as "visionpro".
  if (text == "player" || text == "visionpro") {
    *out = Role::kPlayer;
    return true;
  }
  return false;
}

bool ParsePlaybackState(const std::string& text, PlaybackState* out) {
  if (!out) {
    return false;
  }
  static const std::pair<const char*, PlaybackState> kStates[] = {
      {"idle", PlaybackState::kIdle},       {"loading", PlaybackState::kLoading},
      {"playing", PlaybackState::kPlaying}, {"paused", PlaybackState::kPaused},
      {"stopped", PlaybackState::kStopped}, {"error", PlaybackState::kError},
  };
  for (const auto& entry : kStates) {
    if (text == entry.first) {
      *out = entry.second;
      return true;
    }
  }
  return false;
}

bool ParseCommandAction(const std::string& text, CommandAction* out) {
  if (!out) {
    return false;
  }
  static const std::pair<const char*, CommandAction> kActions[] = {
      {"play", CommandAction::kPlay},
      {"pause", CommandAction::kPause},
      {"resume", CommandAction::kResume},
      {"change", CommandAction::kChange},
      {"stop", CommandAction::kStop},
      {"download", CommandAction::kDownload},
      {"deleteMedia", CommandAction::kDeleteMedia},
  };
  for (const auto& entry : kActions) {
    if (text == entry.first) {
      *out = entry.second;
      return true;
    }
  }
  return false;
}

bool ParseTransferStatus(const std::string& text, TransferStatus* out) {
  if (!out) {
    return false;
  }
  if (text == "started") {
    *out = TransferStatus::kStarted;
  } else if (text == "downloading") {
    *out = TransferStatus::kDownloading;
  } else if (text == "completed") {
    *out = TransferStatus::kCompleted;
  } else if (text == "failed") {
    *out = TransferStatus::kFailed;
  } else {
    return false;
  }
  return true;
}

bool IsValidVideoFormat(const std::string& format) {
  return std::find_if(kVideoFormats.begin(), kVideoFormats.end(),
                      [&](const char* name) { return format == name; }) !=
         kVideoFormats.end();
}

int64_t NowMillis() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

TargetSpec TargetSpec::All() {
  return TargetSpec{};
}

TargetSpec TargetSpec::List(std::vector<std::string> ids) {
  TargetSpec spec;
  spec.kind = Kind::kList;
  spec.ids = std::move(ids);
  return spec;
}

TargetSpec TargetSpec::Single(std::string id) {
  TargetSpec spec;
  spec.kind = Kind::kSingle;
  spec.ids.push_back(std::move(id));
  return spec;
}

}  // namespace playlink
