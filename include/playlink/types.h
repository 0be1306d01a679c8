#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace playlink {

/**
 * Well-known hub ports.
 */
constexpr uint16_t kDefaultHubPort = 8080;
constexpr uint16_t kDefaultHttpPort = 8081;
/// UDP port hub announcements are broadcast to.
constexpr uint16_t kDefaultAnnouncePort = 8082;

/**
 * Protocol limits and defaults shared by hub and clients.
 */
constexpr size_t kMaxFrameBytes = 10 * 1024 * 1024;
constexpr size_t kDefaultChunkSize = 1024 * 1024;
constexpr const char* kServerVersion = "1.0.0";

/// Sink for diagnostic messages; defaults to stderr when unset.
using LogCallback = std::function<void(const std::string&)>;

/**
 * Role a participant registers with.
 */
enum class Role {
  kController,
  kPlayer,
};

/**
 * Playback states reported by players.
 */
enum class PlaybackState {
  kIdle,
  kLoading,
  kPlaying,
  kPaused,
  kStopped,
  kError,
};

/**
 * Actions a controller may issue to players.
 */
enum class CommandAction {
  kPlay,
  kPause,
  kResume,
  kChange,
  kStop,
  kDownload,
  kDeleteMedia,
};

/**
 * Status values carried by transferProgress reports.
 */
enum class TransferStatus {
  kStarted,
  kDownloading,
  kCompleted,
  kFailed,
};

const char* ToString(Role role);
const char* ToString(PlaybackState state);
const char* ToString(CommandAction action);
const char* ToString(TransferStatus status);

bool ParseRole(const std::string& text, Role* out);
bool ParsePlaybackState(const std::string& text, PlaybackState* out);
bool ParseCommandAction(const std::string& text, CommandAction* out);
bool ParseTransferStatus(const std::string& text, TransferStatus* out);

/// True if `format` names one of the supported projection/stereo layouts.
bool IsValidVideoFormat(const std::string& format);

/// Current wall-clock time as Unix milliseconds.
int64_t NowMillis();

/**
 * Last-known playback state of a player.
 */
struct PlaybackSnapshot {
  PlaybackState state = PlaybackState::kIdle;
  /// Media reference currently loaded (URL or filename), empty if none.
  std::string current_media;
  /// Whether the player is presenting in immersive mode.
  bool immersive = false;
  /// Playback position in seconds.
  double position_seconds = 0.0;
  /// Unix milliseconds of the last update.
  int64_t last_update_ms = 0;
};

/**
 * A media file stored on a player.
 */
struct MediaItem {
  std::string filename;
  uint64_t size = 0;
  std::string format;
};

/**
 * Command addressing: every player, an explicit id list, or one id.
 */
struct TargetSpec {
  enum class Kind {
    kAll,
    kList,
    kSingle,
  };

  Kind kind = Kind::kAll;
  std::vector<std::string> ids;

  static TargetSpec All();
  static TargetSpec List(std::vector<std::string> ids);
  static TargetSpec Single(std::string id);
};

/**
 * Fire-and-forget instruction from a controller to players.
 */
struct Command {
  CommandAction action = CommandAction::kStop;
  /// Media reference (URL, filename, or source path for downloads).
  std::string media_ref;
  /// Optional playback URL.
  std::string url;
  /// Optional video format, see IsValidVideoFormat().
  std::string format;
  TargetSpec target;
  int64_t timestamp_ms = 0;
};

}  // namespace playlink
