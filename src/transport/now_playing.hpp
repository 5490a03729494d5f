// src/transport/now_playing.hpp
// The OS "now playing" / media-remote facility, as seen by the transport.
// Injected into each controller; the console front-end prints it, tests
// record it.

#pragma once
#include <optional>
#include <string>

namespace transport {

enum class PlaybackStatus { Playing, Paused, Stopped };

const char *to_string(PlaybackStatus status);

// Full metadata snapshot for the player.
struct NowPlayingInfo {
  std::string title;
  std::string soundBank; // empty for the default bank
  double elapsed = 0.0;  // native seconds
  double duration = 0.0; // native seconds
  float rate = 1.0f;
};

// Partial update: only the set fields change.
struct NowPlayingUpdate {
  std::optional<double> elapsed;
  std::optional<float> rate;
};

class NowPlayingSink {
public:
  virtual ~NowPlayingSink() = default;

  // `player` identifies the publishing controller; it is never dereferenced.
  virtual void make_active(const void *player) = 0;
  virtual void init_now_playing_info(const void *player,
                                     const NowPlayingInfo &info) = 0;
  virtual void update_now_playing_info(const void *player,
                                       const NowPlayingUpdate &fields) = 0;
  virtual void set_playback_state(PlaybackStatus status) = 0;
};

} // namespace transport
