// src/transport/now_playing.cpp

#include "transport/now_playing.hpp"

namespace transport {

const char *to_string(PlaybackStatus status) {
  switch (status) {
  case PlaybackStatus::Playing:
    return "playing";
  case PlaybackStatus::Paused:
    return "paused";
  case PlaybackStatus::Stopped:
    return "stopped";
  }
  return "?";
}

} // namespace transport
