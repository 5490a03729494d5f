// src/midi/sequence.hpp
// A parsed song placed on a seconds timeline, ready for playback.
//
// The timeline is sorted by time. At identical times controller-type events
// (program, CC, pitch bend) come first, then NoteOff, then NoteOn, so a
// re-struck note is released before it is played again.

#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "midi/events.hpp"

namespace midi {

struct TimedEvent {
  double tSec; // native (rate-independent) seconds
  ChannelEv ev;
};

class Sequence {
public:
  explicit Sequence(Song song);

  const Song &song() const { return song_; }
  const TempoMap &tempo() const { return tempo_; }
  const std::vector<TimedEvent> &timeline() const { return timeline_; }
  std::size_t track_count() const { return song_.tracks.size(); }

  // Maximum over tracks of (track length + track start offset), in seconds.
  // Empty when the song has no tracks.
  std::optional<double> length_seconds() const { return length_; }

  // Seconds of one track's end (offset + length).
  double track_end_seconds(std::size_t trackIndex) const;

private:
  Song song_;
  TempoMap tempo_;
  std::vector<TimedEvent> timeline_;
  std::optional<double> length_;
};

} // namespace midi
