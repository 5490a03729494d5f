// src/midi/sequence.cpp

#include "midi/sequence.hpp"
#include "midi/tempo.hpp"

#include <algorithm>
#include <stdexcept>

namespace {

int order_rank(midi::EvType t) {
  switch (t) {
  case midi::EvType::NoteOff:
    return 1;
  case midi::EvType::NoteOn:
    return 2;
  default:
    return 0;
  }
}

} // namespace

namespace midi {

Sequence::Sequence(Song song) : song_(std::move(song)) {
  tempo_ = build_tempo_map(song_);

  timeline_.reserve(song_.events.size());
  for (const auto &ev : song_.events)
    timeline_.push_back(TimedEvent{ticks_to_seconds(ev.tick, tempo_), ev});
  std::stable_sort(timeline_.begin(), timeline_.end(),
                   [](const TimedEvent &a, const TimedEvent &b) {
                     if (a.tSec != b.tSec)
                       return a.tSec < b.tSec;
                     return order_rank(a.ev.type) < order_rank(b.ev.type);
                   });

  for (std::size_t i = 0; i < song_.tracks.size(); ++i) {
    const double end = track_end_seconds(i);
    length_ = length_ ? std::max(*length_, end) : end;
  }
}

double Sequence::track_end_seconds(std::size_t trackIndex) const {
  if (trackIndex >= song_.tracks.size())
    throw std::out_of_range("track index out of range");
  return ticks_to_seconds(song_.tracks[trackIndex].endTick, tempo_);
}

} // namespace midi
