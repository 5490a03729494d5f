// src/audio/schedule.hpp
// Cursor over a sequence timeline that feeds events into an instrument as
// playback time advances. Used from the audio thread only; the owner routes
// seeks through it there.

#pragma once
#include <cstddef>
#include <vector>

#include "audio/instrument.hpp"
#include "midi/sequence.hpp"

namespace audio {

class Schedule {
public:
  explicit Schedule(const midi::Sequence &sequence)
      : events_(&sequence.timeline()) {}

  // Jump to tSec: silence sounding notes, replay program/controller/bend
  // state from before tSec (so instruments and volumes are right), and
  // position the cursor on the first event at or after tSec.
  void seek(double tSec, Instrument &inst);

  // Apply every event with time < tSec.
  void dispatch_until(double tSec, Instrument &inst);

  bool exhausted() const { return next_ >= events_->size(); }
  std::size_t next_index() const { return next_; }

private:
  const std::vector<midi::TimedEvent> *events_;
  std::size_t next_ = 0;
};

} // namespace audio
