// src/audio/schedule.cpp

#include "audio/schedule.hpp"

namespace audio {

void Schedule::seek(double tSec, Instrument &inst) {
  inst.all_notes_off();
  next_ = 0;
  while (next_ < events_->size() && (*events_)[next_].tSec < tSec) {
    const auto &ev = (*events_)[next_].ev;
    if (!midi::is_note(ev))
      inst.handle(ev); // chase controllers, skip notes
    ++next_;
  }
}

void Schedule::dispatch_until(double tSec, Instrument &inst) {
  while (next_ < events_->size() && (*events_)[next_].tSec < tSec) {
    inst.handle((*events_)[next_].ev);
    ++next_;
  }
}

} // namespace audio
