// tests/test_instrument.hpp
// Sine-tone Instrument double: one partial per sounding note, no sound bank
// needed. Counters are atomics so tests can read them while a device or
// graph is pulling audio.

#pragma once
#include <atomic>
#include <cmath>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <utility>

#include "audio/instrument.hpp"

namespace midiplay_test {

class ToneInstrument : public audio::Instrument {
public:
  explicit ToneInstrument(audio::StreamFormat format = {}) : format_(format) {}

  void handle(const midi::ChannelEv &ev) override {
    ++eventsHandled;
    if (ev.type == midi::EvType::NoteOn) {
      ++noteOns;
      active_.insert({ev.ch, ev.data1});
    } else if (ev.type == midi::EvType::NoteOff) {
      active_.erase({ev.ch, ev.data1});
    }
  }

  void all_notes_off() override {
    ++allNotesOff;
    active_.clear();
  }

  void render(float *out, std::uint32_t frames) override {
    framesRendered += frames;
    const double twoPi = 6.283185307179586;
    for (std::uint32_t i = 0; i < frames; ++i) {
      double v = 0.0;
      for (const auto &note : active_) {
        const double hz = 440.0 * std::pow(2.0, (note.second - 69) / 12.0);
        v += 0.1 * std::sin(twoPi * hz * phase_ / format_.sampleRate);
      }
      ++phase_;
      for (std::uint32_t c = 0; c < format_.channels; ++c)
        out[i * format_.channels + c] = static_cast<float>(v);
    }
  }

  audio::StreamFormat format() const override { return format_; }

  void set_running(bool r) override { running = r; }
  void prepare() override {
    if (failPrepare)
      throw std::runtime_error("sample preload failed");
    ++prepared;
  }

  std::atomic<int> eventsHandled{0};
  std::atomic<int> noteOns{0};
  std::atomic<int> allNotesOff{0};
  std::atomic<int> prepared{0};
  std::atomic<bool> running{false};
  std::atomic<std::uint64_t> framesRendered{0};
  bool failPrepare = false;

private:
  audio::StreamFormat format_;
  std::set<std::pair<int, int>> active_;
  std::uint64_t phase_ = 0;
};

} // namespace midiplay_test
