// src/audio/instrument.hpp
// Something that turns channel events into audio: the SoundFont synth in the
// app, a sine-tone double in the tests.
//
// Threading: once attached to a running device or graph, all calls except
// set_running() come from the audio thread.

#pragma once
#include <cstdint>

#include "midi/events.hpp"

namespace audio {

// Native output format: interleaved float32.
struct StreamFormat {
  std::uint32_t sampleRate = 44100;
  std::uint32_t channels = 2;
};

class Instrument {
public:
  virtual ~Instrument() = default;

  virtual void handle(const midi::ChannelEv &ev) = 0;
  virtual void all_notes_off() = 0;

  // Render `frames` interleaved frames into out (overwrites).
  virtual void render(float *out, std::uint32_t frames) = 0;

  virtual StreamFormat format() const = 0;

  // Called by the device/graph when it starts or stops pulling audio.
  virtual void set_running(bool running) { (void)running; }

  // Warm-up hook for a running device/graph (e.g. voice preallocation).
  virtual void prepare() {}
};

} // namespace audio
