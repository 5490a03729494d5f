// src/audio/playback_engine.hpp
// The sequence playback engine the transport drives. The live implementation
// is SequencePlayer; tests substitute a scripted fake.
//
// Times are in the sequence's native (rate-independent) seconds.

#pragma once
#include <functional>

namespace audio {

class PlaybackEngine {
public:
  using CompletionHandler = std::function<void()>;

  virtual ~PlaybackEngine() = default;

  // Prime the engine for a fast start. Idempotent.
  virtual void prepare_to_play() = 0;

  // Start (or resume) from current_position(). `onComplete` runs once when
  // playback reaches the end on its own; it may be called from an audio
  // thread and must only hand off.
  virtual void play(CompletionHandler onComplete) = 0;

  // Stop without moving the position.
  virtual void stop() = 0;

  virtual double current_position() const = 0;
  virtual void set_current_position(double seconds) = 0;
  virtual double duration() const = 0;

  virtual float rate() const = 0;
  virtual void set_rate(float rate) = 0;

  virtual bool is_playing() const = 0;
};

} // namespace audio
