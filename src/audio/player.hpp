// src/audio/player.hpp
// Live MIDI playback: an Instrument (usually the TinySoundFont synth) fed by
// a Schedule inside a miniaudio playback device callback.
//
// Design notes:
// - The device runs from construction to destruction and renders silence
//   (plus release tails) while stopped, so play() starts instantly.
// - The device callback owns the instrument and the schedule. The control
//   thread only touches atomics: position, pending seek, rate, playing and a
//   silence request.
// - The playback rate scales sequence time only; pitch is unaffected.

#pragma once
#include <atomic>
#include <memory>

#include "miniaudio.h"

#include "audio/instrument.hpp"
#include "audio/playback_engine.hpp"
#include "audio/schedule.hpp"
#include "midi/sequence.hpp"

namespace audio {

enum class DeviceBackend {
  System, // the platform's default audio backend
  Null,   // miniaudio's null device: real-time clock, no sound card
};

class SequencePlayer : public PlaybackEngine {
public:
  // Throws std::runtime_error on device errors.
  SequencePlayer(midi::Sequence sequence,
                 std::unique_ptr<Instrument> instrument,
                 DeviceBackend backend = DeviceBackend::System);
  ~SequencePlayer() override;

  SequencePlayer(const SequencePlayer &) = delete;
  SequencePlayer &operator=(const SequencePlayer &) = delete;

  void prepare_to_play() override;
  void play(CompletionHandler onComplete) override;
  void stop() override;

  double current_position() const override { return position_.load(); }
  void set_current_position(double seconds) override;
  double duration() const override { return duration_; }

  float rate() const override { return rate_.load(); }
  void set_rate(float rate) override { rate_.store(rate); }

  bool is_playing() const override { return playing_.load(); }

  const midi::Sequence &sequence() const { return sequence_; }

private:
  static void data_callback(ma_device *device, void *pOutput,
                            const void *pInput, ma_uint32 frameCount);
  void render(float *out, ma_uint32 frames);
  void release_device();

  midi::Sequence sequence_;
  std::unique_ptr<Instrument> instrument_;
  Schedule schedule_; // points into sequence_
  double duration_ = 0.0;
  std::uint32_t sampleRate_ = 44100;

  ma_context context_{};
  ma_device device_{};
  bool contextReady_ = false;
  bool deviceReady_ = false;

  std::atomic<double> position_{0.0};
  std::atomic<double> pendingSeek_{-1.0}; // < 0: none
  std::atomic<float> rate_{1.0f};
  std::atomic<bool> playing_{false};
  std::atomic<bool> silence_{false};
  std::shared_ptr<const CompletionHandler> completion_; // atomic_load/store
};

} // namespace audio
