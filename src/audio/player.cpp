// src/audio/player.cpp
// Turn a parsed sequence into sound with an Instrument + miniaudio.
// This translation unit carries the miniaudio implementation.

#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"

#include "audio/player.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace audio {

SequencePlayer::SequencePlayer(midi::Sequence sequence,
                               std::unique_ptr<Instrument> instrument,
                               DeviceBackend backend)
    : sequence_(std::move(sequence)), instrument_(std::move(instrument)),
      schedule_(sequence_) {
  if (!instrument_)
    throw std::invalid_argument("SequencePlayer needs an instrument");

  duration_ = sequence_.length_seconds().value_or(0.0);
  const StreamFormat fmt = instrument_->format();
  sampleRate_ = fmt.sampleRate;

  ma_backend nullBackend[] = {ma_backend_null};
  const bool useNull = backend == DeviceBackend::Null;
  if (ma_context_init(useNull ? nullBackend : nullptr, useNull ? 1 : 0,
                      nullptr, &context_) != MA_SUCCESS) {
    throw std::runtime_error("Failed to initialise audio context");
  }
  contextReady_ = true;

  ma_device_config config = ma_device_config_init(ma_device_type_playback);
  config.playback.format = ma_format_f32; // matches Instrument::render
  config.playback.channels = fmt.channels;
  config.sampleRate = fmt.sampleRate;
  config.dataCallback = data_callback;
  config.pUserData = this;

  if (ma_device_init(&context_, &config, &device_) != MA_SUCCESS) {
    release_device();
    throw std::runtime_error("Failed to open playback device");
  }
  deviceReady_ = true;

  instrument_->set_running(true);
  if (ma_device_start(&device_) != MA_SUCCESS) {
    release_device();
    throw std::runtime_error("Failed to start playback device");
  }
}

SequencePlayer::~SequencePlayer() { release_device(); }

void SequencePlayer::release_device() {
  // ma_device_uninit stops the device and waits for the callback to return.
  if (deviceReady_) {
    ma_device_uninit(&device_);
    deviceReady_ = false;
  }
  instrument_->set_running(false);
  if (contextReady_) {
    ma_context_uninit(&context_);
    contextReady_ = false;
  }
}

void SequencePlayer::data_callback(ma_device *device, void *pOutput,
                                   const void * /*pInput*/,
                                   ma_uint32 frameCount) {
  auto *self = static_cast<SequencePlayer *>(device->pUserData);
  self->render(static_cast<float *>(pOutput), frameCount);
}

// Real-time callback: apply control requests, feed events up to the end of
// this buffer, then render.
void SequencePlayer::render(float *out, ma_uint32 frames) {
  const double seek = pendingSeek_.exchange(-1.0);
  if (seek >= 0.0)
    schedule_.seek(seek, *instrument_);
  if (silence_.exchange(false))
    instrument_->all_notes_off();

  if (playing_.load(std::memory_order_acquire)) {
    const double t0 = seek >= 0.0 ? seek : position_.load();
    const double dt = static_cast<double>(frames) / sampleRate_ * rate_.load();
    double t1 = t0 + dt;
    schedule_.dispatch_until(t1, *instrument_);

    const bool finished = t1 >= duration_;
    if (finished)
      t1 = duration_;

    // A seek that landed while we rendered wins over this advance.
    double expected = t0;
    if (!position_.compare_exchange_strong(expected, t1) && seek >= 0.0)
      position_.store(t1);

    if (finished) {
      bool wasPlaying = true;
      if (playing_.compare_exchange_strong(wasPlaying, false)) {
        auto handler = std::atomic_load(&completion_);
        if (handler && *handler)
          (*handler)();
      }
    }
  }

  instrument_->render(out, frames);
}

void SequencePlayer::prepare_to_play() {
  instrument_->prepare();
  pendingSeek_.store(position_.load());
}

void SequencePlayer::play(CompletionHandler onComplete) {
  std::atomic_store(&completion_, std::make_shared<const CompletionHandler>(
                                      std::move(onComplete)));
  // Re-sync the cursor and controller state with the current position.
  pendingSeek_.store(position_.load());
  playing_.store(true, std::memory_order_release);
}

void SequencePlayer::stop() {
  playing_.store(false);
  silence_.store(true);
}

void SequencePlayer::set_current_position(double seconds) {
  const double p = std::min(std::max(seconds, 0.0), duration_);
  // Order matters: the callback must see the seek before the new position.
  pendingSeek_.store(p);
  position_.store(p);
}

} // namespace audio
