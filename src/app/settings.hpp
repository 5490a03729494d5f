// src/app/settings.hpp
// Run-time knobs for one midiplay invocation. Filled by parse_cli(), then
// handed to the transport and bounce components.

#pragma once
#include <chrono>

#include "audio/instrument.hpp"
#include "audio/player.hpp"
#include "bounce/bouncer.hpp"
#include "common/log.hpp"
#include "transport/controller.hpp"

namespace app {

struct Settings {
  // Synth output, for live playback and as the bounce graph's native format.
  audio::StreamFormat processingFormat{};
  bounce::AudioFormat bounceFormat{};
  bounce::Pacing bouncePacing = bounce::Pacing::Offline;
  double preRollSeconds = 0.2;
  double postRollSeconds = 1.5;

  bool looseSoundBankMatching = false;
  bool cacophonyMode = false;
  audio::DeviceBackend backend = audio::DeviceBackend::System;
  common::LogLevel logLevel = common::LogLevel::Info;
};

inline transport::TransportOptions transport_options(const Settings &s) {
  transport::TransportOptions o;
  o.cacophonyMode = s.cacophonyMode;
  o.backend = s.backend;
  o.format = s.processingFormat;
  return o;
}

inline bounce::BounceOptions bounce_options(const Settings &s) {
  bounce::BounceOptions o;
  o.processing = s.processingFormat;
  o.destination = s.bounceFormat;
  o.pacing = s.bouncePacing;
  o.preRollSeconds = s.preRollSeconds;
  o.postRollSeconds = s.postRollSeconds;
  return o;
}

} // namespace app
