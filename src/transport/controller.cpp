// src/transport/controller.cpp

#include "transport/controller.hpp"

#include "audio/synth.hpp"
#include "common/errors.hpp"
#include "common/util.hpp"
#include "midi/sequence.hpp"

#include <cmath>
#include <exception>

namespace transport {

using common::ErrorKind;
using common::PlaybackError;

const char *to_string(TransportState state) {
  switch (state) {
  case TransportState::Stopped:
    return "stopped";
  case TransportState::Playing:
    return "playing";
  case TransportState::Paused:
    return "paused";
  }
  return "?";
}

std::unique_ptr<TransportController>
TransportController::load(const midi::SequenceSource &source,
                          NowPlayingSink &nowPlaying, common::EventLoop &loop,
                          const common::Logger &log, TransportOptions options) {
  const std::string name = source.display_name();

  midi::Song song;
  try {
    song = midi::load_song(source);
  } catch (const std::exception &) {
    throw PlaybackError(ErrorKind::LoadFailure,
                        "Can't open MIDI data " + name,
                        std::current_exception());
  }

  std::optional<io::ScopedFileAccess> access;
  std::unique_ptr<audio::SoundFontSynth> synth;
  try {
    if (source.soundBank)
      access.emplace(*source.soundBank);
    synth = std::make_unique<audio::SoundFontSynth>(source.soundBank,
                                                   options.format);
  } catch (const std::exception &) {
    throw PlaybackError(ErrorKind::LoadFailure, "Can't open sound bank",
                        std::current_exception());
  }
  log.debug("sound bank: " + synth->sound_bank().string());

  std::unique_ptr<audio::PlaybackEngine> engine;
  try {
    engine = std::make_unique<audio::SequencePlayer>(
        midi::Sequence(std::move(song)), std::move(synth), options.backend);
  } catch (const std::exception &) {
    throw PlaybackError(ErrorKind::LoadFailure, "Can't open audio output",
                        std::current_exception());
  }

  return std::make_unique<TransportController>(
      std::move(engine), name, source.soundBank, std::move(access), nowPlaying,
      loop, log, options);
}

TransportController::TransportController(
    std::unique_ptr<audio::PlaybackEngine> engine, std::string midiName,
    std::optional<std::filesystem::path> soundBank,
    std::optional<io::ScopedFileAccess> soundBankAccess,
    NowPlayingSink &nowPlaying, common::EventLoop &loop,
    const common::Logger &log, TransportOptions options)
    : engine_(std::move(engine)), midiName_(std::move(midiName)),
      soundBank_(std::move(soundBank)),
      soundBankAccess_(std::move(soundBankAccess)), nowPlaying_(nowPlaying),
      loop_(loop), log_(log), options_(options) {
  log_.debug("transport: loaded " + midiName_);
}

TransportController::~TransportController() {
  stop_report_timer();
  engine_->stop();
  log_.debug("transport: released " + midiName_);
}

bool TransportController::near_end() const {
  return current_position() >= duration() - kEndOfTrackTolerance;
}

bool TransportController::is_at_end_of_track() const {
  return !is_playing() && near_end();
}

TransportState TransportController::state() const {
  if (is_playing())
    return TransportState::Playing;
  // Parked at the start counts as stopped, anywhere else as paused.
  if (is_at_end_of_track() || current_position() == 0.0)
    return TransportState::Stopped;
  return TransportState::Paused;
}

void TransportController::set_position(double seconds) {
  engine_->set_current_position(seconds);
  if (observer_)
    observer_->playback_position_changed(current_position(), duration());
}

NowPlayingInfo TransportController::now_playing_info() const {
  NowPlayingInfo info;
  info.title = midiName_;
  info.soundBank = soundBank_ ? soundBank_->filename().string() : "";
  info.elapsed = current_position();
  info.duration = duration();
  info.rate = rate();
  return info;
}

void TransportController::prepare_to_play() {
  engine_->prepare_to_play();
  if (observer_)
    observer_->files_loaded(midiName_, soundBank_);
}

void TransportController::play() {
  if (!acceptsMediaKeys_)
    return;

  nowPlaying_.make_active(this);

  if (near_end())
    set_position(0.0);

  const bool firstTime = current_position() == 0.0;
  if (observer_)
    observer_->playback_will_start(firstTime);

  // The engine may finish on its audio thread; hop back onto the loop and
  // make sure we still exist when the task runs.
  std::weak_ptr<int> alive = alive_;
  common::EventLoop *loop = &loop_;
  engine_->play([this, alive, loop]() {
    loop->post([this, alive]() {
      if (alive.lock())
        on_engine_completed();
    });
  });

  start_report_timer();

  if (!options_.cacophonyMode) {
    nowPlaying_.init_now_playing_info(this, now_playing_info());
    nowPlaying_.set_playback_state(PlaybackStatus::Playing);
  }

  if (observer_)
    observer_->playback_started(firstTime);
}

void TransportController::on_engine_completed() {
  if (!near_end())
    return;
  stop_report_timer();
  nowPlaying_.set_playback_state(PlaybackStatus::Stopped);
  log_.debug("transport: reached end of " + midiName_);
  if (observer_)
    observer_->playback_ended();
}

void TransportController::pause() {
  if (!acceptsMediaKeys_)
    return;

  engine_->stop();
  stop_report_timer();
  nowPlaying_.set_playback_state(PlaybackStatus::Paused);
  if (observer_)
    observer_->playback_stopped(true);
}

void TransportController::stop() {
  if (!acceptsMediaKeys_)
    return;

  engine_->stop();
  stop_report_timer();
  set_position(0.0);
  nowPlaying_.set_playback_state(PlaybackStatus::Stopped);
  if (observer_)
    observer_->playback_stopped(false);
}

void TransportController::seek(double seconds) {
  if (!acceptsMediaKeys_)
    return;
  set_position(clamp_seconds(seconds, duration()));
}

void TransportController::rewind(double seconds) {
  if (!acceptsMediaKeys_)
    return;
  set_position(clamp_seconds(current_position() - seconds, duration()));
}

void TransportController::fast_forward(double seconds) {
  if (!acceptsMediaKeys_)
    return;
  set_position(clamp_seconds(current_position() + seconds, duration()));
}

void TransportController::toggle_play_pause() {
  if (!acceptsMediaKeys_) {
    log_.debug("transport: media keys are not accepted");
    return;
  }

  if (is_paused() || is_at_end_of_track()) {
    play();
  } else if (is_playing()) {
    pause();
  } else {
    stop();
  }
}

void TransportController::set_rate(float rate) {
  if (!std::isfinite(rate) || !(rate > 0.0f)) {
    throw PlaybackError(ErrorKind::InvalidRate,
                        "Playback rate must be positive, got " +
                            std::to_string(rate));
  }
  engine_->set_rate(rate);

  NowPlayingUpdate fields;
  fields.rate = this->rate();
  nowPlaying_.update_now_playing_info(this, fields);
  if (observer_)
    observer_->playback_speed_changed(this->rate());
}

void TransportController::start_report_timer() {
  stop_report_timer();
  reportTimer_ = loop_.schedule_repeating(
      common::EventLoop::Seconds(kReportPeriod),
      common::EventLoop::Seconds(kReportTolerance), [this]() { report_tick(); });
}

void TransportController::stop_report_timer() {
  if (reportTimer_) {
    loop_.cancel_timer(*reportTimer_);
    reportTimer_.reset();
  }
}

void TransportController::report_tick() {
  // The OS now-playing cache drifts quickly, so publish the whole record
  // every tick rather than trusting it to extrapolate.
  nowPlaying_.init_now_playing_info(this, now_playing_info());
  NowPlayingUpdate fields;
  fields.elapsed = current_position();
  nowPlaying_.update_now_playing_info(this, fields);

  if (observer_)
    observer_->playback_position_changed(current_position(), duration());
}

} // namespace transport
