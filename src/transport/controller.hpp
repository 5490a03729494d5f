// src/transport/controller.hpp
// Rate-aware transport over one loaded sequence.
//
// The controller wraps a PlaybackEngine and adds:
//  - the play / pause / stop / seek state machine, with the state derived
//    from the engine's is_playing + position (never stored separately);
//  - a 0.125 s report timer on the event loop that re-publishes now-playing
//    info and position while playing;
//  - observer notifications, all delivered on the event loop thread.
//
// Transport intents are no-ops while media keys are not accepted.
// Everything here must be called on the thread that drives `loop`.

#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "audio/playback_engine.hpp"
#include "audio/player.hpp"
#include "common/event_loop.hpp"
#include "common/log.hpp"
#include "io/file_access.hpp"
#include "midi/source.hpp"
#include "transport/now_playing.hpp"

namespace transport {

enum class TransportState { Stopped, Playing, Paused };

const char *to_string(TransportState state);

class TransportObserver {
public:
  virtual ~TransportObserver() = default;

  virtual void files_loaded(const std::string &midi,
                            const std::optional<std::filesystem::path> &soundBank) {
    (void)midi;
    (void)soundBank;
  }
  virtual void playback_will_start(bool firstTime) { (void)firstTime; }
  virtual void playback_started(bool firstTime) { (void)firstTime; }
  virtual void playback_position_changed(double position, double duration) {
    (void)position;
    (void)duration;
  }
  virtual void playback_stopped(bool paused) { (void)paused; }
  virtual void playback_ended() {}
  virtual void playback_speed_changed(float speed) { (void)speed; }
};

struct TransportOptions {
  // Leave the now-playing state alone when playback starts (several players
  // sounding at once).
  bool cacophonyMode = false;
  audio::DeviceBackend backend = audio::DeviceBackend::System;
  audio::StreamFormat format{};
};

class TransportController {
public:
  static constexpr double kEndOfTrackTolerance = 0.1;
  static constexpr double kReportPeriod = 0.125;
  static constexpr double kReportTolerance = kReportPeriod / 8;

  // Build a controller around the live SoundFont engine. Throws
  // common::PlaybackError(LoadFailure) when the MIDI data, the sound bank or
  // the audio device cannot be opened.
  static std::unique_ptr<TransportController>
  load(const midi::SequenceSource &source, NowPlayingSink &nowPlaying,
       common::EventLoop &loop, const common::Logger &log,
       TransportOptions options = {});

  TransportController(std::unique_ptr<audio::PlaybackEngine> engine,
                      std::string midiName,
                      std::optional<std::filesystem::path> soundBank,
                      std::optional<io::ScopedFileAccess> soundBankAccess,
                      NowPlayingSink &nowPlaying, common::EventLoop &loop,
                      const common::Logger &log, TransportOptions options = {});
  ~TransportController();

  TransportController(const TransportController &) = delete;
  TransportController &operator=(const TransportController &) = delete;

  // Non-owning; pass nullptr to detach.
  void set_observer(TransportObserver *observer) { observer_ = observer; }

  void prepare_to_play();
  void play();
  void pause();
  void stop();
  void seek(double seconds);
  void rewind(double seconds);
  void fast_forward(double seconds);
  void toggle_play_pause();

  // Throws common::PlaybackError(InvalidRate) for rate <= 0 or non-finite.
  void set_rate(float rate);
  float rate() const { return engine_->rate(); }

  double current_position() const { return engine_->current_position(); }
  double duration() const { return engine_->duration(); }
  double real_position() const { return current_position() / rate(); }
  double real_duration() const { return duration() / rate(); }

  bool is_playing() const { return engine_->is_playing(); }
  bool is_at_end_of_track() const;
  // Raw predicate: not playing and not at the end. Also true when stopped at
  // position 0, which state() reports as Stopped.
  bool is_paused() const { return !is_playing() && !is_at_end_of_track(); }
  TransportState state() const;

  bool accepts_media_keys() const { return acceptsMediaKeys_; }
  void set_accepts_media_keys(bool accept) { acceptsMediaKeys_ = accept; }

  const std::string &midi_name() const { return midiName_; }
  const std::optional<std::filesystem::path> &sound_bank() const {
    return soundBank_;
  }
  bool holds_sound_bank_access() const {
    return soundBankAccess_ && soundBankAccess_->held();
  }

private:
  void set_position(double seconds);
  void start_report_timer();
  void stop_report_timer();
  void report_tick();
  void on_engine_completed();
  NowPlayingInfo now_playing_info() const;
  bool near_end() const;

  std::unique_ptr<audio::PlaybackEngine> engine_;
  std::string midiName_;
  std::optional<std::filesystem::path> soundBank_;
  std::optional<io::ScopedFileAccess> soundBankAccess_;
  NowPlayingSink &nowPlaying_;
  common::EventLoop &loop_;
  const common::Logger &log_;
  TransportOptions options_;

  TransportObserver *observer_ = nullptr;
  bool acceptsMediaKeys_ = true;
  std::optional<common::EventLoop::TimerId> reportTimer_;

  // Posted completions check this before touching the controller.
  std::shared_ptr<int> alive_ = std::make_shared<int>(0);
};

} // namespace transport
