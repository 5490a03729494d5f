// src/app/console.hpp
// Console front-end pieces: a now-playing display, observers that print
// transport and bounce events, and a stdin line reader that posts commands
// to the main event loop.

#pragma once
#include <atomic>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

#include "bounce/bouncer.hpp"
#include "common/event_loop.hpp"
#include "transport/controller.hpp"
#include "transport/now_playing.hpp"

namespace app {

// Prints the now-playing record as a single refreshed status line.
class ConsoleNowPlaying : public transport::NowPlayingSink {
public:
  explicit ConsoleNowPlaying(std::ostream &out = std::cout) : out_(out) {}

  void make_active(const void *player) override { active_ = player; }
  void init_now_playing_info(const void *player,
                             const transport::NowPlayingInfo &info) override;
  void update_now_playing_info(const void *player,
                               const transport::NowPlayingUpdate &fields) override;
  void set_playback_state(transport::PlaybackStatus status) override;

private:
  void print_status();

  std::ostream &out_;
  const void *active_ = nullptr;
  transport::NowPlayingInfo info_;
  transport::PlaybackStatus status_ = transport::PlaybackStatus::Stopped;
  std::string shownTitle_;
};

// Ends the loop when playback ends.
class ConsoleTransportObserver : public transport::TransportObserver {
public:
  ConsoleTransportObserver(common::EventLoop &loop,
                           std::ostream &out = std::cout)
      : loop_(loop), out_(out) {}

  void files_loaded(
      const std::string &midi,
      const std::optional<std::filesystem::path> &soundBank) override;
  void playback_started(bool firstTime) override;
  void playback_stopped(bool paused) override;
  void playback_ended() override;
  void playback_speed_changed(float speed) override;

private:
  common::EventLoop &loop_;
  std::ostream &out_;
};

// Prints progress and ends the loop on the final outcome.
class ConsoleBounceObserver : public bounce::BounceObserver {
public:
  ConsoleBounceObserver(common::EventLoop &loop, std::ostream &out = std::cout)
      : loop_(loop), out_(out) {}

  void bounce_progress(double percent, double currentTime) override;
  void bounce_error(const bounce::RenderError &error) override;
  void bounce_completed() override;

  bool succeeded() const { return completed_; }
  bool cancelled() const { return cancelled_; }

private:
  common::EventLoop &loop_;
  std::ostream &out_;
  int shownPercent_ = -1;
  bool completed_ = false;
  bool cancelled_ = false;
};

// Reads stdin lines on a background thread and posts each one to `loop`.
// stop() returns within one poll period even if no input arrives.
class ConsoleInput {
public:
  using LineHandler = std::function<void(const std::string &)>;

  ConsoleInput(common::EventLoop &loop, LineHandler handler)
      : loop_(loop), handler_(std::move(handler)) {}
  ~ConsoleInput() { stop(); }

  ConsoleInput(const ConsoleInput &) = delete;
  ConsoleInput &operator=(const ConsoleInput &) = delete;

  void start();
  void stop();

private:
  void read_loop();

  common::EventLoop &loop_;
  LineHandler handler_;
  std::thread thread_;
  std::atomic<bool> stop_{false};
};

// Apply one console command to the transport. Returns false for "q".
//   p       toggle play/pause      s    stop
//   f / b   forward / back 5 s     g N  seek to N seconds
//   + / -   rate +/- 0.25          q    quit
bool handle_command(const std::string &line,
                    transport::TransportController &transport,
                    std::ostream &out = std::cout);

} // namespace app
