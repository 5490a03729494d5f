// src/app/console.cpp

#include "app/console.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace app {

namespace {

constexpr double kSkipSeconds = 5.0;
constexpr float kRateStep = 0.25f;
constexpr float kMinRate = 0.25f;
constexpr int kPollMs = 100;

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

// --- ConsoleNowPlaying ---

void ConsoleNowPlaying::init_now_playing_info(
    const void *player, const transport::NowPlayingInfo &info) {
  if (player != active_)
    return;
  info_ = info;
  if (info_.title != shownTitle_) {
    shownTitle_ = info_.title;
    out_ << "Now playing: " << info_.title;
    if (!info_.soundBank.empty())
      out_ << " [" << info_.soundBank << "]";
    out_ << "\n";
  }
}

void ConsoleNowPlaying::update_now_playing_info(
    const void *player, const transport::NowPlayingUpdate &fields) {
  if (player != active_)
    return;
  if (fields.elapsed)
    info_.elapsed = *fields.elapsed;
  if (fields.rate)
    info_.rate = *fields.rate;
  print_status();
}

void ConsoleNowPlaying::set_playback_state(transport::PlaybackStatus status) {
  status_ = status;
  print_status();
}

void ConsoleNowPlaying::print_status() {
  out_ << "\r  " << std::fixed << std::setprecision(1) << info_.elapsed
       << " / " << info_.duration << " s  x" << std::setprecision(2)
       << info_.rate << "  " << transport::to_string(status_) << "    "
       << std::flush;
}

// --- ConsoleTransportObserver ---

void ConsoleTransportObserver::files_loaded(
    const std::string &midi,
    const std::optional<std::filesystem::path> &soundBank) {
  out_ << "Loaded " << midi << " with "
       << (soundBank ? soundBank->filename().string()
                     : std::string("the default sound bank"))
       << "\n";
}

void ConsoleTransportObserver::playback_started(bool firstTime) {
  if (firstTime)
    out_ << "Commands: p play/pause, s stop, f/b +/-5 s, g <sec> seek, "
            "+/- rate, q quit\n";
}

void ConsoleTransportObserver::playback_stopped(bool paused) {
  out_ << "\n" << (paused ? "Paused" : "Stopped") << "\n";
}

void ConsoleTransportObserver::playback_ended() {
  out_ << "\nEnd of track\n";
  loop_.quit();
}

void ConsoleTransportObserver::playback_speed_changed(float speed) {
  out_ << "\nRate " << std::setprecision(2) << speed << "x\n";
}

// --- ConsoleBounceObserver ---

void ConsoleBounceObserver::bounce_progress(double percent,
                                            double currentTime) {
  const int shown = static_cast<int>(percent);
  if (shown == shownPercent_)
    return;
  shownPercent_ = shown;
  out_ << "\rBouncing: " << std::setw(3) << shown << "%  (" << std::fixed
       << std::setprecision(1) << currentTime << " s)" << std::flush;
}

void ConsoleBounceObserver::bounce_error(const bounce::RenderError &error) {
  cancelled_ = error.kind() == common::ErrorKind::Cancelled;
  out_ << "\n";
  std::cerr << (cancelled_ ? "bounce cancelled" : "error: " + error.describe())
            << "\n";
  loop_.quit();
}

void ConsoleBounceObserver::bounce_completed() {
  completed_ = true;
  out_ << "\nDone\n";
  loop_.quit();
}

// --- ConsoleInput ---

void ConsoleInput::start() {
  stop_.store(false);
  thread_ = std::thread([this]() { read_loop(); });
}

void ConsoleInput::stop() {
  stop_.store(true);
  if (thread_.joinable())
    thread_.join();
}

void ConsoleInput::read_loop() {
  std::string pending;
  char buf[256];
  while (!stop_.load()) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kPollMs);
    if (ready <= 0)
      continue;
    const ssize_t n = ::read(STDIN_FILENO, buf, sizeof buf);
    if (n <= 0)
      return; // EOF or error: no more commands
    pending.append(buf, static_cast<std::size_t>(n));

    std::size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, nl);
      pending.erase(0, nl + 1);
      LineHandler *handler = &handler_;
      loop_.post([handler, line]() { (*handler)(line); });
    }
  }
}

// --- commands ---

bool handle_command(const std::string &rawLine,
                    transport::TransportController &transport,
                    std::ostream &out) {
  const std::string line = trim(rawLine);
  if (line.empty())
    return true;

  switch (line[0]) {
  case 'q':
    return false;
  case 'p':
    transport.toggle_play_pause();
    break;
  case 's':
    transport.stop();
    break;
  case 'f':
    transport.fast_forward(kSkipSeconds);
    break;
  case 'b':
    transport.rewind(kSkipSeconds);
    break;
  case 'g': {
    std::istringstream is(line.substr(1));
    double t = 0.0;
    if (is >> t)
      transport.seek(t);
    else
      out << "usage: g <seconds>\n";
    break;
  }
  case '+':
    transport.set_rate(transport.rate() + kRateStep);
    break;
  case '-':
    transport.set_rate(std::max(kMinRate, transport.rate() - kRateStep));
    break;
  default:
    out << "unknown command: " << line << "\n";
    break;
  }
  return true;
}

} // namespace app
