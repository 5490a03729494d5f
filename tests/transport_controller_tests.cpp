#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "app/console.hpp"
#include "audio/playback_engine.hpp"
#include "common/errors.hpp"
#include "common/event_loop.hpp"
#include "common/log.hpp"
#include "transport/controller.hpp"

using transport::PlaybackStatus;
using transport::TransportController;
using transport::TransportState;

namespace {

// Scripted engine: time only moves when the test says so.
class FakePlaybackEngine : public audio::PlaybackEngine {
public:
  explicit FakePlaybackEngine(double length) : length_(length) {}

  void prepare_to_play() override { ++prepared; }
  void play(CompletionHandler onComplete) override {
    completion_ = std::move(onComplete);
    playing_ = true;
  }
  void stop() override { playing_ = false; }
  double current_position() const override { return position_; }
  void set_current_position(double seconds) override {
    position_ = std::min(std::max(seconds, 0.0), length_);
  }
  double duration() const override { return length_; }
  float rate() const override { return rate_; }
  void set_rate(float rate) override { rate_ = rate; }
  bool is_playing() const override { return playing_; }

  void advance(double seconds) { position_ = std::min(position_ + seconds, length_); }

  // Reach the end on the "audio thread".
  void finish() {
    position_ = length_;
    playing_ = false;
    if (completion_)
      completion_();
  }

  int prepared = 0;

private:
  double length_;
  double position_ = 0.0;
  float rate_ = 1.0f;
  bool playing_ = false;
  CompletionHandler completion_;
};

class RecordingNowPlaying : public transport::NowPlayingSink {
public:
  void make_active(const void *player) override { active = player; }
  void init_now_playing_info(const void *,
                             const transport::NowPlayingInfo &info) override {
    ++inits;
    last = info;
  }
  void update_now_playing_info(const void *,
                               const transport::NowPlayingUpdate &f) override {
    ++updates;
    if (f.rate)
      lastRate = *f.rate;
  }
  void set_playback_state(PlaybackStatus status) override {
    states.push_back(status);
  }

  const void *active = nullptr;
  int inits = 0;
  int updates = 0;
  float lastRate = 0.0f;
  transport::NowPlayingInfo last;
  std::vector<PlaybackStatus> states;
};

class RecordingObserver : public transport::TransportObserver {
public:
  void files_loaded(const std::string &midi,
                    const std::optional<std::filesystem::path> &) override {
    loaded.push_back(midi);
  }
  void playback_will_start(bool firstTime) override {
    willStart.push_back(firstTime);
  }
  void playback_started(bool firstTime) override {
    started.push_back(firstTime);
  }
  void playback_position_changed(double position, double) override {
    positions.push_back(position);
  }
  void playback_stopped(bool paused) override { stopped.push_back(paused); }
  void playback_ended() override { ++ended; }
  void playback_speed_changed(float speed) override { speeds.push_back(speed); }

  std::vector<std::string> loaded;
  std::vector<bool> willStart;
  std::vector<bool> started;
  std::vector<double> positions;
  std::vector<bool> stopped;
  int ended = 0;
  std::vector<float> speeds;
};

class TransportControllerTest : public ::testing::Test {
protected:
  std::ostringstream logText;
  common::Logger log{common::LogLevel::Debug, logText};
  common::EventLoop loop;
  RecordingNowPlaying nowPlaying;
  RecordingObserver observer;
  FakePlaybackEngine *engine = nullptr;
  std::unique_ptr<TransportController> controller;

  void make(double length, transport::TransportOptions options = {}) {
    auto fake = std::make_unique<FakePlaybackEngine>(length);
    engine = fake.get();
    controller = std::make_unique<TransportController>(
        std::move(fake), "song.mid", std::nullopt, std::nullopt, nowPlaying,
        loop, log, options);
    controller->set_observer(&observer);
  }

  void SetUp() override { make(30.0); }
};

} // namespace

TEST_F(TransportControllerTest, RealTimesScaleWithRate) {
  engine->set_current_position(12.0);
  for (float rate : {0.5f, 1.0f, 2.0f, 3.0f}) {
    controller->set_rate(rate);
    EXPECT_DOUBLE_EQ(controller->real_duration(), 30.0 / rate);
    EXPECT_DOUBLE_EQ(controller->real_position(), 12.0 / rate);
  }
  controller->set_rate(2.0f);
  EXPECT_DOUBLE_EQ(controller->real_duration(), 15.0);
}

TEST_F(TransportControllerTest, RejectsNonPositiveRates) {
  for (float bad : {0.0f, -1.0f, std::numeric_limits<float>::quiet_NaN(),
                    std::numeric_limits<float>::infinity()}) {
    try {
      controller->set_rate(bad);
      FAIL() << "rate " << bad << " accepted";
    } catch (const common::PlaybackError &e) {
      EXPECT_EQ(e.kind(), common::ErrorKind::InvalidRate);
    }
  }
  EXPECT_FLOAT_EQ(controller->rate(), 1.0f);
  EXPECT_TRUE(observer.speeds.empty());
}

TEST_F(TransportControllerTest, SetRatePublishesSpeed) {
  controller->set_rate(1.5f);
  ASSERT_EQ(observer.speeds.size(), 1u);
  EXPECT_FLOAT_EQ(observer.speeds[0], 1.5f);
  EXPECT_FLOAT_EQ(nowPlaying.lastRate, 1.5f);
}

TEST_F(TransportControllerTest, SeekClampsIntoDuration) {
  controller->seek(999.0);
  EXPECT_DOUBLE_EQ(controller->current_position(), 30.0);
  controller->seek(-4.0);
  EXPECT_DOUBLE_EQ(controller->current_position(), 0.0);

  controller->seek(3.0);
  controller->rewind(10.0);
  EXPECT_DOUBLE_EQ(controller->current_position(), 0.0);
  controller->seek(28.0);
  controller->fast_forward(10.0);
  EXPECT_DOUBLE_EQ(controller->current_position(), 30.0);
}

TEST_F(TransportControllerTest, NanSeekLandsAtStart) {
  controller->seek(12.0);
  controller->seek(std::nan(""));
  EXPECT_DOUBLE_EQ(controller->current_position(), 0.0);
  EXPECT_EQ(observer.positions.back(), 0.0);

  controller->fast_forward(std::numeric_limits<double>::infinity());
  EXPECT_DOUBLE_EQ(controller->current_position(), 30.0);
}

TEST_F(TransportControllerTest, EachPositionWriteNotifiesOnce) {
  controller->seek(5.0);
  controller->fast_forward(2.0);
  controller->rewind(1.0);
  EXPECT_EQ(observer.positions, (std::vector<double>{5.0, 7.0, 6.0}));
}

TEST_F(TransportControllerTest, PlayPauseStopStateMachine) {
  EXPECT_EQ(controller->state(), TransportState::Stopped);

  controller->prepare_to_play();
  EXPECT_EQ(engine->prepared, 1);
  ASSERT_EQ(observer.loaded.size(), 1u);
  EXPECT_EQ(observer.loaded[0], "song.mid");

  controller->play();
  EXPECT_EQ(controller->state(), TransportState::Playing);
  EXPECT_FALSE(controller->is_paused());
  EXPECT_EQ(nowPlaying.active, controller.get());
  EXPECT_EQ(observer.willStart, (std::vector<bool>{true}));
  EXPECT_EQ(observer.started, (std::vector<bool>{true}));

  engine->advance(4.0);
  controller->pause();
  EXPECT_EQ(controller->state(), TransportState::Paused);
  EXPECT_TRUE(controller->is_paused());
  EXPECT_DOUBLE_EQ(controller->current_position(), 4.0);
  EXPECT_EQ(observer.stopped, (std::vector<bool>{true}));

  controller->play();
  EXPECT_EQ(observer.started, (std::vector<bool>{true, false}));

  controller->stop();
  EXPECT_EQ(controller->state(), TransportState::Stopped);
  EXPECT_DOUBLE_EQ(controller->current_position(), 0.0);
  EXPECT_EQ(observer.stopped, (std::vector<bool>{true, false}));
  EXPECT_EQ(nowPlaying.states.back(), PlaybackStatus::Stopped);
}

TEST_F(TransportControllerTest, TogglePlayPause) {
  controller->toggle_play_pause(); // stopped -> playing
  EXPECT_TRUE(controller->is_playing());
  engine->advance(2.0);
  controller->toggle_play_pause(); // playing -> paused
  EXPECT_EQ(controller->state(), TransportState::Paused);
  controller->toggle_play_pause(); // paused -> playing
  EXPECT_TRUE(controller->is_playing());
  EXPECT_DOUBLE_EQ(controller->current_position(), 2.0);
}

TEST_F(TransportControllerTest, NeverPausedWhilePlaying) {
  controller->play();
  for (double t : {0.0, 10.0, 29.95, 30.0}) {
    engine->set_current_position(t);
    EXPECT_FALSE(controller->is_paused() && controller->is_playing());
  }
}

TEST_F(TransportControllerTest, PlayAtEndRestartsFromZero) {
  controller->seek(29.95);
  EXPECT_TRUE(controller->is_at_end_of_track());
  EXPECT_EQ(controller->state(), TransportState::Stopped);

  controller->play();
  EXPECT_DOUBLE_EQ(controller->current_position(), 0.0);
  EXPECT_EQ(observer.willStart, (std::vector<bool>{true}));
}

TEST_F(TransportControllerTest, EndOfTrackIsDeliveredOnTheLoop) {
  controller->play();
  engine->finish();
  EXPECT_EQ(observer.ended, 0); // handed off, not called inline

  loop.run_pending();
  EXPECT_EQ(observer.ended, 1);
  EXPECT_EQ(controller->state(), TransportState::Stopped);
  EXPECT_EQ(nowPlaying.states.back(), PlaybackStatus::Stopped);
}

TEST_F(TransportControllerTest, CompletionAfterDestructionIsIgnored) {
  controller->play();
  engine->finish();
  controller.reset();
  EXPECT_EQ(loop.run_pending(), 1u);
  EXPECT_EQ(observer.ended, 0);
}

TEST_F(TransportControllerTest, ReportTimerPublishesWhilePlaying) {
  controller->play();
  engine->advance(1.0);
  const int updatesBefore = nowPlaying.updates;

  ASSERT_TRUE(loop.run_until([&]() { return observer.positions.size() >= 2; },
                             common::EventLoop::Seconds(2)));
  EXPECT_GT(nowPlaying.updates, updatesBefore);
  EXPECT_DOUBLE_EQ(observer.positions.back(), 1.0);

  controller->pause();
  const std::size_t seen = observer.positions.size();
  loop.run_for(common::EventLoop::Seconds(0.3));
  EXPECT_EQ(observer.positions.size(), seen);
}

TEST_F(TransportControllerTest, IntentsIgnoredWithoutMediaKeys) {
  controller->set_accepts_media_keys(false);
  controller->play();
  controller->seek(10.0);
  controller->toggle_play_pause();
  EXPECT_FALSE(controller->is_playing());
  EXPECT_DOUBLE_EQ(controller->current_position(), 0.0);
  EXPECT_TRUE(observer.started.empty());
  EXPECT_TRUE(observer.positions.empty());
}

TEST_F(TransportControllerTest, CacophonyLeavesNowPlayingStateAlone) {
  transport::TransportOptions options;
  options.cacophonyMode = true;
  make(30.0, options);

  controller->play();
  EXPECT_TRUE(nowPlaying.states.empty());
  EXPECT_EQ(nowPlaying.inits, 0);
  EXPECT_TRUE(controller->is_playing());
}

TEST_F(TransportControllerTest, LoadWrapsParseErrorsAsLoadFailure) {
  const auto source =
      midi::SequenceSource::from_memory({'n', 'o', 't', ' ', 'm', 'i', 'd'});
  try {
    TransportController::load(source, nowPlaying, loop, log);
    FAIL() << "garbage accepted";
  } catch (const common::PlaybackError &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::LoadFailure);
    EXPECT_TRUE(e.cause() != nullptr);
  }
}

TEST_F(TransportControllerTest, ConsoleCommandsDriveTheTransport) {
  std::ostringstream out;
  EXPECT_TRUE(app::handle_command("g 12", *controller, out));
  EXPECT_DOUBLE_EQ(controller->current_position(), 12.0);
  EXPECT_TRUE(app::handle_command("f", *controller, out));
  EXPECT_DOUBLE_EQ(controller->current_position(), 17.0);
  EXPECT_TRUE(app::handle_command(" b ", *controller, out));
  EXPECT_DOUBLE_EQ(controller->current_position(), 12.0);
  EXPECT_TRUE(app::handle_command("+", *controller, out));
  EXPECT_FLOAT_EQ(controller->rate(), 1.25f);
  EXPECT_TRUE(app::handle_command("p", *controller, out));
  EXPECT_TRUE(controller->is_playing());
  EXPECT_TRUE(app::handle_command("s", *controller, out));
  EXPECT_EQ(controller->state(), TransportState::Stopped);
  EXPECT_TRUE(app::handle_command("zz", *controller, out));
  EXPECT_NE(out.str().find("unknown command"), std::string::npos);
  EXPECT_FALSE(app::handle_command("q", *controller, out));
}
