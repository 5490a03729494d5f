#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include "miniaudio.h"

#include "bounce/bouncer.hpp"
#include "bounce/converter.hpp"
#include "common/errors.hpp"
#include "common/event_loop.hpp"
#include "common/log.hpp"
#include "midi/sequence.hpp"
#include "midi/smf.hpp"
#include "test_instrument.hpp"
#include "test_midi.hpp"

namespace fs = std::filesystem;
using common::ErrorKind;

namespace {

class RecordingBounceObserver : public bounce::BounceObserver {
public:
  void bounce_progress(double percent, double) override {
    progress.push_back(percent);
  }
  void bounce_error(const bounce::RenderError &error) override {
    errors.push_back(error.kind());
    causes.push_back(error.cause());
    if (onError)
      onError();
  }
  void bounce_completed() override { ++completed; }

  std::vector<double> progress;
  std::vector<ErrorKind> errors;
  std::vector<std::exception_ptr> causes;
  int completed = 0;
  std::function<void()> onError;
};

// Every write fails; the owning stream rethrows.
class FailingStreamBuf : public std::streambuf {
protected:
  std::streamsize xsputn(const char *, std::streamsize) override {
    throw std::runtime_error("log sink failed");
  }
  int_type overflow(int_type) override {
    throw std::runtime_error("log sink failed");
  }
};

std::uint64_t wav_frames(const fs::path &file, ma_uint32 *sampleRate) {
  ma_decoder decoder;
  ma_decoder_config config = ma_decoder_config_init(ma_format_f32, 0, 0);
  if (ma_decoder_init_file(file.string().c_str(), &config, &decoder) !=
      MA_SUCCESS)
    return 0;
  ma_uint64 frames = 0;
  ma_decoder_get_length_in_pcm_frames(&decoder, &frames);
  if (sampleRate)
    *sampleRate = decoder.outputSampleRate;
  ma_decoder_uninit(&decoder);
  return frames;
}

class BounceEngineTest : public ::testing::Test {
protected:
  std::ostringstream logText;
  common::Logger log{common::LogLevel::Debug, logText};
  common::EventLoop loop;
  RecordingBounceObserver observer;
  fs::path out;

  void SetUp() override {
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    out = fs::temp_directory_path() /
          ("midiplay-" + std::string(info ? info->name() : "bounce") + ".wav");
    std::error_code ec;
    fs::remove(out, ec);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove(out, ec);
  }

  std::unique_ptr<bounce::BounceEngine>
  make(const std::vector<std::uint8_t> &smf, bounce::BounceOptions options = {},
       std::unique_ptr<audio::Instrument> instrument = nullptr) {
    if (!instrument)
      instrument = std::make_unique<midiplay_test::ToneInstrument>();
    auto engine = std::make_unique<bounce::BounceEngine>(
        midi::Sequence(midi::parse_smf(smf)), std::move(instrument), options,
        loop, log);
    engine->set_observer(&observer);
    return engine;
  }
};

} // namespace

TEST_F(BounceEngineTest, HalfSampleRateOutputCoversPreRollSongAndPostRoll) {
  bounce::BounceOptions options;
  options.destination.sampleRate = 22050;
  options.destination.channels = 1;
  auto engine = make(midiplay_test::one_note_song(1.0), options);

  engine->bounce(out);
  loop.run_pending();

  EXPECT_TRUE(observer.errors.empty());
  EXPECT_EQ(observer.completed, 1);

  ma_uint32 rate = 0;
  const double expected = (0.2 + 1.0 + 1.5) * 22050;
  const double oneBlock = 4096.0 / 2; // native block at the output rate
  EXPECT_NEAR(static_cast<double>(wav_frames(out, &rate)), expected,
              oneBlock + 64);
  EXPECT_EQ(rate, 22050u);
}

TEST_F(BounceEngineTest, RateShortensRenderedSequenceTime) {
  auto engine = make(midiplay_test::one_note_song(2.0));
  engine->set_rate(2.0f);
  EXPECT_FLOAT_EQ(engine->rate(), 2.0f);

  engine->bounce(out);
  loop.run_pending();

  ASSERT_EQ(observer.completed, 1);
  const double expected = (0.2 + 1.0 + 1.5) * 44100;
  EXPECT_NEAR(static_cast<double>(wav_frames(out, nullptr)), expected,
              4096 + 64);
}

TEST_F(BounceEngineTest, ProgressIsMonotonicAndEndsAtHundred) {
  bounce::BounceOptions options;
  options.pacing = bounce::Pacing::Realtime;
  options.postRollSeconds = 0.1;
  auto engine = make(midiplay_test::one_note_song(0.5), options);

  engine->bounce(out);
  loop.run_pending();

  ASSERT_FALSE(observer.progress.empty());
  for (std::size_t i = 0; i < observer.progress.size(); ++i) {
    EXPECT_GE(observer.progress[i], 0.0);
    EXPECT_LE(observer.progress[i], 100.0);
    if (i > 0)
      EXPECT_GE(observer.progress[i], observer.progress[i - 1]);
  }
  EXPECT_DOUBLE_EQ(observer.progress.back(), 100.0);
  EXPECT_EQ(observer.completed, 1);
  EXPECT_TRUE(observer.errors.empty());
}

TEST_F(BounceEngineTest, TracklessSequenceCreatesNoFile) {
  auto engine = make(midiplay_test::trackless_song());

  engine->bounce(out);
  loop.run_pending();

  ASSERT_EQ(observer.errors.size(), 1u);
  EXPECT_EQ(observer.errors[0], ErrorKind::InvalidSequenceLength);
  EXPECT_EQ(observer.completed, 0);
  EXPECT_FALSE(fs::exists(out));
}

TEST_F(BounceEngineTest, UnwritableDestinationIsFileCreationFailure) {
  auto engine = make(midiplay_test::one_note_song(0.5));

  engine->bounce(fs::temp_directory_path() / "midiplay-no-such-dir" /
                 "out.wav");
  loop.run_pending();

  ASSERT_EQ(observer.errors.size(), 1u);
  EXPECT_EQ(observer.errors[0], ErrorKind::FileCreationFailure);
}

TEST_F(BounceEngineTest, CancelStopsAndReportsCancelled) {
  bounce::BounceOptions options;
  options.pacing = bounce::Pacing::Realtime;
  auto engine = make(midiplay_test::one_note_song(5.0), options);

  std::thread worker([&]() { engine->bounce(out); });
  ASSERT_TRUE(loop.run_until([&]() { return !observer.progress.empty(); },
                             common::EventLoop::Seconds(5)));
  engine->cancel();
  EXPECT_TRUE(engine->is_cancelled());

  const bool finished = loop.run_until(
      [&]() { return !observer.errors.empty() || observer.completed > 0; },
      common::EventLoop::Seconds(5));
  worker.join();
  loop.run_pending();

  ASSERT_TRUE(finished);
  ASSERT_EQ(observer.errors.size(), 1u);
  EXPECT_EQ(observer.errors[0], ErrorKind::Cancelled);
  EXPECT_EQ(observer.completed, 0);
  EXPECT_LT(observer.progress.back(), 100.0);
  EXPECT_FALSE(engine->rendering());
  EXPECT_TRUE(fs::exists(out));
}

TEST_F(BounceEngineTest, WriteErrorIsIOErrorWithCause) {
  const fs::path full = "/dev/full";
  if (!fs::exists(full))
    GTEST_SKIP() << "no /dev/full on this system";
  auto engine = make(midiplay_test::one_note_song(1.0));

  engine->bounce(full);
  loop.run_pending();

  ASSERT_EQ(observer.errors.size(), 1u);
  EXPECT_EQ(observer.errors[0], ErrorKind::IOError);
  EXPECT_TRUE(observer.causes[0] != nullptr);
  EXPECT_EQ(observer.completed, 0);
  EXPECT_FALSE(engine->rendering());
}

TEST_F(BounceEngineTest, InstrumentThatCannotPrepareIsEngineStartFailure) {
  auto tone = std::make_unique<midiplay_test::ToneInstrument>();
  tone->failPrepare = true;
  midiplay_test::ToneInstrument *instrument = tone.get();
  auto engine = make(midiplay_test::one_note_song(1.0), {}, std::move(tone));

  bool renderingAtError = true;
  bool instrumentRunningAtError = true;
  observer.onError = [&]() {
    renderingAtError = engine->rendering();
    instrumentRunningAtError = instrument->running.load();
  };

  std::thread worker([&]() { engine->bounce(out); });
  const bool reported = loop.run_until(
      [&]() { return !observer.errors.empty(); }, common::EventLoop::Seconds(5));
  worker.join();
  loop.run_pending();

  ASSERT_TRUE(reported);
  ASSERT_EQ(observer.errors.size(), 1u);
  EXPECT_EQ(observer.errors[0], ErrorKind::EngineStartFailure);
  EXPECT_TRUE(observer.causes[0] != nullptr);
  EXPECT_FALSE(renderingAtError);
  EXPECT_FALSE(instrumentRunningAtError);
  EXPECT_EQ(instrument->framesRendered.load(), 0u);
  EXPECT_EQ(observer.completed, 0);
}

TEST_F(BounceEngineTest, OversizedBlockIsConversionFailure) {
  bounce::BounceOptions options;
  options.blockFrames = 4096;
  options.converterBlockFrames = 1024;
  auto engine = make(midiplay_test::one_note_song(1.0), options);

  engine->bounce(out);
  loop.run_pending();

  ASSERT_EQ(observer.errors.size(), 1u);
  EXPECT_EQ(observer.errors[0], ErrorKind::ConversionFailure);
  EXPECT_EQ(observer.completed, 0);
  EXPECT_TRUE(observer.progress.empty() || observer.progress.back() < 100.0);
  EXPECT_FALSE(engine->rendering());
}

TEST_F(BounceEngineTest, FailingLogSinkStillTearsDownTheGraph) {
  FailingStreamBuf failing;
  std::ostream failingOut(&failing);
  failingOut.exceptions(std::ios::badbit);
  // Info threshold: the first write happens once the sequencer is running.
  common::Logger failingLog(common::LogLevel::Info, failingOut);

  auto tone = std::make_unique<midiplay_test::ToneInstrument>();
  midiplay_test::ToneInstrument *instrument = tone.get();
  bounce::BounceEngine engine(
      midi::Sequence(midi::parse_smf(midiplay_test::one_note_song(1.0))),
      std::move(tone), {}, loop, failingLog);
  engine.set_observer(&observer);

  EXPECT_THROW(engine.bounce(out), std::runtime_error);
  EXPECT_GT(instrument->framesRendered.load(), 0u);
  EXPECT_FALSE(engine.rendering());
  EXPECT_FALSE(instrument->running.load());

  loop.run_pending();
  EXPECT_TRUE(observer.errors.empty());
  EXPECT_EQ(observer.completed, 0);
}

TEST_F(BounceEngineTest, SecondBounceIsRejected) {
  auto engine = make(midiplay_test::one_note_song(0.2));
  engine->bounce(out);
  EXPECT_THROW(engine->bounce(out), std::logic_error);
}

TEST_F(BounceEngineTest, RejectsNonPositiveRate) {
  auto engine = make(midiplay_test::one_note_song(0.2));
  try {
    engine->set_rate(0.0f);
    FAIL() << "zero rate accepted";
  } catch (const common::PlaybackError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidRate);
  }
}

TEST_F(BounceEngineTest, MissingInstrumentIsInitializationFailure) {
  try {
    bounce::BounceEngine engine(
        midi::Sequence(midi::parse_smf(midiplay_test::one_note_song(1.0))),
        nullptr, {}, loop, log);
    FAIL() << "graph without an instrument accepted";
  } catch (const common::PlaybackError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InitializationFailure);
  }
}

TEST_F(BounceEngineTest, UnparseableSourceIsInitializationFailure) {
  const auto source = midi::SequenceSource::from_memory({1, 2, 3});
  try {
    bounce::BounceEngine engine(source, {}, loop, log);
    FAIL() << "garbage accepted";
  } catch (const common::PlaybackError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InitializationFailure);
  }
}

TEST(FormatConverterTest, CapacityFollowsRateRatio) {
  bounce::AudioFormat target;
  target.sampleRate = 22050;
  bounce::FormatConverter converter(audio::StreamFormat{44100, 2}, target,
                                    4096);
  EXPECT_EQ(converter.output_capacity(4096), 2048u);
  EXPECT_EQ(converter.bytes_per_frame(), 4u); // s16 stereo
  EXPECT_GE(converter.output_limit(), 2048u);

  std::vector<float> silence(4096 * 2, 0.0f);
  std::uint32_t produced = 0;
  EXPECT_TRUE(converter.convert(silence.data(), 4096, produced));
  EXPECT_LE(produced, converter.output_limit());
  EXPECT_GT(produced, 2000u);

  EXPECT_FALSE(converter.convert(silence.data(), 5000, produced));
}
