// src/bounce/bouncer.cpp

#include "bounce/bouncer.hpp"

#include "audio/synth.hpp"
#include "bounce/converter.hpp"
#include "bounce/file_writer.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>

namespace bounce {

using common::ErrorKind;
using common::PlaybackError;

namespace {

// Detaches the tap, joins the render thread and forgets the writer on every
// exit from the rendering phase, exceptions included.
class RenderSession {
public:
  RenderSession(RenderGraph &graph, const AudioFileWriter *&current,
                const AudioFileWriter *writer)
      : graph_(graph), current_(current) {
    current_ = writer;
  }
  ~RenderSession() {
    graph_.remove_tap();
    graph_.stop();
    current_ = nullptr;
  }

  RenderSession(const RenderSession &) = delete;
  RenderSession &operator=(const RenderSession &) = delete;

private:
  RenderGraph &graph_;
  const AudioFileWriter *&current_;
};

} // namespace

BounceEngine::BounceEngine(const midi::SequenceSource &source,
                           BounceOptions options,
                           common::EventLoop &callbackLoop,
                           const common::Logger &log)
    : options_(options), loop_(callbackLoop), log_(log) {
  try {
    midi::Sequence sequence(midi::load_song(source));
    if (source.soundBank)
      soundBankAccess_.emplace(*source.soundBank);
    auto synth = std::make_unique<audio::SoundFontSynth>(source.soundBank,
                                                         options_.processing);
    log_.debug("bounce: sound bank " + synth->sound_bank().string());
    assemble(std::move(sequence), std::move(synth));
  } catch (const std::exception &) {
    throw PlaybackError(ErrorKind::InitializationFailure,
                        "Can't set up rendering of " + source.display_name(),
                        std::current_exception());
  }
}

BounceEngine::BounceEngine(midi::Sequence sequence,
                           std::unique_ptr<audio::Instrument> instrument,
                           BounceOptions options,
                           common::EventLoop &callbackLoop,
                           const common::Logger &log)
    : options_(options), loop_(callbackLoop), log_(log) {
  try {
    assemble(std::move(sequence), std::move(instrument));
  } catch (const std::exception &) {
    throw PlaybackError(ErrorKind::InitializationFailure,
                        "Can't set up the rendering graph",
                        std::current_exception());
  }
}

BounceEngine::~BounceEngine() {
  if (graph_)
    graph_->stop();
}

void BounceEngine::assemble(midi::Sequence sequence,
                            std::unique_ptr<audio::Instrument> instrument) {
  graph_ = std::make_unique<RenderGraph>(std::move(instrument),
                                         std::move(sequence), options_.pacing,
                                         options_.blockFrames);
  // Capture comes from the tap; the monitor path stays silent.
  graph_->set_monitor_volume(0.0f);
}

void BounceEngine::set_rate(float rate) {
  if (!std::isfinite(rate) || !(rate > 0.0f)) {
    throw PlaybackError(ErrorKind::InvalidRate,
                        "Playback rate must be positive, got " +
                            std::to_string(rate));
  }
  graph_->set_rate(rate);
}

bool BounceEngine::failed() const {
  return conversionFailed_.load(std::memory_order_acquire) ||
         (writer_ && writer_->failed());
}

// Let the graph render up to `seconds` of graph time. False if cancelled or
// failed first.
bool BounceEngine::await_render(double seconds) {
  graph_->render_until(seconds);
  while (!graph_->horizon_reached()) {
    if (cancelled_.load() || failed())
      return false;
    std::this_thread::sleep_for(options_.pollInterval);
  }
  return true;
}

void BounceEngine::bounce(const std::filesystem::path &destination) {
  if (used_)
    throw std::logic_error("BounceEngine::bounce may only run once");
  used_ = true;
  destination_ = destination;

  const std::optional<double> length = graph_->sequence_length();
  if (!length) {
    report_error(PlaybackError(ErrorKind::InvalidSequenceLength,
                               "Sequence has no tracks, nothing to render"));
    return;
  }

  std::unique_ptr<FormatConverter> converter;
  try {
    const std::uint32_t convertFrames = options_.converterBlockFrames
                                            ? options_.converterBlockFrames
                                            : graph_->block_frames();
    converter = std::make_unique<FormatConverter>(
        graph_->format(), options_.destination, convertFrames);
  } catch (const std::exception &) {
    report_error(PlaybackError(ErrorKind::ConversionFailure,
                               "Can't convert to the output format",
                               std::current_exception()));
    return;
  }

  std::unique_ptr<AudioFileWriter> writer;
  try {
    writer = std::make_unique<AudioFileWriter>(destination,
                                               converter->target(), log_);
  } catch (const PlaybackError &e) {
    report_error(e);
    return;
  } catch (const std::exception &) {
    report_error(PlaybackError(ErrorKind::FileCreationFailure,
                               "Can't create " + destination.string(),
                               std::current_exception()));
    return;
  }

  std::optional<PlaybackError> startError;
  {
    // Declared after converter and writer: the tap references both.
    const RenderSession session(*graph_, writer_, writer.get());

    FormatConverter &conv = *converter;
    AudioFileWriter &sink = *writer;
    graph_->install_tap([this, &conv, &sink](const float *in,
                                             std::uint32_t frames) {
      if (conversionFailed_.load(std::memory_order_relaxed))
        return true;
      if (sink.available_space() < conv.output_limit()) {
        refusedBlocks_.fetch_add(1, std::memory_order_relaxed);
        return false;
      }
      std::uint32_t outFrames = 0;
      if (!conv.convert(in, frames, outFrames)) {
        conversionFailed_.store(true, std::memory_order_release);
        return true;
      }
      sink.enqueue(conv.data(), outFrames); // room checked above
      return true;
    });

    graph_->set_sequence_position(0.0);
    graph_->prepare_sequence();
    try {
      graph_->start();
    } catch (const std::exception &) {
      startError.emplace(ErrorKind::EngineStartFailure,
                         "Can't start the rendering graph",
                         std::current_exception());
    }

    if (!startError) {
      const bool primed =
          await_render(graph_->rendered_seconds() + options_.preRollSeconds);
      if (primed) {
        try {
          graph_->start_sequence();
        } catch (const std::exception &) {
          startError.emplace(ErrorKind::SequencerStartFailure,
                             "Can't start the sequencer",
                             std::current_exception());
        }
        if (!startError)
          log_.info("bounce: rendering " + std::to_string(*length) + " s to " +
                    destination.string());
      }
    }

    if (!startError) {
      std::uint64_t refusalsLogged = 0;
      double position = graph_->sequence_position();
      while (graph_->sequence_playing() && !cancelled_.load() && !failed() &&
             position < *length) {
        report_progress(*length > 0.0 ? position / *length * 100.0 : 100.0,
                        position);
        std::this_thread::sleep_for(options_.pollInterval);
        position = graph_->sequence_position();

        const std::uint64_t refusals = refusedBlocks_.load();
        if (refusals != refusalsLogged) {
          log_.debug("bounce: writer queue saturated (" +
                     std::to_string(refusals - refusalsLogged) +
                     " blocks held back)");
          refusalsLogged = refusals;
        }
      }
    }

    graph_->stop_sequence();

    if (!startError && !failed() && !cancelled_.load()) {
      if (await_render(graph_->rendered_seconds() + options_.postRollSeconds))
        report_progress(100.0, *length);
    }
  }
  writer->finish();

  if (startError) {
    report_error(*startError);
  } else if (conversionFailed_.load(std::memory_order_acquire)) {
    report_error(PlaybackError(ErrorKind::ConversionFailure,
                               "Audio conversion failed while rendering"));
  } else if (writer->failed()) {
    report_error(PlaybackError(ErrorKind::IOError,
                               "Can't write " + destination.string(),
                               writer->failure()));
  } else if (cancelled_.load()) {
    report_error(PlaybackError(ErrorKind::Cancelled, "Bounce cancelled"));
  } else {
    log_.info("bounce: wrote " + std::to_string(writer->frames_written()) +
              " frames to " + destination.string());
    report_completed();
  }
}

void BounceEngine::report_progress(double percent, double currentTime) {
  percent = std::min(std::max(percent, 0.0), 100.0);
  percent = std::max(percent, lastProgress_);
  lastProgress_ = percent;
  if (BounceObserver *observer = observer_)
    loop_.post([observer, percent, currentTime]() {
      observer->bounce_progress(percent, currentTime);
    });
}

void BounceEngine::report_error(const RenderError &error) {
  log_.debug(std::string("bounce: ") + common::to_string(error.kind()) + ": " +
             error.describe());
  if (BounceObserver *observer = observer_)
    loop_.post([observer, error]() { observer->bounce_error(error); });
}

void BounceEngine::report_completed() {
  if (BounceObserver *observer = observer_)
    loop_.post([observer]() { observer->bounce_completed(); });
}

} // namespace bounce
