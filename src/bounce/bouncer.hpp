// src/bounce/bouncer.hpp
// Offline rendering of a MIDI sequence through the SoundFont synth into an
// audio file.
//
// bounce() blocks the calling thread while three threads cooperate:
//   caller  - drives the graph and polls progress every pollInterval;
//   render  - RenderGraph's thread, converting each block in the tap and
//             queueing it for the writer (never blocks, never throws);
//   writer  - AudioFileWriter's thread, the only one touching the file.
// Observer callbacks are posted to the event loop given at construction, so
// they run on whichever thread drives that loop.

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>

#include "audio/instrument.hpp"
#include "bounce/format.hpp"
#include "bounce/graph.hpp"
#include "common/event_loop.hpp"
#include "common/log.hpp"
#include "io/file_access.hpp"
#include "midi/sequence.hpp"
#include "midi/source.hpp"

namespace bounce {

class AudioFileWriter;

class BounceObserver {
public:
  virtual ~BounceObserver() = default;

  virtual void bounce_progress(double percent, double currentTime) {
    (void)percent;
    (void)currentTime;
  }
  virtual void bounce_error(const RenderError &error) { (void)error; }
  virtual void bounce_completed() {}
};

struct BounceOptions {
  // Synth output format the graph runs at.
  audio::StreamFormat processing{};
  AudioFormat destination{};
  Pacing pacing = Pacing::Offline;
  double preRollSeconds = 0.2;
  double postRollSeconds = 1.5;
  std::chrono::milliseconds pollInterval{10};
  std::uint32_t blockFrames = RenderGraph::kDefaultBlockFrames;
  // Largest block the format converter accepts per call; 0 uses blockFrames.
  std::uint32_t converterBlockFrames = 0;
};

class BounceEngine {
public:
  // Load the sequence and its sound bank and assemble the graph. Throws
  // common::PlaybackError(InitializationFailure).
  BounceEngine(const midi::SequenceSource &source, BounceOptions options,
               common::EventLoop &callbackLoop, const common::Logger &log);
  // Assemble the graph around an already-loaded sequence and instrument.
  BounceEngine(midi::Sequence sequence,
               std::unique_ptr<audio::Instrument> instrument,
               BounceOptions options, common::EventLoop &callbackLoop,
               const common::Logger &log);
  ~BounceEngine();

  BounceEngine(const BounceEngine &) = delete;
  BounceEngine &operator=(const BounceEngine &) = delete;

  // Non-owning; must outlive the callbacks posted for it.
  void set_observer(BounceObserver *observer) { observer_ = observer; }

  // Render the whole sequence into `destination`. Outcomes are reported to
  // the observer. A second call throws std::logic_error; anything else that
  // escapes (a failing log sink) propagates after the graph is torn down.
  void bounce(const std::filesystem::path &destination);

  // Any thread. Observed by the poll loop within one poll interval.
  void cancel() { cancelled_.store(true); }
  bool is_cancelled() const { return cancelled_.load(); }

  // Throws common::PlaybackError(InvalidRate) for rate <= 0 or non-finite.
  void set_rate(float rate);
  float rate() const { return graph_->rate(); }

  // True while the render thread exists; false again once bounce() returns.
  bool rendering() const { return graph_->running(); }

  const std::optional<std::filesystem::path> &destination() const {
    return destination_;
  }
  const BounceOptions &options() const { return options_; }

private:
  void assemble(midi::Sequence sequence,
                std::unique_ptr<audio::Instrument> instrument);
  bool await_render(double seconds);
  bool failed() const;
  void report_progress(double percent, double currentTime);
  void report_error(const RenderError &error);
  void report_completed();

  BounceOptions options_;
  common::EventLoop &loop_;
  const common::Logger &log_;
  std::optional<io::ScopedFileAccess> soundBankAccess_;
  std::unique_ptr<RenderGraph> graph_;

  BounceObserver *observer_ = nullptr;
  std::optional<std::filesystem::path> destination_;
  bool used_ = false;
  double lastProgress_ = 0.0;

  std::atomic<bool> cancelled_{false};
  std::atomic<bool> conversionFailed_{false};
  std::atomic<std::uint64_t> refusedBlocks_{0};
  const AudioFileWriter *writer_ = nullptr; // valid during bounce()
};

} // namespace bounce
