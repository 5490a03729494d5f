// src/bounce/graph.cpp

#include "bounce/graph.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace bounce {

namespace {

constexpr auto kIdleWait = std::chrono::milliseconds(5);
constexpr auto kRefusedRetry = std::chrono::milliseconds(1);

} // namespace

RenderGraph::RenderGraph(std::unique_ptr<audio::Instrument> instrument,
                         midi::Sequence sequence, Pacing pacing,
                         std::uint32_t blockFrames)
    : sequence_(std::move(sequence)), instrument_(std::move(instrument)),
      schedule_(sequence_), pacing_(pacing), blockFrames_(blockFrames) {
  if (!instrument_)
    throw std::invalid_argument("RenderGraph needs an instrument");
  if (blockFrames_ == 0)
    throw std::invalid_argument("RenderGraph block size must be positive");

  format_ = instrument_->format();
  if (format_.sampleRate == 0 || format_.channels == 0)
    throw std::runtime_error("Instrument reports an empty stream format");

  length_ = sequence_.length_seconds().value_or(0.0);
  block_.resize(static_cast<std::size_t>(blockFrames_) * format_.channels);
}

RenderGraph::~RenderGraph() { stop(); }

void RenderGraph::install_tap(Tap tap) {
  std::atomic_store(&tap_, std::make_shared<const Tap>(std::move(tap)));
}

void RenderGraph::remove_tap() {
  std::atomic_store(&tap_, std::shared_ptr<const Tap>());
}

void RenderGraph::start() {
  if (running_.load())
    return;
  quit_.store(false);
  instrument_->set_running(true);
  try {
    instrument_->prepare();
    thread_ = std::thread([this]() { render_loop(); });
  } catch (...) {
    instrument_->set_running(false);
    throw;
  }
  running_.store(true);
}

void RenderGraph::stop() {
  sequencePlaying_.store(false);
  quit_.store(true);
  wake();
  if (thread_.joinable())
    thread_.join();
  if (running_.exchange(false))
    instrument_->set_running(false);
}

void RenderGraph::set_sequence_position(double seconds) {
  const double p = std::min(std::max(seconds, 0.0), length_);
  pendingSeek_.store(p);
  position_.store(p);
}

void RenderGraph::prepare_sequence() { pendingSeek_.store(position_.load()); }

void RenderGraph::start_sequence() {
  if (!running_.load())
    throw std::runtime_error("Sequencer needs a running graph");
  sequencePlaying_.store(true);
  wake();
}

void RenderGraph::stop_sequence() {
  sequencePlaying_.store(false);
  silence_.store(true);
  wake();
}

double RenderGraph::rendered_seconds() const {
  return static_cast<double>(renderedFrames_.load()) / format_.sampleRate;
}

void RenderGraph::render_until(double seconds) {
  const auto target =
      static_cast<std::uint64_t>(std::ceil(seconds * format_.sampleRate));
  std::uint64_t current = horizonFrames_.load();
  while (current < target &&
         !horizonFrames_.compare_exchange_weak(current, target)) {
  }
  wake();
}

bool RenderGraph::horizon_reached() const {
  return renderedFrames_.load() >= horizonFrames_.load();
}

void RenderGraph::wake() {
  std::lock_guard<std::mutex> lock(wakeMutex_);
  wake_.notify_all();
}

// Apply pending control requests, feed due events, render one block.
void RenderGraph::render_block(std::uint32_t frames) {
  const double seek = pendingSeek_.exchange(-1.0);
  if (seek >= 0.0)
    schedule_.seek(seek, *instrument_);
  if (silence_.exchange(false))
    instrument_->all_notes_off();

  if (sequencePlaying_.load()) {
    const double t0 = position_.load();
    double t1 = t0 + static_cast<double>(frames) / format_.sampleRate *
                         rate_.load();
    schedule_.dispatch_until(t1, *instrument_);
    if (t1 >= length_) {
      t1 = length_;
      sequencePlaying_.store(false);
    }
    position_.store(t1);
  }

  instrument_->render(block_.data(), frames);
}

void RenderGraph::render_loop() {
  bool pending = false; // block_ holds a block the tap refused
  std::uint32_t pendingFrames = 0;
  auto nextDue = std::chrono::steady_clock::now();

  while (!quit_.load()) {
    const std::uint64_t rendered = renderedFrames_.load();
    const std::uint64_t horizon = horizonFrames_.load();
    const bool playing = sequencePlaying_.load();

    if (!pending && !playing && rendered >= horizon) {
      std::unique_lock<std::mutex> lock(wakeMutex_);
      wake_.wait_for(lock, kIdleWait);
      nextDue = std::chrono::steady_clock::now();
      continue;
    }

    if (!pending) {
      std::uint32_t frames = blockFrames_;
      if (!playing) {
        frames = static_cast<std::uint32_t>(
            std::min<std::uint64_t>(frames, horizon - rendered));
      }
      render_block(frames);
      pendingFrames = frames;
    }

    auto tap = std::atomic_load(&tap_);
    if (tap && *tap && !(*tap)(block_.data(), pendingFrames)) {
      pending = true;
      std::this_thread::sleep_for(kRefusedRetry);
      continue;
    }
    pending = false;

    // Monitor mix: the bounce keeps it muted, only the level is tracked.
    const float volume = monitorVolume_.load();
    float peak = 0.0f;
    const std::size_t samples =
        static_cast<std::size_t>(pendingFrames) * format_.channels;
    for (std::size_t i = 0; i < samples; ++i)
      peak = std::max(peak, std::fabs(block_[i] * volume));
    monitorPeak_.store(peak);

    renderedFrames_.fetch_add(pendingFrames);

    if (pacing_ == Pacing::Realtime) {
      nextDue += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
          std::chrono::duration<double>(static_cast<double>(pendingFrames) /
                                        format_.sampleRate));
      std::this_thread::sleep_until(nextDue);
    }
  }
}

} // namespace bounce
