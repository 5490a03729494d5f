// src/bounce/graph.hpp
// Offline audio graph for bouncing: sequencer -> instrument -> monitor mixer.
//
// A render thread pulls fixed blocks from the instrument and hands each one
// to the tap (a copy of the instrument output) before the monitor mixer.
// The thread only renders while the sequence plays or while rendered graph
// time is short of the requested horizon, so pre-roll and post-roll are
// counted in rendered frames rather than wall time.
//
// A tap that returns false refuses the block; the same block is offered
// again on the next pass.

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "audio/instrument.hpp"
#include "audio/schedule.hpp"
#include "midi/sequence.hpp"

namespace bounce {

enum class Pacing {
  Offline,  // as fast as the tap accepts blocks
  Realtime, // one block per block duration of wall time
};

class RenderGraph {
public:
  using Tap = std::function<bool(const float *frames, std::uint32_t count)>;

  static constexpr std::uint32_t kDefaultBlockFrames = 4096;

  RenderGraph(std::unique_ptr<audio::Instrument> instrument,
              midi::Sequence sequence, Pacing pacing = Pacing::Offline,
              std::uint32_t blockFrames = kDefaultBlockFrames);
  ~RenderGraph();

  RenderGraph(const RenderGraph &) = delete;
  RenderGraph &operator=(const RenderGraph &) = delete;

  audio::StreamFormat format() const { return format_; }
  std::uint32_t block_frames() const { return blockFrames_; }
  Pacing pacing() const { return pacing_; }

  void install_tap(Tap tap);
  void remove_tap();

  // Start the render thread and warm up the instrument. Throws on failure.
  void start();
  // Join the render thread. Safe to call when not running.
  void stop();
  bool running() const { return running_.load(); }

  void set_monitor_volume(float volume) { monitorVolume_.store(volume); }
  float monitor_volume() const { return monitorVolume_.load(); }
  float monitor_peak() const { return monitorPeak_.load(); }

  // Sequencer.
  std::optional<double> sequence_length() const {
    return sequence_.length_seconds();
  }
  void set_sequence_position(double seconds);
  double sequence_position() const { return position_.load(); }
  // Chase controller state at the current position before starting.
  void prepare_sequence();
  // Throws std::runtime_error unless the graph is running.
  void start_sequence();
  void stop_sequence();
  bool sequence_playing() const { return sequencePlaying_.load(); }
  void set_rate(float rate) { rate_.store(rate); }
  float rate() const { return rate_.load(); }

  // Rendered graph time.
  double rendered_seconds() const;
  std::uint64_t rendered_frames() const { return renderedFrames_.load(); }
  // Keep rendering (sequence or not) until `seconds` of graph time exist.
  void render_until(double seconds);
  bool horizon_reached() const;

private:
  void render_loop();
  void render_block(std::uint32_t frames);
  void wake();

  midi::Sequence sequence_;
  std::unique_ptr<audio::Instrument> instrument_;
  audio::Schedule schedule_; // points into sequence_
  audio::StreamFormat format_;
  Pacing pacing_;
  std::uint32_t blockFrames_;
  double length_ = 0.0;

  std::vector<float> block_;
  std::shared_ptr<const Tap> tap_; // atomic_load/store

  std::thread thread_;
  std::mutex wakeMutex_;
  std::condition_variable wake_;
  std::atomic<bool> running_{false};
  std::atomic<bool> quit_{false};

  std::atomic<std::uint64_t> renderedFrames_{0};
  std::atomic<std::uint64_t> horizonFrames_{0};

  std::atomic<double> position_{0.0};
  std::atomic<double> pendingSeek_{-1.0}; // < 0: none
  std::atomic<float> rate_{1.0f};
  std::atomic<bool> sequencePlaying_{false};
  std::atomic<bool> silence_{false};

  std::atomic<float> monitorVolume_{0.0f};
  std::atomic<float> monitorPeak_{0.0f};
};

} // namespace bounce
