// src/bounce/file_writer.hpp
// WAV file sink fed from the render thread.
//
// enqueue() copies frames into a bounded single-producer/single-consumer
// ring (ma_pcm_rb) and returns immediately; a writer thread drains the ring
// into an ma_encoder. The render thread therefore never touches the file.
// Write errors land in an error slot the bounce loop polls.

#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <thread>

#include "miniaudio.h"

#include "bounce/format.hpp"
#include "common/error_slot.hpp"
#include "common/log.hpp"

namespace bounce {

class AudioFileWriter {
public:
  static constexpr std::uint32_t kDefaultQueueFrames = 1u << 16;

  // Creates (truncates) the file and starts the writer thread. Throws
  // common::PlaybackError(FileCreationFailure).
  AudioFileWriter(const std::filesystem::path &destination, AudioFormat format,
                  const common::Logger &log,
                  std::uint32_t queueFrames = kDefaultQueueFrames);
  ~AudioFileWriter();

  AudioFileWriter(const AudioFileWriter &) = delete;
  AudioFileWriter &operator=(const AudioFileWriter &) = delete;

  // Producer side (one thread). Queues all `frames` frames or none; false
  // when the queue lacks room.
  bool enqueue(const void *frames, std::uint32_t count);
  std::uint32_t available_space() const;
  bool saturated() const { return available_space() == 0; }

  // Drain what is queued, stop the thread and finalize the file. Safe to
  // call more than once.
  void finish();

  bool failed() const { return error_.has_error(); }
  std::exception_ptr failure() const { return error_.error(); }
  std::uint64_t frames_written() const { return framesWritten_.load(); }
  const std::filesystem::path &destination() const { return destination_; }

private:
  void drain_loop();
  void write_frames(const void *frames, std::uint32_t count);

  std::filesystem::path destination_;
  AudioFormat format_;
  const common::Logger &log_;
  std::uint32_t bytesPerFrame_ = 0;

  ma_encoder encoder_{};
  bool encoderReady_ = false;
  mutable ma_pcm_rb queue_{};
  bool queueReady_ = false;

  std::thread thread_;
  std::atomic<bool> stopping_{false};
  std::atomic<std::uint64_t> framesWritten_{0};
  common::ErrorSlot error_;
};

} // namespace bounce
