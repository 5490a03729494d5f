// src/bounce/file_writer.cpp

#include "bounce/file_writer.hpp"
#include "bounce/converter.hpp"

#include <chrono>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

namespace bounce {

using common::ErrorKind;
using common::PlaybackError;

namespace {

constexpr auto kIdleWait = std::chrono::milliseconds(2);

} // namespace

AudioFileWriter::AudioFileWriter(const std::filesystem::path &destination,
                                 AudioFormat format, const common::Logger &log,
                                 std::uint32_t queueFrames)
    : destination_(destination), format_(format), log_(log) {
  log_.debug("writer: " + destination_.string() + " (" +
             to_string(format_.sampleFormat) + ", " +
             std::to_string(format_.channels) + " ch, " +
             std::to_string(format_.sampleRate) + " Hz)");
  const ma_format maFormat = to_ma_format(format_.sampleFormat);
  bytesPerFrame_ = ma_get_bytes_per_frame(maFormat, format_.channels);

  ma_encoder_config config =
      ma_encoder_config_init(ma_encoding_format_wav, maFormat,
                             format_.channels, format_.sampleRate);
  ma_result result =
      ma_encoder_init_file(destination_.string().c_str(), &config, &encoder_);
  if (result != MA_SUCCESS) {
    throw PlaybackError(ErrorKind::FileCreationFailure,
                        "Can't create " + destination_.string() + ": " +
                            ma_result_description(result));
  }
  encoderReady_ = true;

  result = ma_pcm_rb_init(maFormat, format_.channels, queueFrames, nullptr,
                          nullptr, &queue_);
  if (result != MA_SUCCESS) {
    ma_encoder_uninit(&encoder_);
    encoderReady_ = false;
    throw PlaybackError(ErrorKind::FileCreationFailure,
                        std::string("Can't allocate the write queue: ") +
                            ma_result_description(result));
  }
  queueReady_ = true;

  try {
    thread_ = std::thread([this]() { drain_loop(); });
  } catch (const std::system_error &) {
    ma_pcm_rb_uninit(&queue_);
    ma_encoder_uninit(&encoder_);
    queueReady_ = false;
    encoderReady_ = false;
    throw;
  }
}

AudioFileWriter::~AudioFileWriter() {
  finish();
  if (queueReady_)
    ma_pcm_rb_uninit(&queue_);
}

std::uint32_t AudioFileWriter::available_space() const {
  return ma_pcm_rb_available_write(&queue_);
}

bool AudioFileWriter::enqueue(const void *frames, std::uint32_t count) {
  if (count == 0)
    return true;
  if (available_space() < count)
    return false;

  const auto *src = static_cast<const std::uint8_t *>(frames);
  std::uint32_t done = 0;
  // The ring may wrap, so a single acquire can come back short.
  while (done < count) {
    ma_uint32 chunk = count - done;
    void *dst = nullptr;
    if (ma_pcm_rb_acquire_write(&queue_, &chunk, &dst) != MA_SUCCESS ||
        chunk == 0)
      return false;
    std::memcpy(dst, src + static_cast<std::size_t>(done) * bytesPerFrame_,
                static_cast<std::size_t>(chunk) * bytesPerFrame_);
    ma_pcm_rb_commit_write(&queue_, chunk);
    done += chunk;
  }
  return true;
}

void AudioFileWriter::drain_loop() {
  for (;;) {
    ma_uint32 chunk = ma_pcm_rb_available_read(&queue_);
    if (chunk == 0) {
      if (stopping_.load(std::memory_order_acquire) &&
          ma_pcm_rb_available_read(&queue_) == 0)
        return;
      std::this_thread::sleep_for(kIdleWait);
      continue;
    }

    void *src = nullptr;
    if (ma_pcm_rb_acquire_read(&queue_, &chunk, &src) != MA_SUCCESS)
      continue;
    // After a failure keep consuming so the producer never stalls.
    if (!error_.has_error())
      write_frames(src, chunk);
    ma_pcm_rb_commit_read(&queue_, chunk);
  }
}

void AudioFileWriter::write_frames(const void *frames, std::uint32_t count) {
  ma_uint64 written = 0;
  const ma_result result =
      ma_encoder_write_pcm_frames(&encoder_, frames, count, &written);
  framesWritten_.fetch_add(written);
  if (result != MA_SUCCESS || written != count) {
    error_.record(std::make_exception_ptr(std::runtime_error(
        "Write to " + destination_.string() + " failed: " +
        ma_result_description(result != MA_SUCCESS ? result : MA_IO_ERROR))));
  }
}

void AudioFileWriter::finish() {
  stopping_.store(true, std::memory_order_release);
  if (thread_.joinable())
    thread_.join();
  if (encoderReady_) {
    ma_encoder_uninit(&encoder_);
    encoderReady_ = false;
    log_.debug("writer: closed " + destination_.string() + " after " +
               std::to_string(framesWritten_.load()) + " frames");
  }
}

} // namespace bounce
