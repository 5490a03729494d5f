// src/bounce/converter.cpp

#include "bounce/converter.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace bounce {

const char *to_string(SampleFormat format) {
  switch (format) {
  case SampleFormat::S16:
    return "s16";
  case SampleFormat::S24:
    return "s24";
  case SampleFormat::S32:
    return "s32";
  case SampleFormat::F32:
    return "f32";
  }
  return "?";
}

ma_format to_ma_format(SampleFormat format) {
  switch (format) {
  case SampleFormat::S16:
    return ma_format_s16;
  case SampleFormat::S24:
    return ma_format_s24;
  case SampleFormat::S32:
    return ma_format_s32;
  case SampleFormat::F32:
    return ma_format_f32;
  }
  return ma_format_unknown;
}

FormatConverter::FormatConverter(audio::StreamFormat native, AudioFormat target,
                                 std::uint32_t maxInputFrames)
    : native_(native), target_(target), maxInputFrames_(maxInputFrames) {
  if (native_.sampleRate == 0 || target_.sampleRate == 0)
    throw std::runtime_error("Sample rates must be positive");
  if (native_.channels == 0 || target_.channels == 0)
    throw std::runtime_error("Channel counts must be positive");

  const ma_format outFormat = to_ma_format(target_.sampleFormat);
  bytesPerFrame_ = ma_get_bytes_per_frame(outFormat, target_.channels);

  ma_data_converter_config config = ma_data_converter_config_init(
      ma_format_f32, outFormat, native_.channels, target_.channels,
      native_.sampleRate, target_.sampleRate);
  const ma_result result = ma_data_converter_init(&config, nullptr, &converter_);
  if (result != MA_SUCCESS) {
    throw std::runtime_error(std::string("Cannot convert to ") +
                             to_string(target_.sampleFormat) + "/" +
                             std::to_string(target_.channels) + "ch/" +
                             std::to_string(target_.sampleRate) + "Hz: " +
                             ma_result_description(result));
  }

  // Resampler latency can flush a few extra frames on top of the ratio.
  out_.resize(static_cast<std::size_t>(output_capacity(maxInputFrames_) + 16) *
              bytesPerFrame_);
}

FormatConverter::~FormatConverter() {
  ma_data_converter_uninit(&converter_, nullptr);
}

std::uint32_t FormatConverter::output_capacity(std::uint32_t frames) const {
  const double ratio = static_cast<double>(native_.sampleRate) /
                       static_cast<double>(target_.sampleRate);
  return static_cast<std::uint32_t>(std::ceil(frames / ratio));
}

bool FormatConverter::convert(const float *in, std::uint32_t frames,
                              std::uint32_t &outFrames) {
  outFrames = 0;
  if (frames > maxInputFrames_)
    return false;

  const std::uint32_t capacity = output_limit();
  std::uint32_t consumed = 0;
  while (consumed < frames && outFrames < capacity) {
    ma_uint64 inCount = frames - consumed;
    ma_uint64 outCount = capacity - outFrames;
    const ma_result result = ma_data_converter_process_pcm_frames(
        &converter_, in + static_cast<std::size_t>(consumed) * native_.channels,
        &inCount, out_.data() + static_cast<std::size_t>(outFrames) *
                                    bytesPerFrame_,
        &outCount);
    if (result != MA_SUCCESS)
      return false;
    if (inCount == 0 && outCount == 0)
      break; // no progress possible
    consumed += static_cast<std::uint32_t>(inCount);
    outFrames += static_cast<std::uint32_t>(outCount);
  }
  return consumed == frames;
}

} // namespace bounce
