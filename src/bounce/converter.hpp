// src/bounce/converter.hpp
// Float32 graph output -> destination sample format, channel count and rate,
// on top of miniaudio's ma_data_converter.
//
// convert() runs on the render thread: it writes into a buffer sized at
// construction for `maxInputFrames` and never allocates.

#pragma once
#include <cstdint>
#include <vector>

#include "miniaudio.h"

#include "audio/instrument.hpp"
#include "bounce/format.hpp"

namespace bounce {

class FormatConverter {
public:
  // Throws std::runtime_error if miniaudio rejects the conversion.
  FormatConverter(audio::StreamFormat native, AudioFormat target,
                  std::uint32_t maxInputFrames);
  ~FormatConverter();

  FormatConverter(const FormatConverter &) = delete;
  FormatConverter &operator=(const FormatConverter &) = delete;

  // Destination frames that `frames` native frames can turn into:
  // frames / (native rate / destination rate), rounded up.
  std::uint32_t output_capacity(std::uint32_t frames) const;

  // Convert `frames` interleaved float frames. On success data() holds
  // `outFrames` frames in the target format. Returns false on a conversion
  // error or when `frames` exceeds the size given at construction.
  bool convert(const float *in, std::uint32_t frames, std::uint32_t &outFrames);

  // Most frames a single convert() call can produce.
  std::uint32_t output_limit() const {
    return static_cast<std::uint32_t>(out_.size() / bytesPerFrame_);
  }

  const std::uint8_t *data() const { return out_.data(); }
  std::uint32_t bytes_per_frame() const { return bytesPerFrame_; }
  const AudioFormat &target() const { return target_; }

private:
  audio::StreamFormat native_;
  AudioFormat target_;
  std::uint32_t maxInputFrames_;
  std::uint32_t bytesPerFrame_;
  ma_data_converter converter_{};
  std::vector<std::uint8_t> out_;
};

ma_format to_ma_format(SampleFormat format);

} // namespace bounce
