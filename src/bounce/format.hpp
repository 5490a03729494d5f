// src/bounce/format.hpp
// Destination format of a bounce.

#pragma once
#include <cstdint>

#include "common/errors.hpp"

namespace bounce {

enum class SampleFormat { S16, S24, S32, F32 };

const char *to_string(SampleFormat format);

struct AudioFormat {
  SampleFormat sampleFormat = SampleFormat::S16;
  std::uint32_t channels = 2;
  std::uint32_t sampleRate = 44100;
};

// Errors reported by a bounce are the shared categorized kind.
using RenderError = common::PlaybackError;

} // namespace bounce
