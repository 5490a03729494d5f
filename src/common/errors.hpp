// src/common/errors.hpp
// Categorized failures shared by the transport and the bounce pipeline.
//
// Lower layers (SMF parser, file reads, synth loading) throw plain
// std::runtime_error. Component boundaries wrap those as the cause of a
// PlaybackError so callers can branch on kind() and still print the detail.

#pragma once
#include <exception>
#include <stdexcept>
#include <string>

namespace common {

enum class ErrorKind {
  LoadFailure,
  InvalidRate,
  InitializationFailure,
  InvalidSequenceLength,
  FileCreationFailure,
  ConversionFailure,
  EngineStartFailure,
  SequencerStartFailure,
  IOError,
  Cancelled,
};

const char *to_string(ErrorKind kind);

class PlaybackError : public std::runtime_error {
public:
  PlaybackError(ErrorKind kind, const std::string &message,
                std::exception_ptr cause = nullptr);

  ErrorKind kind() const noexcept { return kind_; }
  const std::exception_ptr &cause() const noexcept { return cause_; }

  // "message: cause" (or just the message when there is no cause).
  std::string describe() const;

private:
  ErrorKind kind_;
  std::exception_ptr cause_;
};

// what() of an exception_ptr, for log lines.
std::string describe(const std::exception_ptr &error);

} // namespace common
