// src/common/errors.cpp

#include "common/errors.hpp"

namespace common {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::LoadFailure:
    return "LoadFailure";
  case ErrorKind::InvalidRate:
    return "InvalidRate";
  case ErrorKind::InitializationFailure:
    return "InitializationFailure";
  case ErrorKind::InvalidSequenceLength:
    return "InvalidSequenceLength";
  case ErrorKind::FileCreationFailure:
    return "FileCreationFailure";
  case ErrorKind::ConversionFailure:
    return "ConversionFailure";
  case ErrorKind::EngineStartFailure:
    return "EngineStartFailure";
  case ErrorKind::SequencerStartFailure:
    return "SequencerStartFailure";
  case ErrorKind::IOError:
    return "IOError";
  case ErrorKind::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

PlaybackError::PlaybackError(ErrorKind kind, const std::string &message,
                             std::exception_ptr cause)
    : std::runtime_error(message), kind_(kind), cause_(std::move(cause)) {}

std::string PlaybackError::describe() const {
  if (!cause_)
    return what();
  return std::string(what()) + ": " + common::describe(cause_);
}

std::string describe(const std::exception_ptr &error) {
  if (!error)
    return "no error";
  try {
    std::rethrow_exception(error);
  } catch (const PlaybackError &e) {
    return e.describe();
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

} // namespace common
