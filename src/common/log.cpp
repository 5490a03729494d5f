// src/common/log.cpp

#include "common/log.hpp"

namespace common {

const char *to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  case LogLevel::Silent:
    return "silent";
  }
  return "?";
}

Logger::Logger(LogLevel threshold, std::ostream &out)
    : threshold_(threshold), out_(&out) {}

void Logger::log(LogLevel level, const std::string &message) const {
  if (level == LogLevel::Silent || !enabled(level))
    return;
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << to_string(level) << "] " << message << "\n";
  out_->flush();
}

} // namespace common
