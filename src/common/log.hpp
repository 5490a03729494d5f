// src/common/log.hpp
// Leveled line logger. One instance is created in main() and handed to the
// components that need it; tests pass one writing into a std::ostringstream.
//
// Not for audio callbacks: log() takes a mutex and formats a string.

#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace common {

enum class LogLevel { Debug, Info, Warning, Error, Silent };

const char *to_string(LogLevel level);

class Logger {
public:
  explicit Logger(LogLevel threshold = LogLevel::Info,
                  std::ostream &out = std::cerr);

  void log(LogLevel level, const std::string &message) const;

  void debug(const std::string &message) const {
    log(LogLevel::Debug, message);
  }
  void info(const std::string &message) const { log(LogLevel::Info, message); }
  void warn(const std::string &message) const {
    log(LogLevel::Warning, message);
  }
  void error(const std::string &message) const {
    log(LogLevel::Error, message);
  }

  bool enabled(LogLevel level) const { return level >= threshold_; }
  LogLevel threshold() const { return threshold_; }

private:
  LogLevel threshold_;
  std::ostream *out_;
  mutable std::mutex mutex_;
};

} // namespace common
