// src/io/file_access.cpp

#include "io/file_access.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace io {

ScopedFileAccess::ScopedFileAccess(const std::filesystem::path &path)
    : path_(path) {
  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    throw std::runtime_error("Could not open " + path.string() + ": " +
                             std::strerror(errno));
  }
  // Shared lock, non-blocking: only an exclusive writer can refuse us.
  if (::flock(fd_, LOCK_SH | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    throw std::runtime_error("Could not lock " + path.string() + ": " +
                             std::strerror(err));
  }
}

ScopedFileAccess::~ScopedFileAccess() { release(); }

ScopedFileAccess::ScopedFileAccess(ScopedFileAccess &&other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
  other.fd_ = -1;
}

ScopedFileAccess &ScopedFileAccess::operator=(ScopedFileAccess &&other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void ScopedFileAccess::release() {
  if (fd_ < 0)
    return;
  // Closing the last descriptor drops the flock.
  ::close(fd_);
  fd_ = -1;
}

} // namespace io
