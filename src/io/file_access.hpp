// src/io/file_access.hpp
// RAII access grant on a file: an open read-only descriptor holding a shared
// advisory lock (flock). A grant keeps the file's contents reachable for the
// holder's lifetime and tells cooperating writers the file is in use.
// Released on destruction; movable, not copyable.

#pragma once
#include <filesystem>

namespace io {

class ScopedFileAccess {
public:
  // Throws std::runtime_error if the file cannot be opened or locked.
  explicit ScopedFileAccess(const std::filesystem::path &path);
  ~ScopedFileAccess();

  ScopedFileAccess(ScopedFileAccess &&other) noexcept;
  ScopedFileAccess &operator=(ScopedFileAccess &&other) noexcept;
  ScopedFileAccess(const ScopedFileAccess &) = delete;
  ScopedFileAccess &operator=(const ScopedFileAccess &) = delete;

  const std::filesystem::path &path() const { return path_; }
  bool held() const { return fd_ >= 0; }

  void release();

private:
  std::filesystem::path path_;
  int fd_ = -1;
};

} // namespace io
