// src/io/io.hpp
// Thin I/O facade for reading whole files and checking sound-bank paths.
//
// Usage:
//   auto bytes = io::read_all(path);   // std::filesystem::path or std::string
//
// Throws std::runtime_error on errors (propagated from common/util.hpp).

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "common/util.hpp"

namespace io {

inline std::vector<std::uint8_t> read_all(const std::string &path) {
  return ::read_all(path);
}

inline std::vector<std::uint8_t> read_all(const std::filesystem::path &p) {
  return ::read_all(p.string());
}

// True for an existing regular file (no exceptions; errors count as false).
inline bool is_file(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

} // namespace io
