// src/common/util.hpp
// Whole-file reads (binary mode) and small numeric helpers.
#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>
#include <vector>

inline std::vector<std::uint8_t> read_all(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("Could not open file: " + path);
  }
  f.seekg(0, std::ios::end);
  std::streamsize sz = f.tellg();
  if (sz < 0) {
    throw std::runtime_error("Could not get size of file: " + path);
  }
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(sz));
  f.seekg(0, std::ios::beg);
  if (sz && !f.read(reinterpret_cast<char *>(buf.data()), sz)) {
    throw std::runtime_error("Could not read file: " + path);
  }
  return buf;
}

// Clamp a time value into [0, upper]. NaN maps to 0.
inline double clamp_seconds(double t, double upper) {
  if (std::isnan(t))
    return 0.0;
  return std::min(std::max(t, 0.0), std::max(upper, 0.0));
}
