// src/common/reader.hpp
// Tiny safe cursor for big-endian reads + MIDI VLQ.
// Non-owning: the cursor points into a buffer that must outlive it, so track
// chunks can be walked through sub-cursors without copying.
#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <vector>

struct Bytes {
  const std::uint8_t *data = nullptr;
  std::size_t size = 0;
  std::size_t off = 0; // current read position

  Bytes(const std::uint8_t *p, std::size_t n) : data(p), size(n), off(0) {}
  explicit Bytes(const std::vector<std::uint8_t> &src)
      : Bytes(src.data(), src.size()) {}

  [[nodiscard]] std::size_t remaining() const { return size - off; }
  [[nodiscard]] bool at_end() const { return off >= size; }

  [[nodiscard]] std::uint8_t u8() {
    if (off + 1 > size)
      throw std::runtime_error("EOF while reading u8");
    return data[off++];
  }

  [[nodiscard]] std::uint16_t be16() {
    if (off + 2 > size)
      throw std::runtime_error("EOF while reading be16");
    std::uint16_t hi = data[off], lo = data[off + 1];
    off += 2;
    return static_cast<std::uint16_t>((hi << 8) | lo);
  }

  [[nodiscard]] std::uint32_t be24() {
    if (off + 3 > size)
      throw std::runtime_error("EOF while reading be24");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2];
    off += 3;
    return (b0 << 16) | (b1 << 8) | b2;
  }

  [[nodiscard]] std::uint32_t be32() {
    if (off + 4 > size)
      throw std::runtime_error("EOF while reading be32");
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2],
                  b3 = data[off + 3];
    off += 4;
    return (b0 << 24) | (b1 << 16) | (b2 << 8) | b3;
  }

  // Sub-cursor over the next n bytes; advances this cursor past them.
  [[nodiscard]] Bytes slice(std::size_t n) {
    if (off + n > size)
      throw std::runtime_error("Chunk runs past end of file");
    Bytes sub(data + off, n);
    off += n;
    return sub;
  }

  void skip(std::size_t n) {
    if (off + n > size)
      throw std::runtime_error("EOF while skipping bytes");
    off += n;
  }
};

// Read a MIDI VLQ (Variable Length Quantity). At most 4 bytes.
inline std::uint32_t read_vlq(Bytes &r) {
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    std::uint8_t b = r.u8();
    v = (v << 7) | (b & 0x7F);
    if ((b & 0x80) == 0)
      return v; // high bit 0 => last byte
  }
  throw std::runtime_error("Variable-length quantity longer than 4 bytes");
}
