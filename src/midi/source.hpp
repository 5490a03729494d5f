// src/midi/source.hpp
// Where a sequence comes from: a .mid file on disk or an in-memory buffer,
// plus the optional SoundFont to play it with.

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "midi/events.hpp"

namespace midi {

struct SequenceSource {
  std::optional<std::filesystem::path> midiPath; // set for file sources
  std::vector<std::uint8_t> midiBytes;           // set for memory sources
  std::optional<std::filesystem::path> soundBank;

  static SequenceSource
  from_file(std::filesystem::path midi,
            std::optional<std::filesystem::path> soundBank = std::nullopt);
  static SequenceSource
  from_memory(std::vector<std::uint8_t> bytes,
              std::optional<std::filesystem::path> soundBank = std::nullopt);

  // File name for file sources, "<memory>" otherwise.
  std::string display_name() const;
};

// Read (if needed) and parse the source. Throws std::runtime_error.
Song load_song(const SequenceSource &source);

} // namespace midi
