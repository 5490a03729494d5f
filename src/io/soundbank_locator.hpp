// src/io/soundbank_locator.hpp
// Find a SoundFont that belongs to a MIDI file.
//
// Lookup order (first existing file wins):
//   <midi dir>/<midi stem>.sf2
//   <midi dir>/<midi dir name>.sf2
//   <parent dir>/<parent dir name>.sf2
// With loose matching enabled, fall back to the .sf2 in the MIDI directory
// whose file name has the smallest edit distance to the MIDI stem.
//
// Pure lookup: no side effects besides reading directory entries.

#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace io {

std::optional<std::filesystem::path>
guess_sound_bank(const std::filesystem::path &midiFile, bool looseMatching);

// Resolve a --sf style override: an existing path is used as-is, otherwise
// the name is looked up in `searchDir` (with and without a .sf2 suffix).
std::optional<std::filesystem::path>
resolve_sound_bank(const std::string &nameOrPath,
                   const std::filesystem::path &searchDir);

// Levenshtein distance (insert/delete/substitute, all cost 1).
std::size_t edit_distance(const std::string &a, const std::string &b);

} // namespace io
