// src/midi/source.cpp

#include "midi/source.hpp"
#include "io/io.hpp"
#include "midi/smf.hpp"

namespace midi {

SequenceSource
SequenceSource::from_file(std::filesystem::path midi,
                          std::optional<std::filesystem::path> soundBank) {
  SequenceSource s;
  s.midiPath = std::move(midi);
  s.soundBank = std::move(soundBank);
  return s;
}

SequenceSource
SequenceSource::from_memory(std::vector<std::uint8_t> bytes,
                            std::optional<std::filesystem::path> soundBank) {
  SequenceSource s;
  s.midiBytes = std::move(bytes);
  s.soundBank = std::move(soundBank);
  return s;
}

std::string SequenceSource::display_name() const {
  if (midiPath)
    return midiPath->filename().string();
  return "<memory>";
}

Song load_song(const SequenceSource &source) {
  if (source.midiPath)
    return parse_smf(io::read_all(*source.midiPath));
  return parse_smf(source.midiBytes);
}

} // namespace midi
