// src/app/preview.hpp
// Pretty, compact console preview of a loaded sequence.
// - Prints SMF header summary
// - Prints one line per track (name, events, end time) and the total length
// - Prints the first 10 NoteOn/NoteOff events with timestamps (s)

#pragma once
#include <algorithm>
#include <iomanip>
#include <iostream>

#include "midi/events.hpp"
#include "midi/sequence.hpp"

namespace app {

inline void print_preview(const midi::Sequence &sequence,
                          std::ostream &os = std::cout) {
  const midi::Song &song = sequence.song();

  // Header
  os << "SMF header:\n";
  os << "  format  = " << song.header.format << "\n";
  os << "  nTracks = " << song.header.nTracks << "\n";
  if (song.header.isPPQN) {
    os << "  PPQN    = " << song.header.ppqn << " ticks/qn\n";
  } else {
    os << "  SMPTE   = " << song.header.smpte_fps << " fps, "
       << song.header.smpte_sub << " subframes\n";
  }

  // Tracks
  os << std::fixed << std::setprecision(3);
  os << "\nTracks:\n";
  for (std::size_t i = 0; i < song.tracks.size(); ++i) {
    const midi::Track &t = song.tracks[i];
    os << "  #" << i << " " << (t.name.empty() ? "(unnamed)" : t.name)
       << "  events=" << t.eventCount
       << "  end=" << sequence.track_end_seconds(i) << "s\n";
  }
  if (auto length = sequence.length_seconds())
    os << "Length: " << *length << "s\n";
  else
    os << "Length: (no tracks)\n";

  // First 10 notes
  os << "\nFirst 10 note events with time:\n";
  std::size_t shown = 0;
  for (const auto &te : sequence.timeline()) {
    if (shown == 10)
      break;
    if (!midi::is_note(te.ev))
      continue;
    os << "t=" << te.tSec << "s  "
       << (te.ev.type == midi::EvType::NoteOn ? "On " : "Off")
       << " ch=" << int(te.ev.ch) << " note=" << int(te.ev.data1)
       << " vel=" << int(te.ev.data2) << "\n";
    ++shown;
  }
}

} // namespace app
