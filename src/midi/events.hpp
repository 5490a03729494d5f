// src/midi/events.hpp
// Core MIDI domain types shared across the app.
// Keep this header light: plain structs, no implementation details.

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace midi {

// --- Channel event kinds the synth consumes ---
enum class EvType { NoteOn, NoteOff, ProgramChange, ControlChange, PitchBend };

// A channel voice event at an absolute tick.
//   NoteOn/NoteOff : data1 = note, data2 = velocity
//   ProgramChange  : data1 = program
//   ControlChange  : data1 = controller, data2 = value
//   PitchBend      : data1 = LSB, data2 = MSB (see pitch_bend_value)
struct ChannelEv {
  std::uint32_t tick;  // absolute tick in its track timeline
  std::uint8_t ch;     // MIDI channel 0..15
  std::uint8_t data1;  // 0..127
  std::uint8_t data2;  // 0..127
  EvType type;
  std::uint16_t track; // index of the MTrk chunk it came from
};

// 14-bit pitch wheel value, 8192 = centre.
inline int pitch_bend_value(const ChannelEv &ev) {
  return (static_cast<int>(ev.data2) << 7) | ev.data1;
}

inline bool is_note(const ChannelEv &ev) {
  return ev.type == EvType::NoteOn || ev.type == EvType::NoteOff;
}

// A tempo meta event: microseconds per quarter note at a given tick
struct TempoEv {
  std::uint32_t tick;    // absolute tick where tempo takes effect
  std::uint32_t usPerQN; // microseconds per quarter note
};

// Parsed SMF header (subset we need)
struct SMFHeader {
  std::uint16_t format = 0;   // 0, 1, or 2
  std::uint16_t nTracks = 0;  // number of track chunks
  std::uint16_t division = 0; // raw division field

  bool isPPQN = true;  // true if PPQN timing, false if SMPTE
  unsigned ppqn = 480; // valid when isPPQN == true
  int smpte_fps = 0;   // valid when isPPQN == false
  int smpte_sub = 0;   // valid when isPPQN == false
};

// Per-track metadata gathered while walking an MTrk chunk.
struct Track {
  std::string name;          // Sequence/Track Name meta (0x03), if any
  std::uint32_t endTick = 0;  // End of Track tick (every track starts at 0)
  std::size_t eventCount = 0; // channel events kept from this track
};

// The parsed song: header + per-track info + extracted events.
struct Song {
  SMFHeader header;
  std::vector<Track> tracks;
  std::vector<ChannelEv> events; // flattened across tracks (absolute ticks)
  std::vector<TempoEv> tempi;    // collected from all tracks (sorted later)
};

// A precomputed timing map to convert ticks -> seconds under tempo changes.
struct TempoSeg {
  std::uint32_t startTick = 0; // segment begins at this absolute tick
  double startSec = 0;         // time in seconds at startTick
  double usPerQN = 500000.0;   // tempo in this segment
};

struct TempoMap {
  unsigned ppqn = 480;            // ticks per quarter note
  std::vector<TempoSeg> segments; // ascending by startTick
  double smpteTickSec = 0.0;      // > 0 for SMPTE division: fixed tick length
};

} // namespace midi
