// src/midi/tempo.cpp
// Implementation of timing utilities.

#include "midi/tempo.hpp"

#include <algorithm>
#include <vector>

namespace midi {

TempoMap build_tempo_map(const Song &song) {
  TempoMap map;

  if (!song.header.isPPQN) {
    // SMPTE: 29 in the header means 29.97 drop-frame.
    const double fps =
        song.header.smpte_fps == 29 ? 29.97 : song.header.smpte_fps;
    map.smpteTickSec = 1.0 / (fps * song.header.smpte_sub);
    map.segments.push_back(TempoSeg{0u, 0.0, 500000.0});
    return map;
  }

  map.ppqn = song.header.ppqn;

  // Work on a copy so we can sort safely
  std::vector<TempoEv> tempi = song.tempi;
  std::stable_sort(
      tempi.begin(), tempi.end(),
      [](const TempoEv &a, const TempoEv &b) { return a.tick < b.tick; });

  // Default tempo is 120 BPM => 500,000 microseconds per quarter note
  double current_usPerQN = 500000.0;
  double accSec = 0.0;
  std::uint32_t lastTick = 0;

  map.segments.push_back(TempoSeg{0u, 0.0, current_usPerQN});

  for (const auto &t : tempi) {
    if (t.usPerQN == 0)
      continue; // a zero tempo would stop time altogether

    // Advance accumulated seconds from lastTick to this tempo-change tick
    const double deltaQN = (t.tick - lastTick) / static_cast<double>(map.ppqn);
    accSec += deltaQN * (current_usPerQN * 1e-6);

    current_usPerQN = static_cast<double>(t.usPerQN);
    lastTick = t.tick;
    if (map.segments.back().startTick == t.tick) {
      // Several changes on one tick: the last one wins.
      map.segments.back().usPerQN = current_usPerQN;
    } else {
      map.segments.push_back(TempoSeg{t.tick, accSec, current_usPerQN});
    }
  }

  return map;
}

double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo) {
  if (tempo.smpteTickSec > 0.0)
    return tick * tempo.smpteTickSec;

  // Last segment whose startTick <= tick
  auto it = std::upper_bound(
      tempo.segments.begin(), tempo.segments.end(), tick,
      [](std::uint32_t t, const TempoSeg &s) { return t < s.startTick; });
  const TempoSeg &seg = it == tempo.segments.begin() ? *it : *(it - 1);

  const double deltaQN =
      (tick - seg.startTick) / static_cast<double>(tempo.ppqn);
  return seg.startSec + deltaQN * (seg.usPerQN * 1e-6);
}

} // namespace midi
