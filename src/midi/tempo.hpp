// src/midi/tempo.hpp
// Timing utilities: build a tempo map and convert ticks -> seconds.
//
// Contract:
//  - build_tempo_map(const Song&): consumes Song.header + Song.tempi
//      * PPQN files: segments of constant tempo, 120 BPM until the first
//        tempo event.
//      * SMPTE files: ticks have a fixed length of 1 / (fps * subframes)
//        seconds; tempo events are ignored.
//  - ticks_to_seconds(tick, TempoMap): converts absolute tick to seconds.

#pragma once
#include "midi/events.hpp"

#include <cstdint>

namespace midi {

TempoMap build_tempo_map(const Song &song);

// Convert an absolute tick to seconds using the TempoMap.
// - Beyond the last tempo change we continue with the last tempo.
double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo);

} // namespace midi
