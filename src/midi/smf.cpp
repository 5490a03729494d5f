// src/midi/smf.cpp
// Parse a Standard MIDI File (SMF) from memory into midi::Song.
// Pure parsing: no printing, no I/O.

#include "midi/smf.hpp"
#include "common/reader.hpp" // Bytes cursor + read_vlq()
#include "midi/events.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::uint32_t kMThd = 0x4D546864; // "MThd"
constexpr std::uint32_t kMTrk = 0x4D54726B; // "MTrk"

// Parse SMF header (MThd chunk) and fill midi::SMFHeader.
midi::SMFHeader parse_header(Bytes &r) {
  const std::uint32_t id = r.be32();
  if (id != kMThd) {
    throw std::runtime_error("Not a MIDI file (missing 'MThd')");
  }

  const std::uint32_t length = r.be32();
  if (length < 6) {
    throw std::runtime_error("Header chunk length must be at least 6");
  }

  midi::SMFHeader h{};
  h.format = r.be16();
  h.nTracks = r.be16();
  h.division = r.be16();
  r.skip(length - 6); // future header fields

  if (h.format > 2) {
    throw std::runtime_error("Unsupported SMF format " +
                             std::to_string(h.format));
  }

  if ((h.division & 0x8000) == 0) {
    // PPQN timing (ticks per quarter note)
    h.isPPQN = true;
    h.ppqn = static_cast<unsigned>(h.division & 0x7FFF);
    if (h.ppqn == 0)
      throw std::runtime_error("PPQN division must not be zero");
  } else {
    // SMPTE timing (two's-complement FPS in high byte, subframes in low byte)
    h.isPPQN = false;
    h.smpte_fps = 256 - ((h.division >> 8) & 0xFF); // e.g., 24, 25, 29, 30
    h.smpte_sub = static_cast<int>(h.division & 0xFF);
    if (h.smpte_fps <= 0 || h.smpte_sub <= 0)
      throw std::runtime_error("Invalid SMPTE division");
  }

  return h; // r.off now points to the first chunk after MThd
}

// Walk a single MTrk payload and append events to the song.
void walk_one_track(Bytes tr, std::uint16_t trackIndex, midi::Song &song) {
  midi::Track track;
  std::uint32_t tick = 0;
  std::uint8_t running = 0; // last seen channel status for running status

  while (!tr.at_end()) {
    // 1) Delta-time (Variable-Length Quantity)
    tick += read_vlq(tr);

    // 2) Status or running status?
    std::uint8_t first = tr.u8();
    std::uint8_t status = 0;
    bool haveData1 = false;
    std::uint8_t data1 = 0;

    if (first & 0x80) {
      status = first;
      if ((status & 0xF0) < 0xF0) {
        running = status; // only channel messages set running status
      }
    } else {
      // Running status: 'first' is actually data1 for the previous channel
      // status
      if (running == 0) {
        throw std::runtime_error("Running status used before any status");
      }
      status = running;
      haveData1 = true;
      data1 = first;
    }

    const std::uint8_t type = status & 0xF0;
    const std::uint8_t ch = status & 0x0F;

    // Channel messages with two data bytes
    if (type == 0x80 || type == 0x90 || type == 0xA0 || type == 0xB0 ||
        type == 0xE0) {
      const std::uint8_t d1 = haveData1 ? data1 : tr.u8();
      const std::uint8_t d2 = tr.u8();

      midi::ChannelEv ev{tick, ch, d1, d2, midi::EvType::NoteOn, trackIndex};
      if (type == 0x90 && d2 != 0) {
        ev.type = midi::EvType::NoteOn;
      } else if (type == 0x80 || type == 0x90) {
        // Note Off (either true 0x80 or "Note On with velocity 0")
        ev.type = midi::EvType::NoteOff;
      } else if (type == 0xB0) {
        ev.type = midi::EvType::ControlChange;
      } else if (type == 0xE0) {
        ev.type = midi::EvType::PitchBend;
      } else {
        continue; // Poly aftertouch: not used by the synth
      }
      song.events.push_back(ev);
      ++track.eventCount;
      continue;
    }

    // Channel messages with one data byte
    if (type == 0xC0 || type == 0xD0) {
      const std::uint8_t d1 = haveData1 ? data1 : tr.u8();
      if (type == 0xC0) {
        song.events.push_back(midi::ChannelEv{
            tick, ch, d1, 0, midi::EvType::ProgramChange, trackIndex});
        ++track.eventCount;
      }
      continue; // Channel Pressure is ignored
    }

    // Meta events
    if (status == 0xFF) {
      const std::uint8_t metaType = tr.u8();
      const std::uint32_t mlen = read_vlq(tr);

      if (metaType == 0x2F) { // End of Track
        tr.skip(mlen);
        break;
      } else if (metaType == 0x51 && mlen == 3) {
        song.tempi.push_back(midi::TempoEv{tick, tr.be24()});
      } else if (metaType == 0x03) {
        Bytes name = tr.slice(mlen);
        track.name.assign(reinterpret_cast<const char *>(name.data),
                          name.size);
      } else {
        tr.skip(mlen);
      }
      continue;
    }

    // SysEx events
    if (status == 0xF0 || status == 0xF7) {
      tr.skip(read_vlq(tr));
      continue;
    }

    std::ostringstream oss;
    oss << "Unsupported or malformed status byte: 0x" << std::hex
        << int(status);
    throw std::runtime_error(oss.str());
  }

  // A missing End of Track meta is tolerated: the last event ends the track.
  track.endTick = tick;
  song.tracks.push_back(std::move(track));
}

} // namespace

namespace midi {

Song parse_smf(const std::vector<std::uint8_t> &bytes) {
  Bytes r(bytes);

  Song song;
  song.header = parse_header(r);
  song.tracks.reserve(song.header.nTracks);
  song.events.reserve(4096);
  song.tempi.reserve(64);

  std::uint16_t found = 0;
  while (found < song.header.nTracks) {
    if (r.remaining() < 8) {
      throw std::runtime_error("File ends after " + std::to_string(found) +
                               " of " +
                               std::to_string(song.header.nTracks) +
                               " tracks");
    }
    const std::uint32_t id = r.be32();
    const std::uint32_t len = r.be32();
    Bytes chunk = r.slice(len);
    if (id != kMTrk) {
      continue; // unknown chunk types are skipped
    }
    walk_one_track(chunk, found, song);
    ++found;
  }

  return song;
}

} // namespace midi
