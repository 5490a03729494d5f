#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <vector>

#include "midi/events.hpp"
#include "midi/smf.hpp"
#include "test_midi.hpp"

using midiplay_test::smf;
using midiplay_test::TrackWriter;

TEST(SmfParserTest, ParsesFormat1HeaderTracksAndNames) {
  TrackWriter conductor;
  conductor.name(0, "Conductor").tempo(0, 500000).end();
  TrackWriter piano;
  piano.name(0, "Piano").program(0, 0, 1).note_on(0, 0, 60).note_off(480, 0, 60)
      .end();

  const midi::Song song = midi::parse_smf(smf(1, 480, {conductor, piano}));

  EXPECT_EQ(song.header.format, 1);
  EXPECT_EQ(song.header.nTracks, 2);
  EXPECT_TRUE(song.header.isPPQN);
  EXPECT_EQ(song.header.ppqn, 480u);
  ASSERT_EQ(song.tracks.size(), 2u);
  EXPECT_EQ(song.tracks[0].name, "Conductor");
  EXPECT_EQ(song.tracks[1].name, "Piano");
  EXPECT_EQ(song.tracks[0].eventCount, 0u);
  EXPECT_EQ(song.tracks[1].eventCount, 3u);
  EXPECT_EQ(song.tracks[1].endTick, 480u);
  ASSERT_EQ(song.tempi.size(), 1u);
  EXPECT_EQ(song.tempi[0].usPerQN, 500000u);
  ASSERT_EQ(song.events.size(), 3u);
  EXPECT_EQ(song.events[0].type, midi::EvType::ProgramChange);
  EXPECT_EQ(song.events[0].track, 1);
}

TEST(SmfParserTest, RunningStatusAndZeroVelocityNoteOn) {
  TrackWriter t;
  t.event(0, {0x90, 60, 100})
      .event(10, {62, 90})  // running status NoteOn
      .event(10, {60, 0})   // NoteOn velocity 0 == NoteOff
      .end();

  const midi::Song song = midi::parse_smf(smf(0, 480, {t}));

  ASSERT_EQ(song.events.size(), 3u);
  EXPECT_EQ(song.events[1].type, midi::EvType::NoteOn);
  EXPECT_EQ(song.events[1].data1, 62);
  EXPECT_EQ(song.events[1].tick, 10u);
  EXPECT_EQ(song.events[2].type, midi::EvType::NoteOff);
  EXPECT_EQ(song.events[2].tick, 20u);
}

TEST(SmfParserTest, KeepsControllersAndPitchBend) {
  TrackWriter t;
  t.event(0, {0xB3, 7, 90}).event(0, {0xE3, 0x00, 0x50}).end();

  const midi::Song song = midi::parse_smf(smf(0, 480, {t}));

  ASSERT_EQ(song.events.size(), 2u);
  EXPECT_EQ(song.events[0].type, midi::EvType::ControlChange);
  EXPECT_EQ(song.events[0].ch, 3);
  EXPECT_EQ(song.events[1].type, midi::EvType::PitchBend);
  EXPECT_EQ(midi::pitch_bend_value(song.events[1]), 0x50 << 7);
}

TEST(SmfParserTest, RejectsDataWithoutHeaderChunk) {
  const std::vector<std::uint8_t> riff = {'R', 'I', 'F', 'F', 0, 0, 0, 4,
                                          'W', 'A', 'V', 'E'};
  EXPECT_THROW(midi::parse_smf(riff), std::runtime_error);
}

TEST(SmfParserTest, RejectsFileWithFewerTracksThanDeclared) {
  TrackWriter t;
  t.note_on(0, 0, 60).end();
  EXPECT_THROW(midi::parse_smf(smf(1, 480, {t}, 2)), std::runtime_error);
}

TEST(SmfParserTest, SkipsUnknownChunks) {
  std::vector<std::uint8_t> bytes = smf(0, 480, {}, 1);
  midiplay_test::put_chunk(bytes, "XFIH", {1, 2, 3});
  TrackWriter t;
  t.note_on(0, 0, 60).end();
  midiplay_test::put_chunk(bytes, "MTrk", t.bytes());

  const midi::Song song = midi::parse_smf(bytes);
  ASSERT_EQ(song.tracks.size(), 1u);
  EXPECT_EQ(song.events.size(), 1u);
}

TEST(SmfParserTest, RejectsOverlongDeltaTime) {
  std::vector<std::uint8_t> bytes = smf(0, 480, {}, 1);
  midiplay_test::put_chunk(bytes, "MTrk",
                           {0xFF, 0xFF, 0xFF, 0xFF, 0x7F, 0x90, 60, 100});
  EXPECT_THROW(midi::parse_smf(bytes), std::runtime_error);
}

TEST(SmfParserTest, ParsesSmpteDivision) {
  TrackWriter t;
  t.note_on(0, 0, 60).note_off(1000, 0, 60).end();
  // -25 fps, 40 subframes per frame
  const std::uint16_t division = ((256 - 25) << 8) | 40;

  const midi::Song song = midi::parse_smf(smf(0, division, {t}));

  EXPECT_FALSE(song.header.isPPQN);
  EXPECT_EQ(song.header.smpte_fps, 25);
  EXPECT_EQ(song.header.smpte_sub, 40);
}

TEST(SmfParserTest, MissingEndOfTrackUsesLastEvent) {
  TrackWriter t;
  t.note_on(0, 0, 60).note_off(960, 0, 60);

  const midi::Song song = midi::parse_smf(smf(0, 480, {t}));
  ASSERT_EQ(song.tracks.size(), 1u);
  EXPECT_EQ(song.tracks[0].endTick, 960u);
}
