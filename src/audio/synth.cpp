// src/audio/synth.cpp
// TinySoundFont wrapper. This translation unit carries the tsf
// implementation so headers elsewhere stay clean.

#define TSF_IMPLEMENTATION
#include "tsf.h"

#include "audio/synth.hpp"

#include <stdexcept>
#include <string>

namespace audio {

SoundFontSynth::SoundFontSynth(
    const std::optional<std::filesystem::path> &soundBank, StreamFormat format)
    : format_(format),
      bankPath_(soundBank ? *soundBank
                          : std::filesystem::path(kDefaultSoundBank)) {
  if (format_.sampleRate == 0)
    throw std::runtime_error("Synth sample rate must be positive");

  synth_ = tsf_load_filename(bankPath_.string().c_str());
  if (synth_ == nullptr) {
    throw std::runtime_error("Failed to load SoundFont (.sf2): " +
                             bankPath_.string());
  }

  // Anything but mono renders interleaved stereo.
  format_.channels = format_.channels == 1 ? 1 : 2;
  tsf_set_output(synth_,
                 format_.channels == 1 ? TSF_MONO : TSF_STEREO_INTERLEAVED,
                 static_cast<int>(format_.sampleRate), 0.0f);
  tsf_set_volume(synth_, 0.8f); // modest headroom
  reset_channels();
}

SoundFontSynth::~SoundFontSynth() {
  if (synth_)
    tsf_close(synth_);
}

void SoundFontSynth::reset_channels() {
  // GM defaults: program 0 everywhere, drum kit on channel 10.
  for (int ch = 0; ch < 16; ++ch) {
    // A bank without preset 0 leaves the channel silent until a Program
    // Change selects something it has.
    (void)tsf_channel_set_presetnumber(synth_, ch, 0, ch == 9);
  }
}

void SoundFontSynth::handle(const midi::ChannelEv &ev) {
  switch (ev.type) {
  case midi::EvType::NoteOn:
    tsf_channel_note_on(synth_, ev.ch, ev.data1, ev.data2 / 127.0f);
    break;
  case midi::EvType::NoteOff:
    tsf_channel_note_off(synth_, ev.ch, ev.data1);
    break;
  case midi::EvType::ProgramChange:
    (void)tsf_channel_set_presetnumber(synth_, ev.ch, ev.data1, ev.ch == 9);
    break;
  case midi::EvType::ControlChange:
    tsf_channel_midi_control(synth_, ev.ch, ev.data1, ev.data2);
    break;
  case midi::EvType::PitchBend:
    tsf_channel_set_pitchwheel(synth_, ev.ch, midi::pitch_bend_value(ev));
    break;
  }
}

void SoundFontSynth::all_notes_off() { tsf_note_off_all(synth_); }

void SoundFontSynth::render(float *out, std::uint32_t frames) {
  if (preloadPending_.exchange(false)) {
    // Runs on the audio thread, once, before any voice is active for the
    // new setting.
    if (!tsf_set_max_voices(synth_, kPreloadVoices))
      preload_.store(false);
  }
  tsf_render_float(synth_, out, static_cast<int>(frames), 0);
}

void SoundFontSynth::set_running(bool running) { running_.store(running); }

void SoundFontSynth::set_preload(bool enabled) {
  if (!running_.load()) {
    throw std::logic_error(
        "Synth must be attached to a running audio graph to set preload");
  }
  preload_.store(enabled);
  if (enabled)
    preloadPending_.store(true);
}

} // namespace audio
