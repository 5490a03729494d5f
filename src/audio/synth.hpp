// src/audio/synth.hpp
// SoundFont synthesizer unit built on TinySoundFont (tsf).
//
// - Loads a .sf2 sound bank, or the system default GM bank when none is
//   given.
// - Channel 10 (index 9) plays the drum kit, every other channel starts on
//   GM program 0 until a Program Change arrives.
// - set_preload(true) pre-allocates the voice pool so note-ons never
//   allocate on the audio thread. It is only valid while attached to a
//   running device or graph; calling it otherwise is a programming error and
//   throws std::logic_error.

#pragma once
#include <atomic>
#include <filesystem>
#include <optional>

#include "audio/instrument.hpp"

struct tsf;

namespace audio {

class SoundFontSynth : public Instrument {
public:
  static constexpr const char *kDefaultSoundBank =
      "/usr/share/sounds/sf2/FluidR3_GM.sf2";
  static constexpr int kPreloadVoices = 256;

  // Throws std::runtime_error if the bank cannot be loaded.
  explicit SoundFontSynth(const std::optional<std::filesystem::path> &soundBank,
                          StreamFormat format = {});
  ~SoundFontSynth() override;

  SoundFontSynth(const SoundFontSynth &) = delete;
  SoundFontSynth &operator=(const SoundFontSynth &) = delete;

  void handle(const midi::ChannelEv &ev) override;
  void all_notes_off() override;
  void render(float *out, std::uint32_t frames) override;
  StreamFormat format() const override { return format_; }
  void set_running(bool running) override;
  void prepare() override { set_preload(true); }

  void set_preload(bool enabled);
  bool preload_enabled() const { return preload_.load(); }

  const std::filesystem::path &sound_bank() const { return bankPath_; }

private:
  void reset_channels();

  tsf *synth_ = nullptr;
  StreamFormat format_;
  std::filesystem::path bankPath_;
  std::atomic<bool> running_{false};
  std::atomic<bool> preload_{false};
  std::atomic<bool> preloadPending_{false};
};

} // namespace audio
