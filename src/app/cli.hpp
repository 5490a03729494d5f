// src/app/cli.hpp
// Command-line parsing for midiplay.
// Responsibilities:
//  - Extract the positional MIDI path and validate that it exists.
//  - Parse the options into app::Settings plus the per-run choices (sound
//    bank override, bounce target, rate, info mode).
//
// Design notes:
//  * Header-only; main() is the only caller.
//  * Bad input throws UsageError; main() catches, prints and exits with 2.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   cli.midiPath     --> std::filesystem::path to the .mid file
//   cli.sfOverride   --> std::optional<std::string> (empty if not provided)
//   cli.settings     --> app::Settings

#pragma once
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "app/settings.hpp"

namespace app {

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Cli {
  std::filesystem::path midiPath;
  std::optional<std::string> sfOverride; // from --sf <name-or-path>, if given
  std::optional<std::filesystem::path> bounceTo;
  float rate = 1.0f;
  bool info = false;
  bool help = false;
  Settings settings;
};

inline std::string usage(const std::string &program) {
  return "Usage:\n  " + program +
         " <file.mid> [options]\n"
         "Options:\n"
         "  --sf <name-or-path>  SoundFont by path, or by name in soundfonts/\n"
         "  --loose-sf           Pick the closest-named .sf2 next to the MIDI\n"
         "  --rate <r>           Playback rate (> 0, default 1)\n"
         "  --bounce <out.wav>   Render to a WAV file instead of playing\n"
         "  --sample-rate <hz>   Bounce output sample rate (default 44100)\n"
         "  --channels <n>       Bounce output channels (default 2)\n"
         "  --format <fmt>       Bounce sample format: s16, s24, s32, f32\n"
         "  --realtime           Render the bounce at wall-clock speed\n"
         "  --null-audio         Play through a silent null device\n"
         "  --cacophony          Do not take over the now-playing display\n"
         "  --info               Print the file summary and exit\n"
         "  --verbose | --quiet  More or less logging\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline std::uint32_t parse_positive(const std::string &flag,
                                    const std::string &value) {
  std::size_t used = 0;
  unsigned long n = 0;
  try {
    n = std::stoul(value, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used != value.size() || n == 0 || n > 1000000) {
    throw UsageError(flag + " expects a positive integer, got '" + value +
                     "'");
  }
  return static_cast<std::uint32_t>(n);
}

inline float parse_rate(const std::string &value) {
  std::size_t used = 0;
  float r = 0.0f;
  try {
    r = std::stof(value, &used);
  } catch (const std::exception &) {
    used = 0;
  }
  if (used != value.size() || !std::isfinite(r) || r <= 0.0f)
    throw UsageError("--rate expects a positive number, got '" + value + "'");
  return r;
}

inline bounce::SampleFormat parse_sample_format(const std::string &value) {
  if (value == "s16")
    return bounce::SampleFormat::S16;
  if (value == "s24")
    return bounce::SampleFormat::S24;
  if (value == "s32")
    return bounce::SampleFormat::S32;
  if (value == "f32")
    return bounce::SampleFormat::F32;
  throw UsageError("--format must be one of s16, s24, s32, f32");
}

// Parse argv into our Cli struct.
// Contract:
//  - argv[1] must be the MIDI file path (positional), unless it is --help.
//  - Throws UsageError on any invalid input.
inline Cli parse_cli(int argc, char **argv) {
  const std::string program = argc > 0 ? argv[0] : "midiplay";
  Cli cli;

  if (argc >= 2 && (std::string(argv[1]) == "--help" ||
                    std::string(argv[1]) == "-h")) {
    cli.help = true;
    return cli;
  }
  if (argc < 2)
    throw UsageError(usage(program));

  // 1) Positional MIDI path
  std::filesystem::path midiPath = argv[1];
  if (is_flag_like(midiPath.string())) {
    throw UsageError("First argument must be a MIDI file path, not a flag.\n" +
                     usage(program));
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(midiPath, ec)) {
    throw UsageError("MIDI file not found: " + midiPath.string());
  }

  // 2) Optional flags
  auto value = [&](int &i, const std::string &flag) {
    if (i + 1 >= argc)
      throw UsageError(flag + " requires a value");
    return std::string(argv[++i]);
  };

  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      cli.help = true;
    } else if (a == "--sf") {
      cli.sfOverride = value(i, a);
    } else if (a == "--loose-sf") {
      cli.settings.looseSoundBankMatching = true;
    } else if (a == "--rate") {
      cli.rate = parse_rate(value(i, a));
    } else if (a == "--bounce") {
      cli.bounceTo = std::filesystem::path(value(i, a));
    } else if (a == "--sample-rate") {
      cli.settings.bounceFormat.sampleRate = parse_positive(a, value(i, a));
    } else if (a == "--channels") {
      cli.settings.bounceFormat.channels = parse_positive(a, value(i, a));
    } else if (a == "--format") {
      cli.settings.bounceFormat.sampleFormat =
          parse_sample_format(value(i, a));
    } else if (a == "--realtime") {
      cli.settings.bouncePacing = bounce::Pacing::Realtime;
    } else if (a == "--null-audio") {
      cli.settings.backend = audio::DeviceBackend::Null;
    } else if (a == "--cacophony") {
      cli.settings.cacophonyMode = true;
    } else if (a == "--info") {
      cli.info = true;
    } else if (a == "--verbose") {
      cli.settings.logLevel = common::LogLevel::Debug;
    } else if (a == "--quiet") {
      cli.settings.logLevel = common::LogLevel::Error;
    } else {
      // Unknown flags are errors rather than silently ignored.
      throw UsageError("Unknown option: " + a + "\n" + usage(program));
    }
  }

  // 3) Return the parsed/validated CLI
  cli.midiPath = std::filesystem::canonical(midiPath); // nice absolute path
  return cli;
}

} // namespace app
