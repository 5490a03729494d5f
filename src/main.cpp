// src/main.cpp
// midiplay: play a Standard MIDI File through a SoundFont, or bounce it to a
// WAV file.
//
// Modes:
//   default   live playback with console transport commands
//   --bounce  offline render; the bounce runs on a worker thread while the
//             main thread drives the event loop that prints progress
//   --info    print the file summary and exit

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>

#include "app/cli.hpp"
#include "app/console.hpp"
#include "app/preview.hpp"
#include "app/settings.hpp"
#include "audio/synth.hpp"
#include "bounce/bouncer.hpp"
#include "common/errors.hpp"
#include "common/event_loop.hpp"
#include "common/log.hpp"
#include "io/soundbank_locator.hpp"
#include "midi/sequence.hpp"
#include "midi/source.hpp"
#include "transport/controller.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

constexpr double kSignalCheckPeriod = 0.05;

std::optional<std::filesystem::path> pick_sound_bank(const app::Cli &cli,
                                                     const common::Logger &log) {
  if (cli.sfOverride) {
    auto bank = io::resolve_sound_bank(*cli.sfOverride, "soundfonts");
    if (!bank)
      throw std::runtime_error("SoundFont not found: " + *cli.sfOverride);
    log.info("Using SoundFont " + bank->string());
    return bank;
  }

  auto bank =
      io::guess_sound_bank(cli.midiPath, cli.settings.looseSoundBankMatching);
  if (bank) {
    log.info("Using SoundFont " + bank->string());
  } else {
    log.info(std::string("No matching SoundFont next to the MIDI file, using ") +
             audio::SoundFontSynth::kDefaultSoundBank);
  }
  return bank;
}

int run_player(const app::Cli &cli, const midi::SequenceSource &source,
               const common::Logger &log) {
  common::EventLoop loop;
  app::ConsoleNowPlaying nowPlaying;
  auto transport = transport::TransportController::load(
      source, nowPlaying, loop, log, app::transport_options(cli.settings));

  app::print_preview(midi::Sequence(midi::load_song(source)));
  std::cout << "\n";

  app::ConsoleTransportObserver observer(loop);
  transport->set_observer(&observer);
  if (cli.rate != 1.0f)
    transport->set_rate(cli.rate);

  transport->prepare_to_play();
  transport->play();

  app::ConsoleInput input(loop, [&](const std::string &line) {
    if (!app::handle_command(line, *transport))
      loop.quit();
  });
  input.start();

  loop.schedule_repeating(common::EventLoop::Seconds(kSignalCheckPeriod),
                          common::EventLoop::Seconds(0.01), [&loop]() {
                            if (g_interrupted)
                              loop.quit();
                          });
  loop.run();

  input.stop();
  transport->set_observer(nullptr);
  transport->stop();
  std::cout << "\n";
  return 0;
}

int run_bounce(const app::Cli &cli, const midi::SequenceSource &source,
               const common::Logger &log) {
  const std::filesystem::path destination = *cli.bounceTo;

  common::EventLoop loop;
  bounce::BounceEngine engine(source, app::bounce_options(cli.settings), loop,
                              log);
  engine.set_rate(cli.rate);

  app::ConsoleBounceObserver observer(loop);
  engine.set_observer(&observer);

  std::thread worker([&engine, &destination]() { engine.bounce(destination); });

  loop.schedule_repeating(common::EventLoop::Seconds(kSignalCheckPeriod),
                          common::EventLoop::Seconds(0.01), [&engine]() {
                            if (g_interrupted)
                              engine.cancel();
                          });
  loop.run();
  worker.join();

  if (!observer.succeeded()) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
    if (ec)
      log.warn("Could not remove " + destination.string() + ": " +
               ec.message());
    return 1;
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  app::Cli cli;
  try {
    cli = app::parse_cli(argc, argv);
  } catch (const app::UsageError &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 2;
  }
  if (cli.help) {
    std::cout << app::usage(argc > 0 ? argv[0] : "midiplay");
    return 0;
  }

  common::Logger log(cli.settings.logLevel);
  std::signal(SIGINT, on_sigint);

  try {
    const auto bank = pick_sound_bank(cli, log);
    const auto source = midi::SequenceSource::from_file(cli.midiPath, bank);

    if (cli.info) {
      app::print_preview(midi::Sequence(midi::load_song(source)));
      return 0;
    }
    if (cli.bounceTo)
      return run_bounce(cli, source, log);
    return run_player(cli, source, log);
  } catch (const common::PlaybackError &ex) {
    std::cerr << "error: " << ex.describe() << "\n";
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
