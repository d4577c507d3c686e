#include <csignal>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "audio/audio_backend.hpp"
#include "audio/sound_player.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/relay.hpp"
#include "core/runtime.hpp"
#include "core/settings_store.hpp"
#include "core/tray.hpp"
#include "notify/dispatcher.hpp"
#include "notify/notifier.hpp"

namespace {

const char* to_string(agent_notifier::core::NotifierBackend backend) {
  switch (backend) {
    case agent_notifier::core::NotifierBackend::kAuto:
      return "auto";
    case agent_notifier::core::NotifierBackend::kLibnotify:
      return "libnotify";
    case agent_notifier::core::NotifierBackend::kLog:
      return "log";
  }
  return "unknown";
}

std::string format_config_settings(const agent_notifier::core::RelayConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[relay] loaded config from " << config_path
         << " | app_name=" << config.app_name
         << " | settings_path=" << config.settings_path
         << " | worker_threads=" << config.worker_threads
         << " | keepalive_interval_s=" << config.keepalive_interval.count()
         << " | notifier=" << to_string(config.notifier)
         << " | sound_enabled=" << (config.sound.enabled ? "true" : "false")
         << " | sound_file=" << (config.sound.file.empty() ? "<built-in>" : config.sound.file);
  return output.str();
}

std::unique_ptr<agent_notifier::notify::Notifier> make_notifier(const agent_notifier::core::RelayConfig& config) {
  using agent_notifier::core::NotifierBackend;
  if (config.notifier == NotifierBackend::kLog) {
    return agent_notifier::notify::make_log_notifier();
  }
#if defined(AGENT_NOTIFIER_HAVE_LIBNOTIFY)
  return agent_notifier::notify::make_libnotify_notifier(config.app_name);
#else
  if (config.notifier == NotifierBackend::kLibnotify) {
    throw std::runtime_error("notifier.backend=libnotify but libnotify support is not compiled in");
  }
  std::cerr << "[notify] libnotify support not compiled in; notifications go to the log\n";
  return agent_notifier::notify::make_log_notifier();
#endif
}

std::unique_ptr<agent_notifier::audio::AudioBackend> make_audio_backend(const agent_notifier::core::RelayConfig& config) {
#if defined(AGENT_NOTIFIER_HAVE_PIPEWIRE)
  return agent_notifier::audio::make_pipewire_backend(config.app_name.c_str());
#else
  (void)config;
  return agent_notifier::audio::make_none_backend();
#endif
}

std::vector<std::uint8_t> load_sound(const agent_notifier::core::RelayConfig& config) {
  if (config.sound.file.empty()) {
    return agent_notifier::audio::make_ping_wav();
  }
  std::ifstream input(config.sound.file, std::ios::binary);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open sound file: " + config.sound.file);
  }
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

void reload_bindings(agent_notifier::core::Relay& relay, agent_notifier::core::SettingsStore& store) {
  try {
    relay.save_http_bindings(store.load());
  } catch (const agent_notifier::core::SettingsError& ex) {
    std::cerr << "[relay] reload failed: " << ex.what() << '\n';
  }
}

}  // namespace

int main(int argc, char** argv) {
  using namespace agent_notifier;

  const std::string config_path = argc > 1 ? argv[1] : "configs/agent-notifier.yaml";

  core::RelayConfig config{};
  try {
    config = core::load_relay_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::unique_ptr<notify::Notifier> notifier;
  std::unique_ptr<audio::AudioBackend> audio_backend;
  std::vector<std::uint8_t> sound;
  try {
    notifier = make_notifier(config);
    audio_backend = make_audio_backend(config);
    sound = load_sound(config);
  } catch (const std::exception& ex) {
    std::cerr << "startup error: " << ex.what() << '\n';
    return 1;
  }

  notify::ensure_notification_permission(*notifier);

  const bool sound_enabled = config.sound.enabled && !audio::sound_disabled_by_env();
  if (config.sound.enabled && !sound_enabled) {
    std::cerr << "[sound] disabled by " << audio::kDisableSoundEnv << '\n';
  }

  core::Runtime runtime{config.worker_threads, config.sound.worker_threads};
  audio::SoundPlayer player{runtime.blocking_executor(), *audio_backend, std::move(sound), sound_enabled};
  notify::Dispatcher dispatcher{*notifier, player};
  core::JsonFileSettingsStore store{config.settings_path};
  auto tray = core::make_null_tray_controller();

  core::Relay relay{runtime, dispatcher, store, *tray,
                    core::RelayOptions{.keepalive_interval = config.keepalive_interval}};

  runtime.start();
  if (!relay.start()) {
    std::cerr << "[relay] HTTP server is down; fix the binding in " << config.settings_path
              << " and send SIGHUP\n";
  }

  // Signals are handled on their own context so a listener restart never runs
  // on an I/O worker.
  boost::asio::io_context control;
  boost::asio::signal_set signals(control, SIGINT, SIGTERM);
  signals.add(SIGUSR1);
  signals.add(SIGUSR2);
  signals.add(SIGHUP);

  std::function<void(const boost::system::error_code&, int)> on_signal;
  on_signal = [&](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    bool quit = false;
    switch (signal_number) {
      case SIGUSR1:
        quit = relay.handle_tray_action(core::TrayAction::kStartListening);
        break;
      case SIGUSR2:
        quit = relay.handle_tray_action(core::TrayAction::kStopListening);
        break;
      case SIGHUP:
        reload_bindings(relay, store);
        break;
      default:
        quit = relay.handle_tray_action(core::TrayAction::kQuit);
        break;
    }
    if (quit) {
      std::cerr << "[relay] shutdown signal received; exiting cleanly\n";
      return;
    }
    signals.async_wait(on_signal);
  };
  signals.async_wait(on_signal);
  control.run();

  relay.shutdown();
  runtime.stop();

  return 0;
}
