#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace agent_notifier::core {

enum class NotifierBackend { kAuto, kLibnotify, kLog };

struct SoundConfig {
  bool enabled{true};
  std::string file{};
  std::size_t worker_threads{1};
};

struct RelayConfig {
  std::string app_name{"agent-notifier"};
  std::string settings_path{"settings.json"};
  std::size_t worker_threads{2};
  std::chrono::seconds keepalive_interval{25};
  NotifierBackend notifier{NotifierBackend::kAuto};
  SoundConfig sound{};
};

RelayConfig load_relay_config(const std::string& path);

}  // namespace agent_notifier::core
