#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "audio/audio_backend.hpp"

namespace agent_notifier::audio {

// Set to any value to silence every notification (CI, headless machines).
constexpr const char* kDisableSoundEnv = "AGENT_NOTIFIER_DISABLE_SOUND";

bool sound_disabled_by_env();

// Fire-and-forget playback of the notification sound on a blocking-capable pool.
class SoundPlayer {
 public:
  SoundPlayer(boost::asio::thread_pool::executor_type executor, AudioBackend& backend, std::vector<std::uint8_t> sound,
              bool enabled = true);

  // Schedules playback and returns immediately; false when playback is switched off.
  bool play();

  [[nodiscard]] bool enabled() const { return enabled_; }

 private:
  boost::asio::thread_pool::executor_type executor_;
  AudioBackend& backend_;
  std::shared_ptr<const std::vector<std::uint8_t>> sound_;
  bool enabled_;
};

}  // namespace agent_notifier::audio
