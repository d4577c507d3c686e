#include "audio/sound_player.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>

#include <boost/asio/post.hpp>

namespace agent_notifier::audio {

bool sound_disabled_by_env() { return std::getenv(kDisableSoundEnv) != nullptr; }

SoundPlayer::SoundPlayer(boost::asio::thread_pool::executor_type executor, AudioBackend& backend,
                         std::vector<std::uint8_t> sound, bool enabled)
    : executor_(executor),
      backend_(backend),
      sound_(std::make_shared<const std::vector<std::uint8_t>>(std::move(sound))),
      enabled_(enabled) {}

bool SoundPlayer::play() {
  if (!enabled_ || sound_disabled_by_env()) {
    return false;
  }

  boost::asio::post(executor_, [&backend = backend_, sound = sound_]() {
    try {
      auto output = backend.open_default_output();
      const auto samples = backend.decode(*sound);
      output->play_and_wait(samples);
    } catch (const std::exception& ex) {
      std::cerr << "[sound] notification sound failed: " << ex.what() << '\n';
    }
  });
  return true;
}

}  // namespace agent_notifier::audio
