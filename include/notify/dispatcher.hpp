#pragma once

#include <string>
#include <string_view>

#include "audio/sound_player.hpp"
#include "notify/notifier.hpp"

namespace agent_notifier::notify {

// Body handed to the notifier: "{agent}: {content}" capped at kMaxNotificationBodyChars.
std::string format_notification_body(std::string_view agent, std::string_view content);

class Dispatcher {
 public:
  Dispatcher(Notifier& notifier, audio::SoundPlayer& sound);

  // Shows the notification, then schedules the sound. Throws core::DispatchFailed.
  void dispatch(const std::string& title, std::string_view content, std::string_view agent);

 private:
  Notifier& notifier_;
  audio::SoundPlayer& sound_;
};

}  // namespace agent_notifier::notify
