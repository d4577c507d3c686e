#include "notify/dispatcher.hpp"

#include <exception>
#include <string>

#include "core/errors.hpp"
#include "notify/validator.hpp"

namespace agent_notifier::notify {

std::string format_notification_body(std::string_view agent, std::string_view content) {
  std::string body;
  body.reserve(agent.size() + 2 + content.size());
  body.append(agent).append(": ").append(content);
  return utf8_truncate(body, kMaxNotificationBodyChars);
}

Dispatcher::Dispatcher(Notifier& notifier, audio::SoundPlayer& sound) : notifier_(notifier), sound_(sound) {}

void Dispatcher::dispatch(const std::string& title, std::string_view content, std::string_view agent) {
  const auto body = format_notification_body(agent, content);

  try {
    notifier_.show(title, body);
  } catch (const std::exception& ex) {
    throw core::DispatchFailed(std::string("Failed to dispatch notification: ") + ex.what());
  }

  sound_.play();
}

}  // namespace agent_notifier::notify
