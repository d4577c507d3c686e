#pragma once

#include <memory>
#include <string>

namespace agent_notifier::notify {

enum class PermissionState { kGranted, kPrompt, kDenied };

const char* to_string(PermissionState state);

class Notifier {
 public:
  // Throws std::runtime_error when the notification could not be shown.
  virtual void show(const std::string& title, const std::string& body) = 0;
  virtual PermissionState permission_state() const = 0;
  // Throws std::runtime_error when the request could not be made.
  virtual void request_permission() = 0;
  virtual ~Notifier() = default;
};

std::unique_ptr<Notifier> make_libnotify_notifier(const std::string& app_name);
std::unique_ptr<Notifier> make_log_notifier();

// Asks for permission up front so the user sees any system prompt at startup.
void ensure_notification_permission(Notifier& notifier);

}  // namespace agent_notifier::notify
