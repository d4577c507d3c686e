#include "notify/notifier.hpp"

#include <exception>
#include <iostream>

namespace agent_notifier::notify {

const char* to_string(PermissionState state) {
  switch (state) {
    case PermissionState::kGranted:
      return "granted";
    case PermissionState::kPrompt:
      return "prompt";
    case PermissionState::kDenied:
      return "denied";
  }
  return "unknown";
}

void ensure_notification_permission(Notifier& notifier) {
  switch (notifier.permission_state()) {
    case PermissionState::kGranted:
      return;
    case PermissionState::kPrompt:
      try {
        notifier.request_permission();
      } catch (const std::exception& ex) {
        std::cerr << "[notify] notification permission request failed: " << ex.what() << '\n';
      }
      return;
    case PermissionState::kDenied:
      std::cerr << "[notify] notification permission is denied for this app\n";
      return;
  }
}

}  // namespace agent_notifier::notify
