#pragma once

#include <memory>
#include <string_view>

namespace agent_notifier::core {

enum class TrayAction { kOpenWindow, kStartListening, kStopListening, kQuit, kUnknown };

// Menu ids: "open_window", "start_listening", "stop_listening", "quit".
TrayAction parse_tray_action(std::string_view id);

// Capability interface over the platform tray icon and settings window.
class TrayController {
 public:
  // "Start listening" is enabled exactly when not listening; "Stop listening" the opposite.
  virtual void set_listening(bool listening) = 0;
  virtual void show_settings() = 0;
  virtual ~TrayController() = default;
};

std::unique_ptr<TrayController> make_null_tray_controller();

}  // namespace agent_notifier::core
