#include "core/tray.hpp"

#include <iostream>

namespace agent_notifier::core {
namespace {

class NullTrayController final : public TrayController {
 public:
  void set_listening(bool listening) override {
    std::cerr << "[relay] tray: start_listening=" << (listening ? "disabled" : "enabled")
              << " stop_listening=" << (listening ? "enabled" : "disabled") << '\n';
  }

  void show_settings() override { std::cerr << "[relay] tray: no settings window in headless mode\n"; }
};

}  // namespace

TrayAction parse_tray_action(std::string_view id) {
  if (id == "open_window") {
    return TrayAction::kOpenWindow;
  }
  if (id == "start_listening") {
    return TrayAction::kStartListening;
  }
  if (id == "stop_listening") {
    return TrayAction::kStopListening;
  }
  if (id == "quit") {
    return TrayAction::kQuit;
  }
  return TrayAction::kUnknown;
}

std::unique_ptr<TrayController> make_null_tray_controller() { return std::make_unique<NullTrayController>(); }

}  // namespace agent_notifier::core
