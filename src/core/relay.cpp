#include "core/relay.hpp"

#include <iostream>
#include <mutex>
#include <stdexcept>

#include "core/errors.hpp"
#include "mcp/tools.hpp"

namespace agent_notifier::core {

Relay::Relay(Runtime& runtime, notify::Dispatcher& dispatcher, SettingsStore& store, TrayController& tray,
             RelayOptions options)
    : runtime_(runtime),
      store_(store),
      tray_(tray),
      mcp_(mcp::build_tool_registry(dispatcher)),
      router_(gate_, mcp_, dispatcher),
      listeners_(runtime.io_context(), router_, http::SessionOptions{.keepalive_interval = options.keepalive_interval}) {}

Relay::~Relay() { shutdown(); }

bool Relay::start() {
  if (!runtime_.running()) {
    throw std::logic_error("relay started before its runtime");
  }

  std::lock_guard<std::mutex> update(update_mutex_);
  const auto initial = store_.load();
  {
    std::unique_lock<std::shared_mutex> lock(settings_mutex_);
    settings_ = initial;
  }
  tray_.set_listening(gate_.is_open());
  return listeners_.restart(initial);
}

void Relay::shutdown() { listeners_.shutdown(); }

ListenBinding Relay::get_http_bindings() const {
  std::shared_lock<std::shared_mutex> lock(settings_mutex_);
  return settings_;
}

void Relay::save_http_bindings(const ListenBinding& binding) {
  validate_binding(binding);

  std::lock_guard<std::mutex> update(update_mutex_);
  {
    std::unique_lock<std::shared_mutex> lock(settings_mutex_);
    settings_ = binding;
  }

  // Applied before persisting; a failed save is not rolled back.
  store_.save(binding);

  if (!listeners_.restart(binding)) {
    std::cerr << "[relay] listener is down until the next successful restart\n";
  }
}

bool Relay::handle_tray_action(TrayAction action) {
  switch (action) {
    case TrayAction::kOpenWindow:
      tray_.show_settings();
      return false;
    case TrayAction::kStartListening:
      start_listening();
      return false;
    case TrayAction::kStopListening:
      stop_listening();
      return false;
    case TrayAction::kQuit:
      return true;
    case TrayAction::kUnknown:
      return false;
  }
  return false;
}

void Relay::start_listening() {
  gate_.open();
  tray_.set_listening(true);
  std::cerr << "[relay] listening enabled\n";
}

void Relay::stop_listening() {
  gate_.close();
  tray_.set_listening(false);
  std::cerr << "[relay] listening disabled; requests will receive 503\n";
}

}  // namespace agent_notifier::core
