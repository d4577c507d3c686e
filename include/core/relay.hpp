#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "core/listen_binding.hpp"
#include "core/listener_manager.hpp"
#include "core/runtime.hpp"
#include "core/settings_store.hpp"
#include "core/tray.hpp"
#include "http/gate.hpp"
#include "http/router.hpp"
#include "mcp/server.hpp"
#include "notify/dispatcher.hpp"

namespace agent_notifier::core {

struct RelayOptions {
  std::chrono::seconds keepalive_interval{http::kDefaultKeepaliveInterval};
};

// Owns the process-wide state (gate, settings, listener slot) and hands it to the
// request handlers by reference.
class Relay {
 public:
  Relay(Runtime& runtime, notify::Dispatcher& dispatcher, SettingsStore& store, TrayController& tray,
        RelayOptions options = {});
  ~Relay();

  Relay(const Relay&) = delete;
  Relay& operator=(const Relay&) = delete;

  // Loads the stored binding and spawns the listener. False when the bind failed.
  // The runtime must already be started; throws std::logic_error otherwise.
  bool start();
  void shutdown();

  ListenBinding get_http_bindings() const;

  // Validates, applies in memory, persists, then restarts the listener. Throws
  // SettingsError; a persistence failure leaves the new value applied in memory.
  // Concurrent calls run one after another.
  void save_http_bindings(const ListenBinding& binding);

  // Returns true when the action asks the process to quit.
  bool handle_tray_action(TrayAction action);

  void start_listening();
  void stop_listening();
  [[nodiscard]] bool is_listening() const { return gate_.is_open(); }

  [[nodiscard]] const ListenerManager& listeners() const { return listeners_; }
  [[nodiscard]] const http::Router& router() const { return router_; }

 private:
  Runtime& runtime_;
  SettingsStore& store_;
  TrayController& tray_;

  http::ListeningGate gate_{true};
  // Held for a whole update: apply, persist and restart.
  std::mutex update_mutex_;
  mutable std::shared_mutex settings_mutex_;
  ListenBinding settings_{};

  mcp::Server mcp_;
  http::Router router_;
  ListenerManager listeners_;
};

}  // namespace agent_notifier::core
