#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "core/listen_binding.hpp"
#include "http/listener.hpp"
#include "http/router.hpp"
#include "http/session.hpp"

namespace agent_notifier::core {

enum class ListenerState { kStopped, kStarting, kRunning, kStopping };

const char* to_string(ListenerState state);

// Owns the single live listener. restart() and shutdown() serialize on the
// handle slot for the whole stop+spawn sequence.
class ListenerManager {
 public:
  ListenerManager(boost::asio::io_context& ioc, const http::Router& router, http::SessionOptions options);
  ~ListenerManager();

  ListenerManager(const ListenerManager&) = delete;
  ListenerManager& operator=(const ListenerManager&) = delete;

  // Stops the previous listener unconditionally, then binds the new one.
  // Returns false when the bind failed; the service then stays down.
  bool restart(const ListenBinding& binding);

  void shutdown();

  [[nodiscard]] ListenerState state() const { return state_.load(); }
  [[nodiscard]] std::optional<boost::asio::ip::tcp::endpoint> local_endpoint() const;

 private:
  std::shared_ptr<http::Listener> spawn(const ListenBinding& binding);
  void stop_locked();

  boost::asio::io_context& ioc_;
  const http::Router& router_;
  http::SessionOptions options_;

  mutable std::mutex slot_mutex_;
  std::shared_ptr<http::Listener> current_;
  std::atomic<ListenerState> state_{ListenerState::kStopped};
};

}  // namespace agent_notifier::core
