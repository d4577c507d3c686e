#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/listen_binding.hpp"
#include "http/router.hpp"
#include "http/session.hpp"

namespace agent_notifier::http {

// Pause before re-arming accept after a failure such as EMFILE.
constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

// Bound acceptor plus its accept loop. Owns (weakly) every session it accepted so
// that stop() can tear all of them down at once.
class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(asio::io_context& ioc, const Router& router, SessionOptions options);

  // Resolves, binds and listens. Throws core::BindFailed.
  void bind(const core::ListenBinding& binding);

  void run();

  // Closes the acceptor and every open connection. Blocks until the acceptor is
  // closed so the port can be reused immediately. Must not be called from a
  // thread that the io_context needs to make progress.
  void stop();

  [[nodiscard]] tcp::endpoint local_endpoint() const;
  [[nodiscard]] std::size_t accept_failures() const { return accept_failures_.load(); }

 private:
  void do_accept();
  void retry_accept_later();
  void track(const std::shared_ptr<Session>& session);

  asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  asio::steady_timer retry_timer_;
  const Router& router_;
  SessionOptions options_;
  tcp::endpoint endpoint_{};

  std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<Session>> sessions_;
  bool stopped_{false};
  std::atomic<std::size_t> accept_failures_{0};
};

}  // namespace agent_notifier::http
