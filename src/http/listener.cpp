#include "http/listener.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <string>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>

#include "core/errors.hpp"

namespace agent_notifier::http {

Listener::Listener(asio::io_context& ioc, const Router& router, SessionOptions options)
    : ioc_(ioc),
      acceptor_(asio::make_strand(ioc)),
      retry_timer_(acceptor_.get_executor()),
      router_(router),
      options_(options) {}

void Listener::bind(const core::ListenBinding& binding) {
  const auto where = core::to_string(binding);
  beast::error_code ec;

  tcp::resolver resolver(ioc_);
  const auto results = resolver.resolve(binding.bind_address, std::to_string(binding.port),
                                        tcp::resolver::passive | tcp::resolver::numeric_service, ec);
  if (ec || results.empty()) {
    throw core::BindFailed("failed to resolve " + where + ": " + (ec ? ec.message() : "no addresses"));
  }
  endpoint_ = results.begin()->endpoint();

  acceptor_.open(endpoint_.protocol(), ec);
  if (ec) {
    throw core::BindFailed("failed to open socket for " + where + ": " + ec.message());
  }

  acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (ec) {
    throw core::BindFailed("failed to set reuse_address on " + where + ": " + ec.message());
  }

  acceptor_.bind(endpoint_, ec);
  if (ec) {
    acceptor_.close(ec);
    throw core::BindFailed("failed to bind " + where + ": " + ec.message());
  }

  acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    acceptor_.close(ec);
    throw core::BindFailed("failed to listen on " + where + ": " + ec.message());
  }

  endpoint_ = acceptor_.local_endpoint(ec);
}

void Listener::run() {
  asio::dispatch(acceptor_.get_executor(), [self = shared_from_this()]() { self->do_accept(); });
}

void Listener::stop() {
  if (ioc_.stopped()) {
    // No worker left to run the strand.
    beast::error_code ec;
    acceptor_.close(ec);
    retry_timer_.cancel();
  } else {
    std::promise<void> closed;
    auto done = closed.get_future();
    asio::dispatch(acceptor_.get_executor(), [this, &closed]() {
      beast::error_code ec;
      acceptor_.close(ec);
      retry_timer_.cancel();
      closed.set_value();
    });
    done.wait();
  }

  std::vector<std::weak_ptr<Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    stopped_ = true;
    sessions.swap(sessions_);
  }
  for (const auto& weak : sessions) {
    if (auto session = weak.lock()) {
      session->close();
    }
  }
}

tcp::endpoint Listener::local_endpoint() const { return endpoint_; }

void Listener::do_accept() {
  acceptor_.async_accept(asio::make_strand(ioc_), [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
    if (!ec) {
      auto session = std::make_shared<Session>(std::move(socket), self->router_, self->options_);
      self->track(session);
      session->start();
      self->do_accept();
      return;
    }

    if (!self->acceptor_.is_open()) {
      return;
    }
    if (ec != asio::error::operation_aborted) {
      self->accept_failures_.fetch_add(1);
      std::cerr << "[http] accept failed: " << ec.message() << '\n';
    }
    self->retry_accept_later();
  });
}

void Listener::retry_accept_later() {
  retry_timer_.expires_after(kAcceptRetryDelay);
  retry_timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
    if (ec || !self->acceptor_.is_open()) {
      return;
    }
    self->do_accept();
  });
}

void Listener::track(const std::shared_ptr<Session>& session) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  if (stopped_) {
    session->close();
    return;
  }
  sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                 [](const std::weak_ptr<Session>& weak) { return weak.expired(); }),
                  sessions_.end());
  sessions_.push_back(session);
}

}  // namespace agent_notifier::http
