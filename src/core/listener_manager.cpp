#include "core/listener_manager.hpp"

#include <iostream>

#include "core/errors.hpp"

namespace agent_notifier::core {

const char* to_string(ListenerState state) {
  switch (state) {
    case ListenerState::kStopped:
      return "stopped";
    case ListenerState::kStarting:
      return "starting";
    case ListenerState::kRunning:
      return "running";
    case ListenerState::kStopping:
      return "stopping";
  }
  return "unknown";
}

ListenerManager::ListenerManager(boost::asio::io_context& ioc, const http::Router& router, http::SessionOptions options)
    : ioc_(ioc), router_(router), options_(options) {}

ListenerManager::~ListenerManager() { shutdown(); }

bool ListenerManager::restart(const ListenBinding& binding) {
  std::lock_guard<std::mutex> lock(slot_mutex_);
  stop_locked();

  state_.store(ListenerState::kStarting);
  current_ = spawn(binding);
  state_.store(current_ ? ListenerState::kRunning : ListenerState::kStopped);
  return current_ != nullptr;
}

void ListenerManager::shutdown() {
  std::lock_guard<std::mutex> lock(slot_mutex_);
  stop_locked();
}

std::optional<boost::asio::ip::tcp::endpoint> ListenerManager::local_endpoint() const {
  std::lock_guard<std::mutex> lock(slot_mutex_);
  if (!current_) {
    return std::nullopt;
  }
  return current_->local_endpoint();
}

std::shared_ptr<http::Listener> ListenerManager::spawn(const ListenBinding& binding) {
  auto listener = std::make_shared<http::Listener>(ioc_, router_, options_);
  try {
    listener->bind(binding);
  } catch (const BindFailed& ex) {
    std::cerr << "[http] HTTP server " << ex.what() << '\n';
    return nullptr;
  }

  listener->run();
  std::cerr << "[http] listening on " << to_string(binding) << '\n';
  return listener;
}

void ListenerManager::stop_locked() {
  if (!current_) {
    return;
  }
  state_.store(ListenerState::kStopping);
  current_->stop();
  current_.reset();
  state_.store(ListenerState::kStopped);
}

}  // namespace agent_notifier::core
