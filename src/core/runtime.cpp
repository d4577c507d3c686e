#include "core/runtime.hpp"

#include <exception>
#include <iostream>

namespace agent_notifier::core {

Runtime::Runtime(std::size_t io_threads, std::size_t blocking_threads)
    : io_threads_(io_threads == 0 ? 1 : io_threads), blocking_(blocking_threads == 0 ? 1 : blocking_threads) {}

Runtime::~Runtime() { stop(); }

void Runtime::start() {
  if (!workers_.empty()) {
    return;
  }
  work_.emplace(boost::asio::make_work_guard(ioc_));
  workers_.reserve(io_threads_);
  for (std::size_t i = 0; i < io_threads_; ++i) {
    workers_.emplace_back([this]() { worker_loop(); });
  }
}

void Runtime::stop() {
  if (stopped_) {
    return;
  }
  stopped_ = true;

  work_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  blocking_.join();
}

void Runtime::worker_loop() {
  while (true) {
    try {
      ioc_.run();
      return;
    } catch (const std::exception& ex) {
      std::cerr << "[relay] worker caught exception: " << ex.what() << '\n';
    }
  }
}

}  // namespace agent_notifier::core
