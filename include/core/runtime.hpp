#pragma once

#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

namespace agent_notifier::core {

// Multi-worker I/O runtime plus a separate pool for blocking work (audio playback).
class Runtime {
 public:
  Runtime(std::size_t io_threads, std::size_t blocking_threads);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  void start();
  // Stops the I/O workers and waits for queued blocking work to finish.
  void stop();

  // True between start() and stop().
  [[nodiscard]] bool running() const { return !workers_.empty() && !stopped_; }

  boost::asio::io_context& io_context() { return ioc_; }
  boost::asio::thread_pool::executor_type blocking_executor() { return blocking_.get_executor(); }

 private:
  void worker_loop();

  std::size_t io_threads_;
  boost::asio::io_context ioc_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::vector<std::thread> workers_;
  boost::asio::thread_pool blocking_;
  bool stopped_{false};
};

}  // namespace agent_notifier::core
