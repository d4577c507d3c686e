#pragma once

#include <atomic>

namespace agent_notifier::http {

// Process-wide on/off switch. Closed means handlers answer 503; the port stays bound.
class ListeningGate {
 public:
  explicit ListeningGate(bool open = true) : open_(open) {}

  void open() { open_.store(true); }
  void close() { open_.store(false); }
  [[nodiscard]] bool is_open() const { return open_.load(); }

 private:
  std::atomic<bool> open_;
};

}  // namespace agent_notifier::http
