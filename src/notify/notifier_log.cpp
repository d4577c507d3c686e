#include "notify/notifier.hpp"

#include <iostream>
#include <memory>
#include <mutex>

namespace agent_notifier::notify {
namespace {

// Headless notifier: writes the notification to the log instead of a desktop.
class LogNotifier final : public Notifier {
 public:
  void show(const std::string& title, const std::string& body) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[notify] " << title << " | " << body << '\n';
  }

  PermissionState permission_state() const override { return PermissionState::kGranted; }

  void request_permission() override {}

 private:
  std::mutex mutex_;
};

}  // namespace

std::unique_ptr<Notifier> make_log_notifier() { return std::make_unique<LogNotifier>(); }

}  // namespace agent_notifier::notify
