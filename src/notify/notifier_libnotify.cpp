#include "notify/notifier.hpp"

#include <libnotify/notify.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace agent_notifier::notify {
namespace {

constexpr int kNotificationTimeoutMs = 5000;

class LibnotifyNotifier final : public Notifier {
 public:
  explicit LibnotifyNotifier(std::string app_name) : app_name_(std::move(app_name)) {
    if (notify_init(app_name_.c_str()) == FALSE) {
      std::cerr << "[notify] failed to init libnotify\n";
    }
  }

  ~LibnotifyNotifier() override {
    if (notify_is_initted() != FALSE) {
      notify_uninit();
    }
  }

  LibnotifyNotifier(const LibnotifyNotifier&) = delete;
  LibnotifyNotifier& operator=(const LibnotifyNotifier&) = delete;

  void show(const std::string& title, const std::string& body) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (notify_is_initted() == FALSE) {
      throw std::runtime_error("libnotify is not initialized");
    }

    NotifyNotification* notification = notify_notification_new(title.c_str(), body.c_str(), nullptr);
    if (notification == nullptr) {
      throw std::runtime_error("notify_notification_new returned null");
    }

    notify_notification_set_timeout(notification, kNotificationTimeoutMs);

    GError* error = nullptr;
    if (notify_notification_show(notification, &error) == FALSE) {
      std::string message = error != nullptr ? error->message : "unknown error";
      if (error != nullptr) {
        g_error_free(error);
      }
      g_object_unref(G_OBJECT(notification));
      throw std::runtime_error(message);
    }

    g_object_unref(G_OBJECT(notification));
  }

  PermissionState permission_state() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (notify_is_initted() == FALSE) {
      return PermissionState::kPrompt;
    }

    char* name = nullptr;
    char* vendor = nullptr;
    char* version = nullptr;
    char* spec_version = nullptr;
    if (notify_get_server_info(&name, &vendor, &version, &spec_version) == FALSE) {
      return PermissionState::kDenied;
    }
    g_free(name);
    g_free(vendor);
    g_free(version);
    g_free(spec_version);
    return PermissionState::kGranted;
  }

  void request_permission() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (notify_is_initted() != FALSE) {
      return;
    }
    if (notify_init(app_name_.c_str()) == FALSE) {
      throw std::runtime_error("notify_init failed for " + app_name_);
    }
  }

 private:
  std::string app_name_;
  mutable std::mutex mutex_;
};

}  // namespace

std::unique_ptr<Notifier> make_libnotify_notifier(const std::string& app_name) {
  return std::make_unique<LibnotifyNotifier>(app_name);
}

}  // namespace agent_notifier::notify
