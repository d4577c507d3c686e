#pragma once

#include <filesystem>
#include <mutex>

#include "core/listen_binding.hpp"

namespace agent_notifier::core {

class SettingsStore {
 public:
  // Falls back to the default binding when nothing usable is stored.
  virtual ListenBinding load() = 0;
  // Throws core::SettingsError.
  virtual void save(const ListenBinding& binding) = 0;
  virtual ~SettingsStore() = default;
};

// {"httpBindings": {"bind_address": "...", "port": N}} in a JSON file.
class JsonFileSettingsStore final : public SettingsStore {
 public:
  explicit JsonFileSettingsStore(std::filesystem::path path);

  ListenBinding load() override;
  void save(const ListenBinding& binding) override;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  // Saves share one staging file.
  std::mutex save_mutex_;
};

}  // namespace agent_notifier::core
