#include "core/settings_store.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace agent_notifier::core {
namespace {

constexpr const char* kHttpSettingsKey = "httpBindings";

ListenBinding parse_binding(const nlohmann::json& value) {
  ListenBinding binding;
  binding.bind_address = value.at("bind_address").get<std::string>();
  const auto port = value.at("port").get<long long>();
  if (port < 0 || port > 65535) {
    throw std::out_of_range("port out of range: " + std::to_string(port));
  }
  binding.port = static_cast<std::uint16_t>(port);
  validate_binding(binding);
  return binding;
}

}  // namespace

JsonFileSettingsStore::JsonFileSettingsStore(std::filesystem::path path) : path_(std::move(path)) {}

ListenBinding JsonFileSettingsStore::load() {
  std::ifstream input(path_);
  if (!input.is_open()) {
    return ListenBinding{};
  }

  try {
    const auto document = nlohmann::json::parse(input);
    const auto it = document.find(kHttpSettingsKey);
    if (it == document.end()) {
      return ListenBinding{};
    }
    return parse_binding(*it);
  } catch (const std::exception& ex) {
    std::cerr << "[settings] failed to parse stored HTTP settings in " << path_.string() << ": " << ex.what() << '\n';
    return ListenBinding{};
  }
}

void JsonFileSettingsStore::save(const ListenBinding& binding) {
  std::lock_guard<std::mutex> lock(save_mutex_);

  nlohmann::json document = nlohmann::json::object();
  {
    std::ifstream input(path_);
    if (input.is_open()) {
      auto existing = nlohmann::json::parse(input, nullptr, false);
      if (!existing.is_discarded() && existing.is_object()) {
        document = std::move(existing);
      }
    }
  }
  document[kHttpSettingsKey] = {{"bind_address", binding.bind_address}, {"port", binding.port}};

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw SettingsError("Failed to open settings store: " + ec.message());
    }
  }

  auto staging = path_;
  staging += ".tmp";
  {
    std::ofstream out(staging, std::ios::trunc);
    if (!out.is_open()) {
      throw SettingsError("Failed to open settings store: " + staging.string());
    }
    out << document.dump(2) << '\n';
    out.flush();
    if (!out) {
      throw SettingsError("Failed to save HTTP settings: write error on " + staging.string());
    }
  }

  std::filesystem::rename(staging, path_, ec);
  if (ec) {
    std::filesystem::remove(staging, ec);
    throw SettingsError("Failed to save HTTP settings: could not replace " + path_.string());
  }
}

}  // namespace agent_notifier::core
