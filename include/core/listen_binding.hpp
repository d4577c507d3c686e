#pragma once

#include <cstdint>
#include <string>

namespace agent_notifier::core {

constexpr const char* kDefaultBindAddress = "127.0.0.1";
constexpr std::uint16_t kDefaultPort = 60766;

struct ListenBinding {
  std::string bind_address{kDefaultBindAddress};
  std::uint16_t port{kDefaultPort};

  bool operator==(const ListenBinding&) const = default;
};

// Throws core::SettingsError when the address is blank or the port is zero.
void validate_binding(const ListenBinding& binding);

std::string to_string(const ListenBinding& binding);

}  // namespace agent_notifier::core
