#include "core/listen_binding.hpp"

#include "core/errors.hpp"
#include "notify/validator.hpp"

namespace agent_notifier::core {

void validate_binding(const ListenBinding& binding) {
  if (notify::trim(binding.bind_address).empty()) {
    throw SettingsError("Bind address cannot be empty");
  }
  if (binding.port == 0) {
    throw SettingsError("Port must be between 1 and 65535");
  }
}

std::string to_string(const ListenBinding& binding) {
  return binding.bind_address + ':' + std::to_string(binding.port);
}

}  // namespace agent_notifier::core
