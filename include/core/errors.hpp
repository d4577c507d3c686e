#pragma once

#include <stdexcept>
#include <string>

namespace agent_notifier::core {

// Malformed, missing, or over-limit notification fields.
class InvalidInput : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// The notifier collaborator refused or failed to show a notification.
class DispatchFailed : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The listener could not bind its configured address/port.
class BindFailed : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Settings could not be validated or persisted.
class SettingsError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace agent_notifier::core
