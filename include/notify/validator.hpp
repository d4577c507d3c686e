#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace agent_notifier::notify {

// Soft limit on content so the "{agent}: " prefix still fits the body cap.
constexpr std::size_t kSoftContentLimitChars = 950;
// Platform toast text blocks cap at 1024 chars; stay below that.
constexpr std::size_t kMaxNotificationBodyChars = 1000;

struct NotificationRequest {
  std::string title;
  std::string content;
  std::string agent;
};

std::string trim(std::string_view value);

// Number of Unicode scalar values in a UTF-8 string.
std::size_t utf8_length(std::string_view value);

// First max_chars scalar values of value; never splits a multi-byte sequence.
std::string utf8_truncate(std::string_view value, std::size_t max_chars);

// Trims all fields and enforces non-empty fields and the content soft limit.
// Throws core::InvalidInput.
NotificationRequest validate_notification_fields(std::string_view title, std::string_view content,
                                                 std::string_view agent);

}  // namespace agent_notifier::notify
