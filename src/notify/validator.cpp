#include "notify/validator.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "core/errors.hpp"

namespace agent_notifier::notify {
namespace {

bool is_continuation_byte(const unsigned char c) { return (c & 0xC0U) == 0x80U; }

}  // namespace

std::string trim(std::string_view value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::size_t utf8_length(std::string_view value) {
  std::size_t count = 0;
  for (const char c : value) {
    if (!is_continuation_byte(static_cast<unsigned char>(c))) {
      ++count;
    }
  }
  return count;
}

std::string utf8_truncate(std::string_view value, std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (is_continuation_byte(static_cast<unsigned char>(value[i]))) {
      continue;
    }
    if (chars == max_chars) {
      return std::string(value.substr(0, i));
    }
    ++chars;
  }
  return std::string(value);
}

NotificationRequest validate_notification_fields(std::string_view title, std::string_view content,
                                                 std::string_view agent) {
  NotificationRequest request{.title = trim(title), .content = trim(content), .agent = trim(agent)};

  if (request.title.empty() || request.content.empty() || request.agent.empty()) {
    throw core::InvalidInput("'title', 'content', and 'agent' are required");
  }

  const auto content_len = utf8_length(request.content);
  if (content_len > kSoftContentLimitChars) {
    throw core::InvalidInput("'content' is too long (" + std::to_string(content_len) + " chars); keep it under " +
                             std::to_string(kSoftContentLimitChars));
  }

  return request;
}

}  // namespace agent_notifier::notify
