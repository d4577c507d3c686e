#include "mcp/tools.hpp"

#include <iostream>
#include <string>

#include "core/errors.hpp"
#include "mcp/jsonrpc.hpp"
#include "notify/validator.hpp"

namespace agent_notifier::mcp {

namespace {

std::string string_argument(const nlohmann::json& arguments, const char* key) {
  const auto it = arguments.find(key);
  if (it == arguments.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

nlohmann::json handle_notify(notify::Dispatcher& dispatcher, const nlohmann::json& arguments) {
  notify::NotificationRequest request;
  try {
    request = notify::validate_notification_fields(string_argument(arguments, "title"),
                                                   string_argument(arguments, "content"),
                                                   string_argument(arguments, "agent"));
  } catch (const core::InvalidInput&) {
    throw RpcError(kInvalidParams,
                   "Invalid params: 'title', 'content', and 'agent' are required and must be within limits");
  }

  try {
    dispatcher.dispatch(request.title, request.content, request.agent);
  } catch (const core::DispatchFailed& ex) {
    std::cerr << "[mcp] " << ex.what() << '\n';
    throw RpcError(kServerError, "Failed to dispatch notification");
  }

  return nlohmann::json{
      {"content", nlohmann::json::array({{{"type", "text"}, {"text", "Notification sent: " + request.title}}})},
      {"isError", false}};
}

}  // namespace

nlohmann::json notify_input_schema() {
  return nlohmann::json{
      {"type", "object"},
      {"properties",
       {{"title", {{"type", "string"}, {"minLength", 1}}},
        {"content", {{"type", "string"}, {"minLength", 1}, {"maxLength", notify::kSoftContentLimitChars}}},
        {"agent", {{"type", "string"}, {"minLength", 1}}}}},
      {"required", {"title", "content", "agent"}},
      {"additionalProperties", false}};
}

ToolRegistry build_tool_registry(notify::Dispatcher& dispatcher) {
  ToolRegistry registry;

  Tool notify_tool{.name = kNotifyToolName,
                   .description = "Send a desktop notification via the Agent Notifications app with title, content, "
                                  "and agent label.",
                   .input_schema = notify_input_schema(),
                   .handler = [&dispatcher](const nlohmann::json& arguments) {
                     return handle_notify(dispatcher, arguments);
                   }};

  registry.emplace(notify_tool.name, std::move(notify_tool));
  return registry;
}

}  // namespace agent_notifier::mcp
