#pragma once

#include <functional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "notify/dispatcher.hpp"

namespace agent_notifier::mcp {

constexpr const char* kNotifyToolName = "notify";

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  // Receives params.arguments; throws RpcError.
  std::function<nlohmann::json(const nlohmann::json&)> handler;
};

using ToolRegistry = std::unordered_map<std::string, Tool>;

nlohmann::json notify_input_schema();

ToolRegistry build_tool_registry(notify::Dispatcher& dispatcher);

}  // namespace agent_notifier::mcp
