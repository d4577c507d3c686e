#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "mcp/jsonrpc.hpp"
#include "mcp/tools.hpp"

namespace agent_notifier::mcp {

// MCP Streamable HTTP transport revision this server speaks.
constexpr const char* kProtocolVersion = "2025-11-25";
constexpr const char* kServerName = "agent-notifications";
constexpr const char* kServerVersion = "0.1.0";

enum class ReplyKind {
  kAccepted,  // HTTP 202, empty body
  kJson,      // HTTP 200 with a JSON-RPC envelope
};

struct Reply {
  ReplyKind kind{ReplyKind::kAccepted};
  nlohmann::json body{};
};

class Server {
 public:
  explicit Server(ToolRegistry tools);

  // body must be a JSON object; throws std::invalid_argument otherwise.
  Reply handle(const nlohmann::json& body) const;

 private:
  nlohmann::json handle_request(const JsonRpcRequest& request) const;
  nlohmann::json handle_initialize() const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;

  ToolRegistry tools_;
};

}  // namespace agent_notifier::mcp
