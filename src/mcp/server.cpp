#include "mcp/server.hpp"

#include <string>

namespace agent_notifier::mcp {

Server::Server(ToolRegistry tools) : tools_(std::move(tools)) {}

Reply Server::handle(const nlohmann::json& body) const {
  const auto envelope = classify_envelope(body);
  switch (envelope.kind) {
    case EnvelopeKind::kNoMethod:
    case EnvelopeKind::kNotification:
      return Reply{.kind = ReplyKind::kAccepted};
    case EnvelopeKind::kInvalidMethod:
      return Reply{.kind = ReplyKind::kJson,
                   .body = make_error_response(
                       nullptr, JsonRpcError{.code = kInvalidRequest, .message = "Invalid request: method must be a string"})};
    case EnvelopeKind::kRequest:
      break;
  }

  return Reply{.kind = ReplyKind::kJson, .body = handle_request(envelope.request)};
}

nlohmann::json Server::handle_request(const JsonRpcRequest& request) const {
  try {
    switch (request.method) {
      case Method::kInitialize:
        return make_result_response(request.id, handle_initialize());
      case Method::kToolsList:
        return make_result_response(request.id, handle_tools_list());
      case Method::kToolsCall:
        return make_result_response(request.id, handle_tools_call(request.params));
      case Method::kUnknown:
        break;
    }
    return make_error_response(request.id, JsonRpcError{.code = kMethodNotFound, .message = "Method not found"});
  } catch (const RpcError& ex) {
    return make_error_response(request.id, JsonRpcError{.code = ex.code(), .message = ex.what()});
  }
}

nlohmann::json Server::handle_initialize() const {
  return nlohmann::json{{"protocolVersion", kProtocolVersion},
                        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
                        {"capabilities", {{"tools", {{"listChanged", false}}}}}};
}

nlohmann::json Server::handle_tools_list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& [_, tool] : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return nlohmann::json{{"tools", tools}, {"nextCursor", nullptr}};
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& params) const {
  if (!params.is_object()) {
    throw RpcError(kInvalidParams, "Invalid params: expected object");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    throw RpcError(kInvalidParams, "Invalid params: missing tool name");
  }

  const auto tool_it = tools_.find(name_it->get<std::string>());
  if (tool_it == tools_.end()) {
    throw RpcError(kMethodNotFound, "Tool not found");
  }

  const auto args_it = params.find("arguments");
  if (args_it == params.end() || !args_it->is_object()) {
    throw RpcError(kInvalidParams, "Invalid params: 'arguments' must be an object");
  }

  return tool_it->second.handler(*args_it);
}

}  // namespace agent_notifier::mcp
