#include "mcp/jsonrpc.hpp"

#include <stdexcept>

namespace agent_notifier::mcp {

Method parse_method(std::string_view name) {
  if (name == "initialize") {
    return Method::kInitialize;
  }
  if (name == "tools/list") {
    return Method::kToolsList;
  }
  if (name == "tools/call") {
    return Method::kToolsCall;
  }
  return Method::kUnknown;
}

Envelope classify_envelope(const nlohmann::json& body) {
  if (!body.is_object()) {
    throw std::invalid_argument("Request must be a JSON object");
  }

  const auto method_it = body.find("method");
  if (method_it == body.end()) {
    return Envelope{.kind = EnvelopeKind::kNoMethod};
  }

  const auto id_it = body.find("id");
  if (id_it == body.end()) {
    return Envelope{.kind = EnvelopeKind::kNotification};
  }

  if (!method_it->is_string()) {
    return Envelope{.kind = EnvelopeKind::kInvalidMethod};
  }

  JsonRpcRequest parsed{.method = parse_method(method_it->get_ref<const std::string&>()), .params = nullptr, .id = *id_it};

  const auto params_it = body.find("params");
  if (params_it != body.end()) {
    parsed.params = *params_it;
  }

  return Envelope{.kind = EnvelopeKind::kRequest, .request = std::move(parsed)};
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace agent_notifier::mcp
