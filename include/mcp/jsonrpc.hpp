#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace agent_notifier::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kServerError = -32000;

struct JsonRpcError {
  int code;
  std::string message;
};

// Thrown by method and tool handlers; becomes an error envelope carrying the request id.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}

  [[nodiscard]] int code() const { return code_; }

 private:
  int code_;
};

enum class Method { kInitialize, kToolsList, kToolsCall, kUnknown };

Method parse_method(std::string_view name);

enum class EnvelopeKind {
  kNoMethod,       // a response or notification aimed at us; nothing to do
  kNotification,   // has a method but no id
  kInvalidMethod,  // method is not a string
  kRequest,
};

struct JsonRpcRequest {
  Method method{Method::kUnknown};
  nlohmann::json params;
  nlohmann::json id;
};

struct Envelope {
  EnvelopeKind kind{EnvelopeKind::kNoMethod};
  JsonRpcRequest request{};
};

// body must be a JSON object; throws std::invalid_argument otherwise.
Envelope classify_envelope(const nlohmann::json& body);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace agent_notifier::mcp
