#include "http/router.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "core/errors.hpp"
#include "notify/validator.hpp"

namespace agent_notifier::http {

namespace {

constexpr const char* kServerHeader = "agent-notifier";

std::string_view path_of(const Request& request) {
  const std::string_view target(request.target().data(), request.target().size());
  return target.substr(0, target.find('?'));
}

std::optional<nlohmann::json> parse_object_body(const Request& request) {
  auto body = nlohmann::json::parse(request.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    return std::nullopt;
  }
  return body;
}

std::string string_field(const nlohmann::json& body, const char* key) {
  const auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

Response message_response(beast_http::status status, const char* message, const Request& request) {
  return make_json_response(status, nlohmann::json{{"message", message}}, request);
}

}  // namespace

Response make_json_response(beast_http::status status, const nlohmann::json& body, const Request& request) {
  Response res{status, request.version()};
  res.set(beast_http::field::server, kServerHeader);
  res.set(beast_http::field::content_type, "application/json");
  res.keep_alive(request.keep_alive());
  res.body() = body.dump();
  res.prepare_payload();
  return res;
}

Response make_empty_response(beast_http::status status, const Request& request) {
  Response res{status, request.version()};
  res.set(beast_http::field::server, kServerHeader);
  res.keep_alive(request.keep_alive());
  res.prepare_payload();
  return res;
}

Router::Router(const ListeningGate& gate, const mcp::Server& mcp, notify::Dispatcher& dispatcher)
    : gate_(gate), mcp_(mcp), dispatcher_(dispatcher) {}

RouteResult Router::route(const Request& request) const {
  try {
    const auto path = path_of(request);
    const auto method = request.method();

    if (path == kNotifyTarget) {
      if (method != beast_http::verb::post) {
        return RouteResult{.response = message_response(beast_http::status::method_not_allowed, "Method not allowed", request)};
      }
      return RouteResult{.response = handle_notify(request)};
    }

    if (path == kMcpTarget) {
      if (method == beast_http::verb::post) {
        return RouteResult{.response = handle_mcp_post(request)};
      }
      if (method == beast_http::verb::get) {
        if (!gate_.is_open()) {
          return RouteResult{.response = message_response(beast_http::status::service_unavailable,
                                                          "Server is not listening", request)};
        }
        return RouteResult{.response = {}, .open_event_stream = true};
      }
      return RouteResult{.response = message_response(beast_http::status::method_not_allowed, "Method not allowed", request)};
    }

    return RouteResult{.response = message_response(beast_http::status::not_found, "Not found", request)};
  } catch (const std::exception& ex) {
    std::cerr << "[http] request handling failed: " << ex.what() << '\n';
    return RouteResult{
        .response = message_response(beast_http::status::internal_server_error, "Internal server error", request)};
  }
}

Response Router::handle_notify(const Request& request) const {
  if (!gate_.is_open()) {
    return message_response(beast_http::status::service_unavailable, "Server is not listening", request);
  }

  const auto body = parse_object_body(request);
  if (!body.has_value()) {
    return message_response(beast_http::status::bad_request, "Invalid JSON body", request);
  }

  const auto title = notify::trim(string_field(*body, "title"));
  const auto content = notify::trim(string_field(*body, "content"));
  const auto agent = notify::trim(string_field(*body, "agent"));
  if (title.empty() || content.empty() || agent.empty()) {
    return message_response(beast_http::status::bad_request, "'title', 'content', and 'agent' are required", request);
  }

  try {
    dispatcher_.dispatch(title, content, agent);
  } catch (const core::DispatchFailed& ex) {
    std::cerr << "[http] " << ex.what() << '\n';
    return message_response(beast_http::status::internal_server_error, "Failed to dispatch notification", request);
  }

  return message_response(beast_http::status::ok, "Notification dispatched", request);
}

Response Router::handle_mcp_post(const Request& request) const {
  if (!gate_.is_open()) {
    return message_response(beast_http::status::service_unavailable, "Server is not listening", request);
  }

  const auto body = parse_object_body(request);
  if (!body.has_value()) {
    return message_response(beast_http::status::bad_request, "Invalid JSON body", request);
  }

  const auto reply = mcp_.handle(*body);
  if (reply.kind == mcp::ReplyKind::kAccepted) {
    return make_empty_response(beast_http::status::accepted, request);
  }
  return make_json_response(beast_http::status::ok, reply.body, request);
}

}  // namespace agent_notifier::http
