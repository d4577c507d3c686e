#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "http/gate.hpp"
#include "mcp/server.hpp"
#include "notify/dispatcher.hpp"

namespace agent_notifier::http {

namespace beast_http = boost::beast::http;

using Request = beast_http::request<beast_http::string_body>;
using Response = beast_http::response<beast_http::string_body>;

constexpr const char* kNotifyTarget = "/agent/notify";
constexpr const char* kMcpTarget = "/mcp";

struct RouteResult {
  Response response{};
  // GET /mcp with the gate open: the session switches to the SSE keep-alive stream.
  bool open_event_stream{false};
};

Response make_json_response(beast_http::status status, const nlohmann::json& body, const Request& request);
Response make_empty_response(beast_http::status status, const Request& request);

class Router {
 public:
  Router(const ListeningGate& gate, const mcp::Server& mcp, notify::Dispatcher& dispatcher);

  // Never throws; unexpected failures become a 500.
  RouteResult route(const Request& request) const;

 private:
  Response handle_notify(const Request& request) const;
  Response handle_mcp_post(const Request& request) const;

  const ListeningGate& gate_;
  const mcp::Server& mcp_;
  notify::Dispatcher& dispatcher_;
};

}  // namespace agent_notifier::http
