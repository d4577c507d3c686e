#pragma once

#include <array>
#include <chrono>
#include <memory>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "http/router.hpp"

namespace agent_notifier::http {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

constexpr std::chrono::seconds kDefaultKeepaliveInterval{25};

struct SessionOptions {
  std::chrono::seconds keepalive_interval{kDefaultKeepaliveInterval};
};

// One accepted connection. Serves requests until the peer leaves, or turns into an
// SSE keep-alive stream on GET /mcp. All handlers run on the socket's strand.
class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(tcp::socket socket, const Router& router, SessionOptions options);

  void start();

  // Thread-safe; drops the connection without draining in-flight work.
  void close();

 private:
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes);
  void write_response(Response response);
  void start_event_stream();
  void watch_for_disconnect();
  void schedule_keepalive();
  void write_keepalive();
  void do_close();

  tcp::socket socket_;
  const Router& router_;
  SessionOptions options_;
  beast::flat_buffer buffer_;
  Request req_;
  asio::steady_timer timer_;
  std::unique_ptr<beast_http::response<beast_http::empty_body>> stream_header_;
  std::unique_ptr<beast_http::response_serializer<beast_http::empty_body>> stream_serializer_;
  std::array<char, 512> discard_{};
  bool closed_{false};
};

}  // namespace agent_notifier::http
