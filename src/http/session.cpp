#include "http/session.hpp"

#include <iostream>
#include <string>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace agent_notifier::http {

namespace {

// SSE comment line; clients ignore it, proxies see traffic.
constexpr const char* kKeepaliveEvent = ":keep-alive\n\n";

bool is_disconnect(const beast::error_code& ec) {
  return ec == beast_http::error::end_of_stream || ec == asio::error::eof || ec == asio::error::connection_reset ||
         ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor;
}

}  // namespace

Session::Session(tcp::socket socket, const Router& router, SessionOptions options)
    : socket_(std::move(socket)), router_(router), options_(options), timer_(socket_.get_executor()) {}

void Session::start() {
  asio::dispatch(socket_.get_executor(), [self = shared_from_this()]() { self->do_read(); });
}

void Session::close() {
  asio::post(socket_.get_executor(), [self = shared_from_this()]() { self->do_close(); });
}

void Session::do_read() {
  req_ = {};
  beast_http::async_read(socket_, buffer_, req_,
                         [self = shared_from_this()](beast::error_code ec, std::size_t bytes) { self->on_read(ec, bytes); });
}

void Session::on_read(beast::error_code ec, std::size_t /*bytes*/) {
  if (closed_) {
    return;
  }
  if (ec) {
    if (!is_disconnect(ec)) {
      std::cerr << "[http] read failed: " << ec.message() << '\n';
    }
    do_close();
    return;
  }

  auto result = router_.route(req_);
  if (result.open_event_stream) {
    start_event_stream();
    return;
  }
  write_response(std::move(result.response));
}

void Session::write_response(Response response) {
  auto res = std::make_shared<Response>(std::move(response));
  beast_http::async_write(socket_, *res, [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
    if (ec) {
      if (!is_disconnect(ec)) {
        std::cerr << "[http] write failed: " << ec.message() << '\n';
      }
      self->do_close();
      return;
    }
    if (res->need_eof()) {
      beast::error_code shutdown_ec;
      self->socket_.shutdown(tcp::socket::shutdown_send, shutdown_ec);
      return;
    }
    self->do_read();
  });
}

void Session::start_event_stream() {
  stream_header_ = std::make_unique<beast_http::response<beast_http::empty_body>>(beast_http::status::ok, req_.version());
  stream_header_->set(beast_http::field::server, "agent-notifier");
  stream_header_->set(beast_http::field::content_type, "text/event-stream");
  stream_header_->set(beast_http::field::cache_control, "no-cache");
  stream_header_->keep_alive(true);
  stream_header_->chunked(true);
  stream_serializer_ = std::make_unique<beast_http::response_serializer<beast_http::empty_body>>(*stream_header_);

  beast_http::async_write_header(socket_, *stream_serializer_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
    if (ec) {
      self->do_close();
      return;
    }
    self->watch_for_disconnect();
    self->schedule_keepalive();
  });
}

void Session::watch_for_disconnect() {
  // Anything the client sends on an event stream is ignored; an error means it went away.
  socket_.async_read_some(asio::buffer(discard_), [self = shared_from_this()](beast::error_code ec, std::size_t) {
    if (ec) {
      self->do_close();
      return;
    }
    self->watch_for_disconnect();
  });
}

void Session::schedule_keepalive() {
  timer_.expires_after(options_.keepalive_interval);
  timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
    if (ec || self->closed_) {
      return;
    }
    self->write_keepalive();
  });
}

void Session::write_keepalive() {
  auto event = std::make_shared<std::string>(kKeepaliveEvent);
  asio::async_write(socket_, beast_http::make_chunk(asio::buffer(*event)),
                    [self = shared_from_this(), event](beast::error_code ec, std::size_t) {
                      if (ec) {
                        self->do_close();
                        return;
                      }
                      self->schedule_keepalive();
                    });
}

void Session::do_close() {
  if (closed_) {
    return;
  }
  closed_ = true;
  timer_.cancel();
  beast::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

}  // namespace agent_notifier::http
