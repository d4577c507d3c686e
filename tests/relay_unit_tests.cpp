#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <sys/resource.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "audio/audio_backend.hpp"
#include "audio/sound_player.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/listen_binding.hpp"
#include "core/listener_manager.hpp"
#include "core/relay.hpp"
#include "core/runtime.hpp"
#include "core/settings_store.hpp"
#include "core/tray.hpp"
#include "http/gate.hpp"
#include "http/listener.hpp"
#include "http/router.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"
#include "notify/dispatcher.hpp"
#include "notify/notifier.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace beast_http = boost::beast::http;
using tcp = asio::ip::tcp;

using agent_notifier::core::JsonFileSettingsStore;
using agent_notifier::core::ListenBinding;
using agent_notifier::core::ListenerManager;
using agent_notifier::core::ListenerState;
using agent_notifier::core::NotifierBackend;
using agent_notifier::core::Relay;
using agent_notifier::core::RelayConfig;
using agent_notifier::core::Runtime;
using agent_notifier::core::SettingsError;
using agent_notifier::core::load_relay_config;
using agent_notifier::http::ListeningGate;
using agent_notifier::http::Router;
using nlohmann::json;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path temp_path(const std::string& name) {
  return std::filesystem::temp_directory_path() / ("agent_notifier_" + name);
}

void write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream input(path);
  return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

class FakeNotifier final : public agent_notifier::notify::Notifier {
 public:
  void show(const std::string& title, const std::string& body) override {
    std::lock_guard<std::mutex> lock(mutex);
    if (fail_show) {
      throw std::runtime_error("notification daemon went away");
    }
    shown.push_back(title + "|" + body);
  }

  agent_notifier::notify::PermissionState permission_state() const override {
    return agent_notifier::notify::PermissionState::kGranted;
  }

  void request_permission() override {}

  std::size_t shown_count() {
    std::lock_guard<std::mutex> lock(mutex);
    return shown.size();
  }

  std::mutex mutex;
  std::vector<std::string> shown{};
  bool fail_show{false};
};

class RecordingTray final : public agent_notifier::core::TrayController {
 public:
  void set_listening(bool listening) override { states.push_back(listening); }
  void show_settings() override { ++settings_shown; }

  std::vector<bool> states{};
  int settings_shown{0};
};

class FailingStore final : public agent_notifier::core::SettingsStore {
 public:
  explicit FailingStore(ListenBinding initial) : initial_(std::move(initial)) {}

  ListenBinding load() override { return initial_; }
  void save(const ListenBinding&) override { throw SettingsError("Failed to save HTTP settings: disk full"); }

 private:
  ListenBinding initial_;
};

// Notifier, silent sound player and dispatcher shared by the router and relay tests.
struct DispatchStack {
  DispatchStack()
      : backend(agent_notifier::audio::make_none_backend()),
        player(pool.get_executor(), *backend, {}, false),
        dispatcher(notifier, player) {}

  ~DispatchStack() { pool.join(); }

  FakeNotifier notifier;
  asio::thread_pool pool{1};
  std::unique_ptr<agent_notifier::audio::AudioBackend> backend;
  agent_notifier::audio::SoundPlayer player;
  agent_notifier::notify::Dispatcher dispatcher;
};

unsigned short free_port() {
  asio::io_context ioc;
  tcp::acceptor acceptor(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  return acceptor.local_endpoint().port();
}

// Distinct ports: every acceptor is held until all of them are picked.
std::vector<unsigned short> free_ports(std::size_t count) {
  asio::io_context ioc;
  std::vector<tcp::acceptor> holders;
  std::vector<unsigned short> ports;
  for (std::size_t i = 0; i < count; ++i) {
    holders.emplace_back(ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    ports.push_back(holders.back().local_endpoint().port());
  }
  return ports;
}

bool can_connect(unsigned short port) {
  asio::io_context ioc;
  tcp::socket socket(ioc);
  beast::error_code ec;
  socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
  return !ec;
}

agent_notifier::http::Request make_request(beast_http::verb verb, const std::string& target, const std::string& body = {}) {
  agent_notifier::http::Request req{verb, target, 11};
  req.set(beast_http::field::host, "127.0.0.1");
  if (!body.empty()) {
    req.set(beast_http::field::content_type, "application/json");
  }
  req.body() = body;
  req.prepare_payload();
  return req;
}

agent_notifier::http::Response send_request(unsigned short port, beast_http::verb verb, const std::string& target,
                                            const std::string& body = {}) {
  asio::io_context ioc;
  tcp::socket socket(ioc);
  socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));

  auto req = make_request(verb, target, body);
  beast_http::write(socket, req);

  beast::flat_buffer buffer;
  agent_notifier::http::Response res;
  beast_http::read(socket, buffer, res);

  beast::error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
  return res;
}

std::string message_of(const agent_notifier::http::Response& res) {
  const auto body = json::parse(res.body(), nullptr, false);
  if (body.is_discarded() || !body.is_object() || !body.contains("message")) {
    return {};
  }
  return body["message"].get<std::string>();
}

const std::string kNotifyBody = R"({"title":"Build done","content":"All green","agent":"codex"})";

int test_config_loading() {
  const auto full = temp_path("full.yaml");
  write_file(full,
             "app_name: relay-test\n"
             "settings_path: \"/tmp/relay-settings.json\"\n"
             "server:\n"
             "  worker_threads: 4  # busy box\n"
             "mcp:\n"
             "  keepalive_interval_s: 10\n"
             "notifier:\n"
             "  backend: log\n"
             "sound:\n"
             "  enabled: false\n"
             "  file: /usr/share/sounds/ping.wav\n"
             "  worker_threads: 2\n"
             "unknown_key: ignored\n");
  const RelayConfig config = load_relay_config(full.string());
  std::filesystem::remove(full);

  if (config.app_name != "relay-test" || config.settings_path != "/tmp/relay-settings.json") {
    return fail("test_config_loading", "top-level keys not applied");
  }
  if (config.worker_threads != 4 || config.keepalive_interval != std::chrono::seconds(10) ||
      config.notifier != NotifierBackend::kLog) {
    return fail("test_config_loading", "nested keys not applied");
  }
  if (config.sound.enabled || config.sound.file != "/usr/share/sounds/ping.wav" || config.sound.worker_threads != 2) {
    return fail("test_config_loading", "sound keys not applied");
  }

  const auto empty = temp_path("empty.yaml");
  write_file(empty, "# nothing set\n");
  const RelayConfig defaults = load_relay_config(empty.string());
  std::filesystem::remove(empty);
  if (defaults.app_name != "agent-notifier" || defaults.worker_threads != 2 ||
      defaults.keepalive_interval != std::chrono::seconds(25) || !defaults.sound.enabled ||
      defaults.notifier != NotifierBackend::kAuto) {
    return fail("test_config_loading", "defaults not kept for an empty file");
  }
  return 0;
}

int test_config_rejects_bad_values() {
  const char* bad_configs[] = {
      "server:\n  worker_threads: 0\n",
      "server:\n  worker_threads: 65\n",
      "server:\n  worker_threads: many\n",
      "mcp:\n  keepalive_interval_s: 3601\n",
      "sound:\n  worker_threads: 17\n",
      "notifier:\n  backend: dbus\n",
      "app_name: \"\"\n",
  };

  for (const char* content : bad_configs) {
    const auto path = temp_path("bad.yaml");
    write_file(path, content);
    bool threw = false;
    try {
      (void)load_relay_config(path.string());
    } catch (const std::exception&) {
      threw = true;
    }
    std::filesystem::remove(path);
    if (!threw) {
      std::cerr << "config was: " << content;
      return fail("test_config_rejects_bad_values", "bad config should throw");
    }
  }

  try {
    (void)load_relay_config(temp_path("does_not_exist.yaml").string());
    return fail("test_config_rejects_bad_values", "missing file should throw");
  } catch (const std::runtime_error&) {
  }
  return 0;
}

int test_binding_validation() {
  try {
    agent_notifier::core::validate_binding(ListenBinding{.bind_address = "  ", .port = 8080});
    return fail("test_binding_validation", "blank address should throw");
  } catch (const SettingsError& ex) {
    if (std::string(ex.what()) != "Bind address cannot be empty") {
      return fail("test_binding_validation", "unexpected blank-address message");
    }
  }
  try {
    agent_notifier::core::validate_binding(ListenBinding{.bind_address = "127.0.0.1", .port = 0});
    return fail("test_binding_validation", "port 0 should throw");
  } catch (const SettingsError& ex) {
    if (std::string(ex.what()) != "Port must be between 1 and 65535") {
      return fail("test_binding_validation", "unexpected port message");
    }
  }
  if (agent_notifier::core::to_string(ListenBinding{}) != "127.0.0.1:60766") {
    return fail("test_binding_validation", "default binding should be 127.0.0.1:60766");
  }
  return 0;
}

int test_settings_store() {
  const auto path = temp_path("settings.json");
  std::filesystem::remove(path);
  JsonFileSettingsStore store(path);

  if (!(store.load() == ListenBinding{})) {
    return fail("test_settings_store", "missing file should load the default binding");
  }

  write_file(path, "{ not json");
  if (!(store.load() == ListenBinding{})) {
    return fail("test_settings_store", "corrupt file should load the default binding");
  }

  write_file(path, R"({"httpBindings":{"bind_address":"127.0.0.1","port":70000}})");
  if (!(store.load() == ListenBinding{})) {
    return fail("test_settings_store", "out-of-range port should load the default binding");
  }

  write_file(path, R"({"httpBindings":{"bind_address":"","port":8080}})");
  if (!(store.load() == ListenBinding{})) {
    return fail("test_settings_store", "empty address should load the default binding");
  }

  write_file(path, R"({"theme":"dark"})");
  store.save(ListenBinding{.bind_address = "0.0.0.0", .port = 8123});
  const auto saved = json::parse(read_file(path));
  if (saved["theme"] != "dark" || saved["httpBindings"]["bind_address"] != "0.0.0.0" ||
      saved["httpBindings"]["port"] != 8123) {
    return fail("test_settings_store", "save should merge into the existing document");
  }
  if (!(store.load() == ListenBinding{.bind_address = "0.0.0.0", .port = 8123})) {
    return fail("test_settings_store", "saved binding should load back");
  }
  std::filesystem::remove(path);

  const auto blocker = temp_path("settings_blocker");
  write_file(blocker, "file, not a directory");
  JsonFileSettingsStore unwritable(blocker / "settings.json");
  bool threw = false;
  try {
    unwritable.save(ListenBinding{});
  } catch (const SettingsError&) {
    threw = true;
  }
  std::filesystem::remove(blocker);
  if (!threw) {
    return fail("test_settings_store", "unwritable store should throw SettingsError");
  }
  return 0;
}

int test_router_routes() {
  DispatchStack stack;
  ListeningGate gate{true};
  const agent_notifier::mcp::Server mcp(agent_notifier::mcp::build_tool_registry(stack.dispatcher));
  const Router router(gate, mcp, stack.dispatcher);

  auto result = router.route(make_request(beast_http::verb::post, "/agent/notify", kNotifyBody));
  if (result.response.result() != beast_http::status::ok || message_of(result.response) != "Notification dispatched") {
    return fail("test_router_routes", "valid notify should be 200");
  }
  if (stack.notifier.shown.size() != 1 || stack.notifier.shown[0] != "Build done|codex: All green") {
    return fail("test_router_routes", "notify should reach the notifier");
  }

  // No length cap on the plain endpoint.
  const json long_body = {{"title", "t"}, {"content", std::string(2000, 'x')}, {"agent", "a"}};
  result = router.route(make_request(beast_http::verb::post, "/agent/notify", long_body.dump()));
  if (result.response.result() != beast_http::status::ok) {
    return fail("test_router_routes", "plain endpoint should accept long content");
  }

  result = router.route(make_request(beast_http::verb::post, "/agent/notify", R"({"title":" ","content":"c","agent":"a"})"));
  if (result.response.result() != beast_http::status::bad_request ||
      message_of(result.response) != "'title', 'content', and 'agent' are required") {
    return fail("test_router_routes", "blank field should be 400");
  }

  result = router.route(make_request(beast_http::verb::post, "/agent/notify", "[1,2]"));
  if (result.response.result() != beast_http::status::bad_request || message_of(result.response) != "Invalid JSON body") {
    return fail("test_router_routes", "non-object notify body should be 400");
  }

  result = router.route(make_request(beast_http::verb::post, "/mcp", "{oops"));
  if (result.response.result() != beast_http::status::bad_request || message_of(result.response) != "Invalid JSON body") {
    return fail("test_router_routes", "unparseable MCP body should be 400");
  }

  result = router.route(make_request(beast_http::verb::post, "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})"));
  if (result.response.result() != beast_http::status::accepted || !result.response.body().empty()) {
    return fail("test_router_routes", "MCP notification should be 202 with an empty body");
  }

  result = router.route(make_request(beast_http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
  auto envelope = json::parse(result.response.body(), nullptr, false);
  if (result.response.result() != beast_http::status::ok || envelope.is_discarded() ||
      envelope["error"]["code"] != -32601) {
    return fail("test_router_routes", "unknown MCP method should be a 200 envelope with -32601");
  }

  result = router.route(make_request(beast_http::verb::get, "/mcp"));
  if (!result.open_event_stream) {
    return fail("test_router_routes", "GET /mcp should open the event stream");
  }

  result = router.route(make_request(beast_http::verb::get, "/agent/notify"));
  if (result.response.result() != beast_http::status::method_not_allowed || message_of(result.response).empty()) {
    return fail("test_router_routes", "wrong method should be 405 with a message");
  }
  result = router.route(make_request(beast_http::verb::delete_, "/mcp"));
  if (result.response.result() != beast_http::status::method_not_allowed) {
    return fail("test_router_routes", "DELETE /mcp should be 405");
  }
  result = router.route(make_request(beast_http::verb::get, "/nowhere"));
  if (result.response.result() != beast_http::status::not_found || message_of(result.response).empty()) {
    return fail("test_router_routes", "unknown path should be 404 with a message");
  }

  stack.notifier.fail_show = true;
  result = router.route(make_request(beast_http::verb::post, "/agent/notify", kNotifyBody));
  if (result.response.result() != beast_http::status::internal_server_error ||
      message_of(result.response) != "Failed to dispatch notification") {
    return fail("test_router_routes", "dispatch failure should be 500 without detail");
  }
  return 0;
}

int test_router_closed_gate() {
  DispatchStack stack;
  ListeningGate gate{false};
  const agent_notifier::mcp::Server mcp(agent_notifier::mcp::build_tool_registry(stack.dispatcher));
  const Router router(gate, mcp, stack.dispatcher);

  auto result = router.route(make_request(beast_http::verb::post, "/agent/notify", kNotifyBody));
  if (result.response.result() != beast_http::status::service_unavailable ||
      message_of(result.response) != "Server is not listening") {
    return fail("test_router_closed_gate", "notify should be 503 while closed");
  }

  // The gate is checked before the body is looked at.
  result = router.route(make_request(beast_http::verb::post, "/mcp", "{oops"));
  if (result.response.result() != beast_http::status::service_unavailable) {
    return fail("test_router_closed_gate", "MCP POST should be 503 while closed");
  }

  result = router.route(make_request(beast_http::verb::get, "/mcp"));
  if (result.open_event_stream || result.response.result() != beast_http::status::service_unavailable) {
    return fail("test_router_closed_gate", "GET /mcp should be 503 while closed");
  }
  if (!stack.notifier.shown.empty()) {
    return fail("test_router_closed_gate", "closed gate must not dispatch");
  }

  gate.open();
  result = router.route(make_request(beast_http::verb::post, "/agent/notify", kNotifyBody));
  if (result.response.result() != beast_http::status::ok) {
    return fail("test_router_closed_gate", "reopened gate should serve again");
  }
  return 0;
}

int test_listener_manager_restart() {
  DispatchStack stack;
  ListeningGate gate{true};
  const agent_notifier::mcp::Server mcp(agent_notifier::mcp::build_tool_registry(stack.dispatcher));
  const Router router(gate, mcp, stack.dispatcher);
  Runtime runtime{2, 1};
  runtime.start();

  ListenerManager manager(runtime.io_context(), router, agent_notifier::http::SessionOptions{});
  if (manager.state() != ListenerState::kStopped || manager.local_endpoint().has_value()) {
    return fail("test_listener_manager_restart", "new manager should be stopped");
  }

  const auto first = free_port();
  if (!manager.restart(ListenBinding{.bind_address = "127.0.0.1", .port = first}) ||
      manager.state() != ListenerState::kRunning) {
    return fail("test_listener_manager_restart", "first restart should bind");
  }
  if (!can_connect(first)) {
    return fail("test_listener_manager_restart", "first port should accept connections");
  }

  const auto second = free_port();
  if (!manager.restart(ListenBinding{.bind_address = "127.0.0.1", .port = second})) {
    return fail("test_listener_manager_restart", "second restart should bind");
  }
  if (can_connect(first) || !can_connect(second)) {
    return fail("test_listener_manager_restart", "only the last binding should be live");
  }

  // Same port again: the previous acceptor is closed before the new bind.
  if (!manager.restart(ListenBinding{.bind_address = "127.0.0.1", .port = second})) {
    return fail("test_listener_manager_restart", "rebinding the same port should succeed");
  }

  const auto res = send_request(second, beast_http::verb::post, "/agent/notify", kNotifyBody);
  if (res.result() != beast_http::status::ok) {
    return fail("test_listener_manager_restart", "listener should serve notify requests");
  }

  manager.shutdown();
  if (manager.state() != ListenerState::kStopped || can_connect(second)) {
    return fail("test_listener_manager_restart", "shutdown should release the port");
  }

  runtime.stop();
  return 0;
}

int test_listener_manager_bind_failure() {
  DispatchStack stack;
  ListeningGate gate{true};
  const agent_notifier::mcp::Server mcp(agent_notifier::mcp::build_tool_registry(stack.dispatcher));
  const Router router(gate, mcp, stack.dispatcher);
  Runtime runtime{1, 1};
  runtime.start();
  ListenerManager manager(runtime.io_context(), router, agent_notifier::http::SessionOptions{});

  const auto good = free_port();
  if (!manager.restart(ListenBinding{.bind_address = "127.0.0.1", .port = good})) {
    return fail("test_listener_manager_bind_failure", "initial bind should succeed");
  }

  asio::io_context blocker_ioc;
  tcp::acceptor blocker(blocker_ioc, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  const auto taken = blocker.local_endpoint().port();

  if (manager.restart(ListenBinding{.bind_address = "127.0.0.1", .port = taken})) {
    return fail("test_listener_manager_bind_failure", "binding an occupied port should fail");
  }
  if (manager.state() != ListenerState::kStopped || manager.local_endpoint().has_value()) {
    return fail("test_listener_manager_bind_failure", "failed bind should leave no live listener");
  }
  if (can_connect(good)) {
    return fail("test_listener_manager_bind_failure", "previous listener must be stopped even when the new bind fails");
  }

  if (!manager.restart(ListenBinding{.bind_address = "127.0.0.1", .port = good}) ||
      manager.state() != ListenerState::kRunning) {
    return fail("test_listener_manager_bind_failure", "a later restart should recover");
  }

  manager.shutdown();
  runtime.stop();
  return 0;
}

int test_event_stream_keepalive_and_teardown() {
  DispatchStack stack;
  ListeningGate gate{true};
  const agent_notifier::mcp::Server mcp(agent_notifier::mcp::build_tool_registry(stack.dispatcher));
  const Router router(gate, mcp, stack.dispatcher);
  Runtime runtime{2, 1};
  runtime.start();
  ListenerManager manager(runtime.io_context(), router,
                          agent_notifier::http::SessionOptions{.keepalive_interval = std::chrono::seconds(1)});

  const auto port = free_port();
  if (!manager.restart(ListenBinding{.bind_address = "127.0.0.1", .port = port})) {
    return fail("test_event_stream_keepalive_and_teardown", "bind failed");
  }

  asio::io_context ioc;
  tcp::socket socket(ioc);
  socket.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port));
  auto req = make_request(beast_http::verb::get, "/mcp");
  req.set(beast_http::field::accept, "text/event-stream");
  beast_http::write(socket, req);

  std::string received;
  asio::read_until(socket, asio::dynamic_buffer(received), ":keep-alive\n\n");
  if (received.find("200 OK") == std::string::npos || received.find("text/event-stream") == std::string::npos ||
      received.find("no-cache") == std::string::npos) {
    return fail("test_event_stream_keepalive_and_teardown", "stream should start with SSE headers");
  }
  if (received.find("data:") != std::string::npos) {
    return fail("test_event_stream_keepalive_and_teardown", "stream must never carry data events");
  }

  // Tearing the listener down ends the stream.
  manager.shutdown();
  beast::error_code ec;
  std::array<char, 256> chunk{};
  for (int i = 0; i < 16 && !ec; ++i) {
    socket.read_some(asio::buffer(chunk), ec);
  }
  if (!ec) {
    return fail("test_event_stream_keepalive_and_teardown", "stream should end when the listener stops");
  }

  runtime.stop();
  return 0;
}

int test_relay_end_to_end() {
  const auto settings_path = temp_path("relay_settings.json");
  const auto port = free_port();
  write_file(settings_path,
             json{{"httpBindings", {{"bind_address", "127.0.0.1"}, {"port", port}}}}.dump());

  DispatchStack stack;
  Runtime runtime{2, 1};
  JsonFileSettingsStore store(settings_path);
  RecordingTray tray;
  Relay relay(runtime, stack.dispatcher, store, tray);
  runtime.start();

  if (!relay.start() || !(relay.get_http_bindings() == ListenBinding{.bind_address = "127.0.0.1", .port = port})) {
    return fail("test_relay_end_to_end", "relay should start on the stored binding");
  }
  if (tray.states != std::vector<bool>{true}) {
    return fail("test_relay_end_to_end", "tray should show listening at startup");
  }

  auto res = send_request(port, beast_http::verb::post, "/agent/notify", kNotifyBody);
  if (res.result() != beast_http::status::ok || stack.notifier.shown_count() != 1) {
    return fail("test_relay_end_to_end", "notify over HTTP should dispatch");
  }

  const json call = {{"jsonrpc", "2.0"},
                     {"id", 1},
                     {"method", "tools/call"},
                     {"params", {{"name", "notify"}, {"arguments", {{"title", "T"}, {"content", "C"}, {"agent", "A"}}}}}};
  res = send_request(port, beast_http::verb::post, "/mcp", call.dump());
  auto reply = json::parse(res.body(), nullptr, false);
  if (res.result() != beast_http::status::ok || reply.is_discarded() ||
      reply["result"]["content"][0]["text"] != "Notification sent: T") {
    return fail("test_relay_end_to_end", "MCP tools/call over HTTP should dispatch");
  }

  relay.handle_tray_action(agent_notifier::core::parse_tray_action("stop_listening"));
  res = send_request(port, beast_http::verb::post, "/agent/notify", kNotifyBody);
  if (res.result() != beast_http::status::service_unavailable || !can_connect(port)) {
    return fail("test_relay_end_to_end", "closed gate should answer 503 with the port still bound");
  }
  relay.handle_tray_action(agent_notifier::core::parse_tray_action("start_listening"));
  res = send_request(port, beast_http::verb::post, "/agent/notify", kNotifyBody);
  if (res.result() != beast_http::status::ok) {
    return fail("test_relay_end_to_end", "reopened gate should serve again");
  }
  if (tray.states != std::vector<bool>{true, false, true}) {
    return fail("test_relay_end_to_end", "tray menu state should follow the gate");
  }

  relay.handle_tray_action(agent_notifier::core::parse_tray_action("open_window"));
  if (tray.settings_shown != 1 || relay.handle_tray_action(agent_notifier::core::parse_tray_action("bogus")) ||
      !relay.handle_tray_action(agent_notifier::core::parse_tray_action("quit"))) {
    return fail("test_relay_end_to_end", "tray actions misrouted");
  }

  // Invalid bindings touch nothing.
  const auto before_file = read_file(settings_path);
  for (const auto& bad : {ListenBinding{.bind_address = "", .port = 8080}, ListenBinding{.bind_address = "127.0.0.1", .port = 0}}) {
    try {
      relay.save_http_bindings(bad);
      return fail("test_relay_end_to_end", "invalid binding should throw");
    } catch (const SettingsError&) {
    }
  }
  if (read_file(settings_path) != before_file || relay.get_http_bindings().port != port || !can_connect(port)) {
    return fail("test_relay_end_to_end", "rejected binding must not change memory, disk or listener");
  }

  const auto moved = free_port();
  relay.save_http_bindings(ListenBinding{.bind_address = "127.0.0.1", .port = moved});
  if (relay.get_http_bindings().port != moved || store.load().port != moved) {
    return fail("test_relay_end_to_end", "new binding should be applied and persisted");
  }
  if (can_connect(port) || !can_connect(moved)) {
    return fail("test_relay_end_to_end", "listener should move to the new port");
  }

  relay.shutdown();
  runtime.stop();
  std::filesystem::remove(settings_path);
  return 0;
}

int test_relay_save_failure_keeps_memory() {
  const auto port = free_port();
  DispatchStack stack;
  Runtime runtime{1, 1};
  FailingStore store(ListenBinding{.bind_address = "127.0.0.1", .port = port});
  RecordingTray tray;
  Relay relay(runtime, stack.dispatcher, store, tray);
  runtime.start();
  if (!relay.start()) {
    return fail("test_relay_save_failure_keeps_memory", "relay should start");
  }

  const auto other = free_port();
  bool threw = false;
  try {
    relay.save_http_bindings(ListenBinding{.bind_address = "127.0.0.1", .port = other});
  } catch (const SettingsError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_relay_save_failure_keeps_memory", "persistence failure should reach the caller");
  }
  if (relay.get_http_bindings().port != other) {
    return fail("test_relay_save_failure_keeps_memory", "in-memory settings are not rolled back");
  }
  if (!can_connect(port) || can_connect(other)) {
    return fail("test_relay_save_failure_keeps_memory", "listener must not restart after a failed save");
  }

  relay.shutdown();
  runtime.stop();
  return 0;
}

int test_settings_store_concurrent_saves() {
  const auto path = temp_path("concurrent_settings.json");
  std::filesystem::remove(path);
  JsonFileSettingsStore store(path);

  std::atomic<int> errors{0};
  auto writer = [&](unsigned short port) {
    for (int i = 0; i < 300; ++i) {
      try {
        store.save(ListenBinding{.bind_address = "127.0.0.1", .port = port});
      } catch (const SettingsError& ex) {
        if (errors.fetch_add(1) == 0) {
          std::cerr << "first save error: " << ex.what() << '\n';
        }
      }
    }
  };
  std::thread a(writer, 61001);
  std::thread b(writer, 61002);
  a.join();
  b.join();

  const auto port = store.load().port;
  std::filesystem::remove(path);
  if (errors.load() != 0) {
    return fail("test_settings_store_concurrent_saves", "concurrent saves should all succeed");
  }
  if (port != 61001 && port != 61002) {
    return fail("test_settings_store_concurrent_saves", "stored binding should be one of the saved ones");
  }
  return 0;
}

int test_relay_concurrent_updates() {
  const auto settings_path = temp_path("concurrent_relay_settings.json");
  std::filesystem::remove(settings_path);
  const auto ports = free_ports(5);

  DispatchStack stack;
  Runtime runtime{2, 1};
  JsonFileSettingsStore store(settings_path);
  store.save(ListenBinding{.bind_address = "127.0.0.1", .port = ports[0]});
  RecordingTray tray;
  Relay relay(runtime, stack.dispatcher, store, tray);
  runtime.start();
  if (!relay.start()) {
    return fail("test_relay_concurrent_updates", "relay should start");
  }

  std::atomic<bool> go{false};
  std::atomic<int> errors{0};
  std::vector<std::thread> updaters;
  for (std::size_t i = 1; i < ports.size(); ++i) {
    updaters.emplace_back([&, port = ports[i]]() {
      while (!go.load()) {
        std::this_thread::yield();
      }
      try {
        relay.save_http_bindings(ListenBinding{.bind_address = "127.0.0.1", .port = port});
      } catch (const SettingsError& ex) {
        errors.fetch_add(1);
        std::cerr << "update error: " << ex.what() << '\n';
      }
    });
  }
  go.store(true);
  for (auto& updater : updaters) {
    updater.join();
  }

  if (errors.load() != 0) {
    return fail("test_relay_concurrent_updates", "concurrent updates should all succeed");
  }

  int live = 0;
  unsigned short live_port = 0;
  for (const auto port : ports) {
    if (can_connect(port)) {
      ++live;
      live_port = port;
    }
  }
  if (live != 1) {
    return fail("test_relay_concurrent_updates", "exactly one listener should be bound");
  }
  if (relay.get_http_bindings().port != live_port || store.load().port != live_port) {
    return fail("test_relay_concurrent_updates", "memory, disk and listener should agree on the last update");
  }
  if (live_port == ports[0]) {
    return fail("test_relay_concurrent_updates", "one of the updates should have been applied last");
  }

  relay.shutdown();
  runtime.stop();
  std::filesystem::remove(settings_path);
  return 0;
}

int test_relay_requires_running_runtime() {
  const auto port = free_port();
  DispatchStack stack;
  Runtime runtime{1, 1};
  FailingStore store(ListenBinding{.bind_address = "127.0.0.1", .port = port});
  RecordingTray tray;
  {
    Relay relay(runtime, stack.dispatcher, store, tray);
    try {
      (void)relay.start();
      return fail("test_relay_requires_running_runtime", "start without a running runtime should throw");
    } catch (const std::logic_error&) {
    }
    if (can_connect(port) || relay.listeners().state() != ListenerState::kStopped) {
      return fail("test_relay_requires_running_runtime", "nothing should be bound");
    }
  }
  // Reaching this point means the relay was torn down without waiting on an idle runtime.
  return 0;
}

int test_listener_backs_off_on_accept_errors() {
  DispatchStack stack;
  ListeningGate gate{true};
  const agent_notifier::mcp::Server mcp(agent_notifier::mcp::build_tool_registry(stack.dispatcher));
  const Router router(gate, mcp, stack.dispatcher);
  Runtime runtime{2, 1};
  runtime.start();

  auto listener = std::make_shared<agent_notifier::http::Listener>(runtime.io_context(), router,
                                                                    agent_notifier::http::SessionOptions{});
  listener->bind(ListenBinding{.bind_address = "127.0.0.1", .port = 0});
  listener->run();
  const auto port = listener->local_endpoint().port();

  asio::io_context ioc;
  tcp::socket client(ioc);
  client.open(tcp::v4());

  rlimit original{};
  if (::getrlimit(RLIMIT_NOFILE, &original) != 0) {
    return fail("test_listener_backs_off_on_accept_errors", "getrlimit failed");
  }
  rlimit exhausted = original;
  exhausted.rlim_cur = 0;
  if (::setrlimit(RLIMIT_NOFILE, &exhausted) != 0) {
    return fail("test_listener_backs_off_on_accept_errors", "setrlimit failed");
  }

  // The handshake completes in the backlog; the server side cannot get a descriptor.
  beast::error_code connect_ec;
  client.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), connect_ec);
  std::this_thread::sleep_for(std::chrono::milliseconds(550));
  const auto failures = listener->accept_failures();

  ::setrlimit(RLIMIT_NOFILE, &original);

  if (connect_ec) {
    return fail("test_listener_backs_off_on_accept_errors", "client connect failed");
  }
  if (failures == 0) {
    return fail("test_listener_backs_off_on_accept_errors", "accept should have failed while out of descriptors");
  }
  if (failures > 15) {
    return fail("test_listener_backs_off_on_accept_errors", "failed accepts should be retried after a delay");
  }

  // Once descriptors are available again the queued connection is served.
  auto req = make_request(beast_http::verb::post, "/agent/notify", kNotifyBody);
  beast_http::write(client, req);
  beast::flat_buffer buffer;
  agent_notifier::http::Response res;
  beast_http::read(client, buffer, res);
  if (res.result() != beast_http::status::ok) {
    return fail("test_listener_backs_off_on_accept_errors", "queued connection should be served after recovery");
  }

  beast::error_code ec;
  client.close(ec);
  listener->stop();
  runtime.stop();
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_loading(); rc != 0) return rc;
  if (int rc = test_config_rejects_bad_values(); rc != 0) return rc;
  if (int rc = test_binding_validation(); rc != 0) return rc;
  if (int rc = test_settings_store(); rc != 0) return rc;
  if (int rc = test_router_routes(); rc != 0) return rc;
  if (int rc = test_router_closed_gate(); rc != 0) return rc;
  if (int rc = test_listener_manager_restart(); rc != 0) return rc;
  if (int rc = test_listener_manager_bind_failure(); rc != 0) return rc;
  if (int rc = test_event_stream_keepalive_and_teardown(); rc != 0) return rc;
  if (int rc = test_relay_end_to_end(); rc != 0) return rc;
  if (int rc = test_relay_save_failure_keeps_memory(); rc != 0) return rc;
  if (int rc = test_settings_store_concurrent_saves(); rc != 0) return rc;
  if (int rc = test_relay_concurrent_updates(); rc != 0) return rc;
  if (int rc = test_relay_requires_running_runtime(); rc != 0) return rc;
  if (int rc = test_listener_backs_off_on_accept_errors(); rc != 0) return rc;

  std::cout << "[PASS] relay unit tests\n";
  return 0;
}
