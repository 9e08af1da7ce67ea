#include "web.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <csignal>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "../libwsplex/logger.hpp"
#include "wsplex/dispatcher.hpp"
#include "wsplex/jsonrpc.hpp"

namespace beast = boost::beast;
namespace json = boost::json;
namespace net = boost::asio;
namespace sys = boost::system;
using tcp = net::ip::tcp;

namespace wsplex {

namespace {

/// Helpers

std::string_view sv(beast::string_view s) { return {s.data(), s.size()}; }

void set_cors(http::response<http::string_body>& res) {
  res.set(http::field::access_control_allow_origin, "*");
}

http::response<http::string_body> make_json_response(
    http::status status_code, const json::value& body,
    unsigned int http_version, bool keep_alive) {
  http::response<http::string_body> res{status_code, http_version};
  res.set(http::field::content_type, "application/json");
  set_cors(res);
  res.keep_alive(keep_alive);
  res.body() = json::serialize(body);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> make_rpc_error(
    http::status status_code, int code, std::string_view message,
    unsigned int http_version, bool keep_alive) {
  return make_json_response(
      status_code, jsonrpc::make_error(nullptr, code, message), http_version,
      keep_alive);
}

// Run one dispatch to completion on a private io_context.
std::optional<json::object> dispatch_sync(
    dispatcher& router, json::object request) {
  net::io_context ioc;
  auto result = net::co_spawn(
      ioc, router.handle(std::move(request)), net::use_future);
  ioc.run();
  return result.get();
}

}  // namespace

/// Request dispatch

http::response<http::string_body> handle_http_request(
    const http::request<http::string_body>& req, dispatcher& router) {
  const auto version = req.version();
  const bool keep_alive = req.keep_alive();

  // ── CORS preflight ───────────────────────────────────────
  if (req.method() == http::verb::options) {
    http::response<http::string_body> res{http::status::ok, version};
    set_cors(res);
    res.set(http::field::access_control_allow_methods, "POST, GET, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.keep_alive(keep_alive);
    res.prepare_payload();
    return res;
  }

  // ── GET /health ──────────────────────────────────────────
  if (req.method() == http::verb::get && sv(req.target()) == "/health") {
    json::object obj;
    obj["status"] = "ok";
    return make_json_response(http::status::ok, obj, version, keep_alive);
  }

  if (req.method() != http::verb::post)
    return make_rpc_error(
        http::status::bad_request, jsonrpc::INVALID_REQUEST,
        "Use POST for JSON-RPC requests", version, keep_alive);

  // ── POST: one JSONRPC request ────────────────────────────
  if (req.body().empty())
    return make_rpc_error(
        http::status::bad_request, jsonrpc::INVALID_REQUEST,
        "Empty request body", version, keep_alive);

  std::error_code jec{};
  json::value parsed = json::parse(req.body(), jec);
  if (jec)
    return make_rpc_error(
        http::status::bad_request, jsonrpc::PARSE_ERROR,
        fmt::format("Parse error: {}", jec.message()), version, keep_alive);
  if (!parsed.is_object())
    return make_rpc_error(
        http::status::bad_request, jsonrpc::INVALID_REQUEST,
        "Invalid Request", version, keep_alive);

  try {
    auto response = dispatch_sync(router, std::move(parsed.as_object()));
    if (!response) {
      // Notification: nothing to say
      http::response<http::string_body> res{http::status::accepted, version};
      set_cors(res);
      res.keep_alive(keep_alive);
      res.prepare_payload();
      return res;
    }
    return make_json_response(http::status::ok, *response, version, keep_alive);
  } catch (const std::exception& e) {
    LOG_ERROR("POST dispatch failed: {}", e.what());
    return make_rpc_error(
        http::status::internal_server_error, jsonrpc::INTERNAL_ERROR,
        fmt::format("Internal error: {}", e.what()), version, keep_alive);
  }
}

namespace {

/// Connection handler

void handle_connection(int socket_fd, tcp protocol, dispatcher& router) {
  // Each worker thread owns its own io_context for purely synchronous use.
  net::io_context ioc;
  tcp::socket raw_sock{ioc};
  sys::error_code ec;
  raw_sock.assign(protocol, socket_fd, ec);
  if (ec) {
    ::close(socket_fd);
    return;
  }

  beast::tcp_stream stream{std::move(raw_sock)};
  beast::flat_buffer buffer;

  for (;;) {
    http::request<http::string_body> req;
    http::read(stream, buffer, req, ec);
    if (ec == http::error::end_of_stream || ec) break;

    LOG_DEBUG("{} {}", sv(req.method_string()), sv(req.target()));

    auto res = handle_http_request(req, router);
    LOG_DEBUG("→ {}", static_cast<unsigned>(res.result_int()));
    http::write(stream, res, ec);
    if (ec || !req.keep_alive()) break;
  }

  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

net::awaitable<void> accept_loop(
    tcp::acceptor& acceptor, net::signal_set& signals, dispatcher& router,
    std::atomic<int>& active, int max_connections) {
  auto executor = co_await net::this_coro::executor;
  const auto protocol = acceptor.local_endpoint().protocol();
  net::steady_timer pause{executor};

  for (;;) {
    sys::error_code ec;
    tcp::socket socket = co_await acceptor.async_accept(
        net::redirect_error(net::use_awaitable, ec));
    if (ec) break;  // acceptor was closed (e.g. signal)

    // Simple back-pressure: wait until a slot opens.
    while (active.load() >= max_connections) {
      pause.expires_after(std::chrono::milliseconds{5});
      co_await pause.async_wait(net::use_awaitable);
    }

    sys::error_code ec2;
    auto remote = socket.remote_endpoint(ec2);
    LOG_DEBUG(
        "connection from {}:{}", ec2 ? "?" : remote.address().to_string(),
        ec2 ? 0 : remote.port());
    ++active;
    // Transfer socket ownership into the thread via native handle.
    int fd = socket.release();
    std::thread{[fd, protocol, &router, &active]() {
      handle_connection(fd, protocol, router);
      --active;
    }}.detach();
  }

  sys::error_code ignored;
  signals.cancel(ignored);
}

}  // namespace

/// Server loop

void run_web_server(
    dispatcher& router, const std::string& address, int port,
    int max_connections) {
  net::io_context ioc;
  tcp::endpoint endpoint{
    net::ip::make_address(address), static_cast<unsigned short>(port)};
  tcp::acceptor acceptor{ioc};
  acceptor.open(endpoint.protocol());
  acceptor.set_option(net::socket_base::reuse_address{true});
  acceptor.bind(endpoint);
  acceptor.listen();

  fmt::print(stderr, "wsplex --transport http: listening on http://{}:{}\n",
             address, port);
  fmt::print(stderr, "  press Ctrl-C to stop\n");

  net::signal_set signals{ioc, SIGINT, SIGTERM};
  signals.async_wait([&acceptor](const sys::error_code& ec, int signo) {
    if (ec) return;
    LOG_INFO("signal {}, shutting down", signo);
    sys::error_code ignored;
    acceptor.close(ignored);
  });

  std::atomic<int> active{0};
  net::co_spawn(
      ioc, accept_loop(acceptor, signals, router, active, max_connections),
      net::detached);
  ioc.run();

  // Connections in flight hold references to the router.
  while (active.load() > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds{10});
  }
  LOG_INFO("http server stopped");
}

}  // namespace wsplex
