// SPDX-License-Identifier: MIT
#include "wsplex/backend_client.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "auto.hpp"
#include "logger.hpp"
#include "wsplex/jsonrpc.hpp"

namespace wsplex {

namespace asio = boost::asio;
namespace sys = boost::system;
using local_socket = asio::local::stream_protocol::socket;

std::string_view kind_to_string(backend_error::kind k) {
  // clang-format off
  switch (k) {
  case backend_error::kind::connect_failed:  return "connect_failed";
  case backend_error::kind::connect_timeout: return "connect_timeout";
  case backend_error::kind::read_timeout:    return "read_timeout";
  case backend_error::kind::closed:          return "closed";
  case backend_error::kind::io_error:        return "io_error";
  case backend_error::kind::bad_response:    return "bad_response";
  default: return "unknown";
  }
  // clang-format on
}

namespace {

template <typename... Args>
[[noreturn]] void fail(
    backend_error::kind k, fmt::format_string<Args...> format_str,
    Args&&... args) {
  throw backend_error{k, fmt::format(format_str, std::forward<Args>(args)...)};
}

// Owned jointly by the exchange and by the pending timer handler, so an
// expiry that races with completion never touches a dead frame.
struct connection {
  explicit connection(const asio::any_io_executor& ex) : sock{ex}, timer{ex} {}

  local_socket sock;
  asio::steady_timer timer;
  unsigned phase{0};
  bool expired{false};
};

// Cancel whatever is pending on the socket once @p limit elapses.
void arm(
    const std::shared_ptr<connection>& conn, std::chrono::milliseconds limit) {
  conn->expired = false;
  conn->timer.expires_after(limit);
  conn->timer.async_wait([conn, armed = ++conn->phase](sys::error_code ec) {
    if (ec || armed != conn->phase) return;
    conn->expired = true;
    sys::error_code ignored{};
    conn->sock.cancel(ignored);
  });
}

void disarm(const std::shared_ptr<connection>& conn) {
  ++conn->phase;
  conn->timer.cancel();
}

// Runs on its own strand: the timer handler and the coroutine never
// execute concurrently.
asio::awaitable<json::object> exchange(
    fs::path socket_path, json::object request, forward_timeouts timeouts) {
  auto conn = std::make_shared<connection>(co_await asio::this_coro::executor);
  AUTO({
    disarm(conn);
    sys::error_code ignored{};
    conn->sock.close(ignored);
  });

  sys::error_code ec{};

  arm(conn, timeouts.connect);
  co_await conn->sock.async_connect(
      asio::local::stream_protocol::endpoint{socket_path.string()},
      asio::redirect_error(asio::use_awaitable, ec));
  disarm(conn);
  if (ec && conn->expired)
    fail(
        backend_error::kind::connect_timeout,
        "timed out after {} connecting to {}", timeouts.connect,
        socket_path.string());
  if (ec)
    fail(
        backend_error::kind::connect_failed, "cannot connect to {}: {}",
        socket_path.string(), ec.message());

  LOG_TRACE("connected to {}", socket_path.string());

  // The request write counts against the read budget.
  arm(conn, timeouts.read);
  std::optional<std::string> line{};
  try {
    co_await jsonrpc::write_line(conn->sock, request);
    std::string buffer{};
    line = co_await jsonrpc::read_line(conn->sock, buffer);
  } catch (const jsonrpc::line_too_long& e) {
    fail(
        backend_error::kind::bad_response, "oversized response from {}: {}",
        socket_path.string(), e.what());
  } catch (const sys::system_error& e) {
    if (conn->expired)
      fail(
          backend_error::kind::read_timeout,
          "timed out after {} waiting for a response from {}", timeouts.read,
          socket_path.string());
    fail(
        backend_error::kind::io_error, "i/o error talking to {}: {}",
        socket_path.string(), e.code().message());
  }
  disarm(conn);

  if (!line || line->empty())
    fail(
        backend_error::kind::closed,
        "{} closed the connection without replying", socket_path.string());

  json::value reply = json::parse(*line, ec);
  if (ec || !reply.is_object())
    fail(
        backend_error::kind::bad_response, "malformed response from {}: {}",
        socket_path.string(), ec ? ec.message() : "not an object");

  co_return std::move(reply.as_object());
}

}  // namespace

asio::awaitable<json::object> forward(
    const fs::path& socket_path, const json::object& request,
    forward_timeouts timeouts) {
  auto strand = asio::make_strand(co_await asio::this_coro::executor);
  co_return co_await asio::co_spawn(
      strand, exchange(socket_path, request, timeouts), asio::use_awaitable);
}

}  // namespace wsplex
