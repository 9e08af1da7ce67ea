// SPDX-License-Identifier: MIT
#include "wsplex/jsonrpc.hpp"

#include <fmt/format.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <utility>

namespace wsplex::jsonrpc {

namespace asio = boost::asio;
namespace sys = boost::system;

json::object make_result(const json::value& id, json::value result) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["result"] = std::move(result);
  return msg;
}

json::object make_error(
    const json::value& id, int code, std::string_view message) {
  json::object err{};
  err["code"] = code;
  err["message"] = message;
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

std::string frame_line(const json::object& msg) {
  std::string text{json::serialize(msg)};
  text += '\n';
  return text;
}

namespace {

// Consume input up to and including the next terminator.
template <typename Stream>
asio::awaitable<void> skip_line(
    Stream& stream, std::string& buffer, std::size_t max_line) {
  for (;;) {
    buffer.clear();
    sys::error_code ec{};
    std::size_t n = co_await asio::async_read_until(
        stream, asio::dynamic_buffer(buffer, max_line), '\n',
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec == asio::error::not_found) continue;
    if (ec == asio::error::eof) {
      buffer.clear();
      co_return;
    }
    if (ec) throw sys::system_error{ec};
    buffer.erase(0, n);
    co_return;
  }
}

template <typename Stream>
asio::awaitable<std::optional<std::string>> read_line_impl(
    Stream& stream, std::string& buffer, std::size_t max_line) {
  sys::error_code ec{};
  std::size_t n = co_await asio::async_read_until(
      stream, asio::dynamic_buffer(buffer, max_line), '\n',
      asio::redirect_error(asio::use_awaitable, ec));

  if (ec == asio::error::not_found) {
    // Buffer full without a terminator
    co_await skip_line(stream, buffer, max_line);
    throw line_too_long{fmt::format("line exceeds {} bytes", max_line)};
  }
  if (ec == asio::error::eof) {
    if (buffer.empty()) co_return std::nullopt;
    std::string last{std::move(buffer)};
    buffer.clear();
    if (!last.empty() && last.back() == '\r') last.pop_back();
    co_return last;
  }
  if (ec) throw sys::system_error{ec};

  std::string line{buffer.substr(0, n - 1)};
  buffer.erase(0, n);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  co_return line;
}

}  // namespace

asio::awaitable<std::optional<std::string>> read_line(
    asio::posix::stream_descriptor& stream, std::string& buffer,
    std::size_t max_line) {
  co_return co_await read_line_impl(stream, buffer, max_line);
}

asio::awaitable<std::optional<std::string>> read_line(
    asio::local::stream_protocol::socket& stream, std::string& buffer,
    std::size_t max_line) {
  co_return co_await read_line_impl(stream, buffer, max_line);
}

asio::awaitable<void> write_line(
    asio::local::stream_protocol::socket& stream, const json::object& msg) {
  std::string text{frame_line(msg)};
  co_await asio::async_write(stream, asio::buffer(text), asio::use_awaitable);
}

}  // namespace wsplex::jsonrpc
