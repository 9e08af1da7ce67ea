// SPDX-License-Identifier: MIT
#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wsplex {

namespace fs = std::filesystem;
namespace json = boost::json;

struct forward_timeouts {
  std::chrono::milliseconds connect;
  std::chrono::milliseconds read;
};

struct backend_error : std::runtime_error {
  enum class kind : uint8_t {
    connect_failed,
    connect_timeout,
    read_timeout,
    closed,
    io_error,
    bad_response,
  };

  backend_error(kind k, const std::string& desc)
      : std::runtime_error{desc}, reason{k} {}

  [[nodiscard]] bool timed_out() const {
    return reason == kind::connect_timeout || reason == kind::read_timeout;
  }

  kind reason;
};

std::string_view kind_to_string(backend_error::kind k);

/** @brief Send @p request to the backend at @p socket_path, await its reply.
 *
 * Opens a fresh connection, writes the request as one line, reads one line
 * back and closes the connection.  Connecting and reading are bounded by
 * the two timeouts independently; an expired timeout cancels the pending
 * operation.  Failures throw @c backend_error.
 */
boost::asio::awaitable<json::object> forward(
    const fs::path& socket_path, const json::object& request,
    forward_timeouts timeouts);

}  // namespace wsplex
