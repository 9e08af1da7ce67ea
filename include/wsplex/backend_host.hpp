// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file backend_host.hpp
 * @brief Backend side of the workspace socket contract.
 *
 * A @c backend_host binds the well-known socket in its workspace, records
 * the current process id in the marker file and answers newline-framed
 * JSONRPC requests (@c initialize, @c tools/list, @c tools/call) with a
 * fixed set of tool functions.  It serves on its own threads between
 * @c start() and @c stop().
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/json.hpp>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "wsplex/config.hpp"

namespace wsplex {

namespace fs = std::filesystem;
namespace json = boost::json;

using tool_fn = std::function<std::string(const json::object& args)>;

class backend_host {
 public:
  backend_host(
      fs::path workspace, std::map<std::string, tool_fn> tools,
      artifact_names names = {}, int threads = 2);

  backend_host(const backend_host&) = delete;
  backend_host(backend_host&&) = delete;
  backend_host& operator=(const backend_host&) = delete;
  backend_host& operator=(backend_host&&) = delete;
  ~backend_host();

  // Throws config_error when a live backend already owns the workspace or
  // the socket cannot be bound.  A failed start leaves no marker behind and
  // may be retried.
  void start();
  void stop();

  [[nodiscard]] fs::path socket_path() const;
  [[nodiscard]] fs::path pid_path() const;

  // Answer one request.  Notifications yield an empty optional.
  [[nodiscard]] std::optional<json::object> process(
      const json::object& request) const;

 private:
  boost::asio::awaitable<void> accept_loop();
  boost::asio::awaitable<void> serve(
      boost::asio::local::stream_protocol::socket sock);
  void remove_marker() const;
  void remove_artifacts() const;

  fs::path workspace;
  std::map<std::string, tool_fn> tools;
  artifact_names names;
  int nthreads;
  boost::asio::io_context ctx;
  std::optional<boost::asio::local::stream_protocol::acceptor> acceptor;
  std::vector<std::thread> runners;
};

}  // namespace wsplex
