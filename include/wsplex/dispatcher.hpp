// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file dispatcher.hpp
 * @brief The router's own JSONRPC endpoint.
 *
 * @c initialize, @c ping and @c tools/list are answered locally.
 * @c tools/call is routed to the backend owning the @c workspace argument.
 * Routing failures come back as successful tool output whose text starts
 * with @c "Error:", while malformed requests, unknown methods, unknown
 * tools and local handler exceptions come back as JSONRPC errors.
 *
 * One dispatcher serves every transport task concurrently; its only
 * mutable state is the socket locator's cache.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

#include "wsplex/config.hpp"
#include "wsplex/locator.hpp"
#include "wsplex/tools.hpp"

namespace wsplex {

namespace fs = std::filesystem;
namespace json = boost::json;

inline constexpr std::string_view protocol_version{"2024-11-05"};
inline constexpr std::string_view server_name{"wsplex"};
inline constexpr std::string_view server_version{"0.1.0"};

class dispatcher {
 public:
  dispatcher(router_config config, tool_registry registry);

  dispatcher(const dispatcher&) = delete;
  dispatcher(dispatcher&&) = delete;
  dispatcher& operator=(const dispatcher&) = delete;
  dispatcher& operator=(dispatcher&&) = delete;
  ~dispatcher() = default;

  /** @brief Handle one raw frame.
   *
   * Parse errors and non-object frames yield an error response with a null
   * id.  Returns an empty optional when nothing must be sent back.
   */
  boost::asio::awaitable<std::optional<json::object>> handle_frame(
      std::string text);

  // Handle one parsed request.  Notifications yield an empty optional.
  boost::asio::awaitable<std::optional<json::object>> handle(
      json::object request);

  // Route @p tool to the backend serving @p workspace.  Never throws for
  // routing failures: their description is the returned text.
  boost::asio::awaitable<std::string> forward_tool_call(
      std::string tool, fs::path workspace, json::object arguments);

  [[nodiscard]] const router_config& config() const { return cfg; }
  [[nodiscard]] const tool_registry& tools() const { return registry; }
  socket_locator& locator() { return sockets; }

 private:
  json::object handle_initialize(const json::value& id) const;
  json::object handle_tools_list(const json::value& id) const;
  boost::asio::awaitable<json::object> handle_tools_call(
      json::value id, const json::object* params);

  router_config cfg;
  tool_registry registry;
  socket_locator sockets;
};

}  // namespace wsplex
