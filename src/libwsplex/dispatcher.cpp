// SPDX-License-Identifier: MIT
#include "wsplex/dispatcher.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <boost/json.hpp>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "wsplex/backend_client.hpp"
#include "wsplex/jsonrpc.hpp"
#include "wsplex/liveness.hpp"

namespace wsplex {

namespace asio = boost::asio;
namespace json = boost::json;

namespace {

std::string start_hint(const fs::path& workspace) {
  return fmt::format(
      "Start a backend for this workspace with:\n"
      "  wsplex-backend --workspace {}",
      workspace.string());
}

std::string describe_failure(const backend_error& e) {
  switch (e.reason) {
    case backend_error::kind::connect_timeout:
      return fmt::format("Error: timed out connecting to backend: {}", e.what());
    case backend_error::kind::read_timeout:
      return fmt::format(
          "Error: timed out waiting for backend response: {}", e.what());
    case backend_error::kind::connect_failed:
      return fmt::format("Error: backend unreachable: {}", e.what());
    case backend_error::kind::closed:
      return "Error: backend closed the connection without replying";
    case backend_error::kind::bad_response:
      return fmt::format("Error: backend sent a malformed response: {}", e.what());
    case backend_error::kind::io_error:
    default:
      return fmt::format(
          "Error: failed to communicate with backend: {}", e.what());
  }
}

}  // namespace

dispatcher::dispatcher(router_config config, tool_registry registry)
    : cfg{std::move(config)},
      registry{std::move(registry)},
      sockets{cfg.names.socket, cfg.cache_ttl} {}

/// Handlers

json::object dispatcher::handle_initialize(const json::value& id) const {
  json::object capabilities{};
  capabilities["tools"] = json::object{};

  json::object server_info{};
  server_info["name"] = server_name;
  server_info["version"] = server_version;

  json::object result{};
  result["protocolVersion"] = protocol_version;
  result["capabilities"] = std::move(capabilities);
  result["serverInfo"] = std::move(server_info);
  return jsonrpc::make_result(id, std::move(result));
}

json::object dispatcher::handle_tools_list(const json::value& id) const {
  json::object result{};
  result["tools"] = registry.describe();
  return jsonrpc::make_result(id, std::move(result));
}

asio::awaitable<json::object> dispatcher::handle_tools_call(
    json::value id, const json::object* params) {
  std::string name{};
  json::object args{};
  if (params) {
    name = string_member(*params, "name");
    if (auto* a = params->if_contains("arguments")) {
      if (auto* obj = a->if_object()) args = *obj;
    }
  }

  const auto* tool = registry.find(name);
  if (!tool)
    co_return jsonrpc::make_error(
        id, jsonrpc::INVALID_PARAMS, fmt::format("Tool not found: {}", name));

  std::string workspace{string_member(args, workspace_param)};
  if (workspace.empty())
    co_return jsonrpc::make_result(
        id, text_content(fmt::format(
                "Error: {} parameter is required", workspace_param)));

  if (auto missing = missing_argument(*tool, args))
    co_return jsonrpc::make_result(
        id,
        text_content(fmt::format("Error: {} parameter is required", *missing)));

  args.erase(workspace_param);
  auto text =
      co_await forward_tool_call(tool->name, workspace, std::move(args));
  co_return jsonrpc::make_result(id, text_content(text));
}

asio::awaitable<std::string> dispatcher::forward_tool_call(
    std::string tool, fs::path workspace, json::object arguments) {
  auto socket = sockets.locate(workspace);
  if (!socket) {
    LOG_WARN("{}: no backend socket above {}", tool, workspace);
    co_return fmt::format(
        "Error: backend not found for workspace {}. {}", workspace.string(),
        start_hint(workspace));
  }

  if (auto state = probe_backend(*socket, cfg.names.pid);
      state != liveness::live) {
    LOG_WARN("{}: backend at {} is {}", tool, *socket, liveness_to_string(state));
    sockets.invalidate(workspace);
    // Absent here means the socket vanished since it was located
    if (state == liveness::absent)
      co_return fmt::format(
          "Error: backend not found for workspace {}. {}", workspace.string(),
          start_hint(workspace));
    co_return fmt::format(
        "Error: backend not running (socket exists but process is dead). {}",
        start_hint(workspace));
  }

  json::object params{};
  params["name"] = tool;
  params["arguments"] = std::move(arguments);
  json::object request{};
  request["jsonrpc"] = "2.0";
  request["id"] = 1;
  request["method"] = "tools/call";
  request["params"] = std::move(params);

  std::string text{};
  try {
    auto reply = co_await forward(
        *socket, request, {cfg.connect_timeout, cfg.read_timeout});
    if (auto* err = reply.if_contains("error")) {
      std::string message{};
      if (auto* obj = err->if_object()) message = string_member(*obj, "message");
      if (message.empty()) message = json::serialize(*err);
      text = fmt::format("Error: backend returned error: {}", message);
    } else if (auto* result = reply.if_contains("result")) {
      text = result_text(*result);
    }
  } catch (const backend_error& e) {
    LOG_WARN(
        "{}: forwarding to {} failed ({}): {}", tool, *socket,
        kind_to_string(e.reason), e.what());
    text = describe_failure(e);
  } catch (const std::exception& e) {
    LOG_WARN("{}: forwarding to {} failed: {}", tool, *socket, e.what());
    text = fmt::format("Error: failed to communicate with backend: {}", e.what());
  }
  co_return text;
}

/// Entry points

asio::awaitable<std::optional<json::object>> dispatcher::handle_frame(
    std::string text) {
  json::value msg_val{};
  {
    std::error_code jec{};
    msg_val = json::parse(text, jec);
    if (jec) {
      LOG_WARN("unparsable frame: {}", jec.message());
      co_return jsonrpc::make_error(
          nullptr, jsonrpc::PARSE_ERROR,
          fmt::format("Parse error: {}", jec.message()));
    }
  }

  auto* msg = msg_val.if_object();
  if (!msg)
    co_return jsonrpc::make_error(
        nullptr, jsonrpc::INVALID_REQUEST, "Invalid Request");

  co_return co_await handle(std::move(*msg));
}

asio::awaitable<std::optional<json::object>> dispatcher::handle(
    json::object request) {
  json::value id{nullptr};
  const bool notification = !request.contains("id");
  if (!notification) id = request.at("id");

  auto* method_val = request.if_contains("method");
  if (!method_val || !method_val->is_string())
    co_return jsonrpc::make_error(
        id, jsonrpc::INVALID_REQUEST, "Invalid Request: missing method");

  std::string method{method_val->as_string().c_str()};
  const json::object* params{nullptr};
  if (auto* p = request.if_contains("params")) params = p->if_object();

  LOG_DEBUG("rpc: {}{}", method, notification ? " (notification)" : "");

  std::optional<json::object> response{};
  std::optional<std::string> failure{};
  try {
    if (method == "initialize") {
      response = handle_initialize(id);
    } else if (method == "ping") {
      response = jsonrpc::make_result(id, json::object{});
    } else if (method == "tools/list") {
      response = handle_tools_list(id);
    } else if (method == "tools/call") {
      response = co_await handle_tools_call(id, params);
    } else if (method.starts_with("notifications/")) {
      // Acknowledged; only answered if sent with an id anyway
      if (!notification) response = jsonrpc::make_result(id, json::object{});
    } else {
      response = jsonrpc::make_error(
          id, jsonrpc::METHOD_NOT_FOUND,
          fmt::format("Method not found: {}", method));
    }
  } catch (const std::exception& e) {
    LOG_ERROR("{} threw {}", method, describe_exception(e));
    failure = e.what();
  }
  if (failure)
    response = jsonrpc::make_error(
        id, jsonrpc::INTERNAL_ERROR,
        fmt::format("Internal error: {}", *failure));

  if (notification) co_return std::nullopt;
  co_return response;
}

}  // namespace wsplex
