// SPDX-License-Identifier: MIT
#include "wsplex/backend_host.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>

#include "json_helpers.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include "wsplex/dispatcher.hpp"
#include "wsplex/jsonrpc.hpp"
#include "wsplex/liveness.hpp"
#include "wsplex/tools.hpp"

namespace wsplex {

namespace asio = boost::asio;
namespace sys = boost::system;
using stream_protocol = asio::local::stream_protocol;

using utils::throwf;

backend_host::backend_host(
    fs::path workspace, std::map<std::string, tool_fn> tools,
    artifact_names names, int threads)
    : workspace{std::move(workspace)},
      tools{std::move(tools)},
      names{std::move(names)},
      nthreads{threads < 1 ? 1 : threads} {}

backend_host::~backend_host() { stop(); }

fs::path backend_host::socket_path() const { return workspace / names.socket; }

fs::path backend_host::pid_path() const { return workspace / names.pid; }

void backend_host::start() {
  if (acceptor)
    throwf<config_error>("backend for {} already started", workspace);

  auto sock_path = socket_path();
  if (probe_backend(sock_path, names.pid) == liveness::live)
    throwf<config_error>("a live backend already serves {}", workspace);

  // Marker before socket: a prober never sees a socket without its marker
  {
    std::ofstream out{pid_path(), std::ios::trunc};
    out << ::getpid();
    if (!out) {
      out.close();
      remove_marker();
      throwf<config_error>("cannot write pid marker {}", pid_path());
    }
  }

  try {
    acceptor.emplace(ctx);
    stream_protocol::endpoint ep{sock_path.string()};
    acceptor->open(ep.protocol());
    acceptor->bind(ep);
    acceptor->listen();
  } catch (const sys::system_error& e) {
    acceptor.reset();
    remove_marker();
    throwf<config_error>("cannot listen on {}: {}", sock_path, e.what());
  }

  ctx.restart();
  asio::co_spawn(ctx, accept_loop(), asio::detached);
  for (int i = 0; i < nthreads; ++i)
    runners.emplace_back([this] { ctx.run(); });

  LOG_INFO("backend serving {} tool(s) on {}", tools.size(), sock_path);
}

void backend_host::stop() {
  if (!acceptor) return;

  ctx.stop();
  for (auto& t : runners) {
    if (t.joinable()) t.join();
  }
  runners.clear();

  sys::error_code ignored{};
  acceptor->close(ignored);
  acceptor.reset();
  remove_artifacts();
  LOG_INFO("backend for {} stopped", workspace);
}

void backend_host::remove_marker() const {
  std::error_code ec{};
  fs::remove(pid_path(), ec);
  if (ec) LOG_WARN("could not remove {}: {}", pid_path(), ec.message());
}

void backend_host::remove_artifacts() const {
  for (const auto& p : {socket_path(), pid_path()}) {
    std::error_code ec{};
    fs::remove(p, ec);
    if (ec) LOG_WARN("could not remove {}: {}", p, ec.message());
  }
}

asio::awaitable<void> backend_host::accept_loop() {
  for (;;) {
    sys::error_code ec{};
    auto sock = co_await acceptor->async_accept(
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec) break;  // acceptor closed
    asio::co_spawn(ctx, serve(std::move(sock)), asio::detached);
  }
}

asio::awaitable<void> backend_host::serve(stream_protocol::socket sock) {
  std::string buffer{};
  for (;;) {
    std::optional<std::string> line{};
    json::object response{};
    try {
      line = co_await jsonrpc::read_line(sock, buffer);
    } catch (const jsonrpc::line_too_long& e) {
      LOG_WARN("backend dropping request: {}", e.what());
      response = jsonrpc::make_error(
          nullptr, jsonrpc::INVALID_REQUEST,
          fmt::format("Invalid Request: {}", e.what()));
    } catch (const sys::system_error& e) {
      LOG_DEBUG("backend read failed: {}", e.what());
      break;
    }

    if (response.empty()) {
      if (!line) break;
      if (line->empty()) continue;

      std::error_code jec{};
      json::value request = json::parse(*line, jec);
      if (jec) {
        response = jsonrpc::make_error(
            nullptr, jsonrpc::PARSE_ERROR,
            fmt::format("Parse error: {}", jec.message()));
      } else if (!request.is_object()) {
        response = jsonrpc::make_error(
            nullptr, jsonrpc::INVALID_REQUEST, "Invalid Request");
      } else if (auto r = process(request.as_object())) {
        response = std::move(*r);
      } else {
        continue;
      }
    }

    try {
      co_await jsonrpc::write_line(sock, response);
    } catch (const sys::system_error& e) {
      LOG_DEBUG("backend write failed: {}", e.what());
      break;
    }
  }
}

std::optional<json::object> backend_host::process(
    const json::object& request) const {
  json::value id{nullptr};
  const bool notification = !request.contains("id");
  if (!notification) id = request.at("id");

  std::string method{string_member(request, "method")};
  const json::object* params{nullptr};
  if (auto* p = request.if_contains("params")) params = p->if_object();

  json::object response{};
  if (method == "initialize") {
    json::object server_info{};
    server_info["name"] = "wsplex-backend";
    server_info["version"] = server_version;
    json::object capabilities{};
    capabilities["tools"] = json::object{};
    json::object result{};
    result["protocolVersion"] = protocol_version;
    result["capabilities"] = std::move(capabilities);
    result["serverInfo"] = std::move(server_info);
    response = jsonrpc::make_result(id, std::move(result));
  } else if (method == "tools/list") {
    json::array list{};
    for (const auto& [name, fn] : tools) {
      json::object schema{};
      schema["type"] = "object";
      json::object d{};
      d["name"] = name;
      d["inputSchema"] = std::move(schema);
      list.push_back(std::move(d));
    }
    json::object result{};
    result["tools"] = std::move(list);
    response = jsonrpc::make_result(id, std::move(result));
  } else if (method == "tools/call") {
    std::string name{params ? string_member(*params, "name") : ""};
    json::object args{};
    if (params) {
      if (auto* a = params->if_contains("arguments")) {
        if (auto* obj = a->if_object()) args = *obj;
      }
    }
    auto it = tools.find(name);
    if (it == tools.end()) {
      response = jsonrpc::make_error(
          id, jsonrpc::INVALID_PARAMS, fmt::format("Tool not found: {}", name));
    } else {
      try {
        response = jsonrpc::make_result(id, text_content(it->second(args)));
      } catch (const std::exception& e) {
        LOG_ERROR("tool {} threw {}", name, describe_exception(e));
        response = jsonrpc::make_error(
            id, jsonrpc::INTERNAL_ERROR,
            fmt::format("Tool execution error: {}", e.what()));
      }
    }
  } else if (method.starts_with("notifications/")) {
    return std::nullopt;
  } else {
    response = jsonrpc::make_error(
        id, jsonrpc::METHOD_NOT_FOUND,
        fmt::format("Method not found: {}", method));
  }

  if (notification) return std::nullopt;
  return response;
}

}  // namespace wsplex
