#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "test_helpers.hpp"
#include "wsplex/backend_host.hpp"
#include "wsplex/dispatcher.hpp"
#include "wsplex/jsonrpc.hpp"
#include "wsplex/tools.hpp"

using namespace std::chrono_literals;

namespace {

json::object schema_requiring(std::initializer_list<std::string_view> names) {
  json::object props{};
  json::array required{};
  for (auto n : names) {
    props[n] = json::object{{"type", "string"}};
    required.emplace_back(n);
  }
  json::object schema{};
  schema["type"] = "object";
  schema["properties"] = std::move(props);
  schema["required"] = std::move(required);
  return schema;
}

wsplex::tool_registry test_registry() {
  return wsplex::tool_registry{std::vector<wsplex::tool_descriptor>{
      {"echo", "Echo the text argument back", schema_requiring({})},
      {"whoami", "Name the backend answering", schema_requiring({})},
      {"explode", "Always fails on the backend", schema_requiring({})},
      {"needs_file", "Requires a file_path", schema_requiring({"file_path"})},
  }};
}

wsplex::router_config test_config() {
  wsplex::router_config cfg{};
  cfg.names = test_names();
  cfg.connect_timeout = 1s;
  cfg.read_timeout = 2s;
  return cfg;
}

std::map<std::string, wsplex::tool_fn> backend_tools(const std::string& label) {
  return {
      {"echo", [](const json::object& args) { return arg_text(args); }},
      {"whoami", [label](const json::object&) { return label; }},
      {"explode",
       [](const json::object&) -> std::string {
         throw std::runtime_error{"kaboom"};
       }},
      {"needs_file",
       [](const json::object& args) {
         return std::string{args.at("file_path").as_string().c_str()};
       }},
  };
}

json::object request(
    std::string_view method, json::object params = {}, json::value id = 1) {
  json::object req{};
  req["jsonrpc"] = "2.0";
  req["id"] = std::move(id);
  req["method"] = method;
  if (!params.empty()) req["params"] = std::move(params);
  return req;
}

json::object tool_call(
    std::string_view tool, json::object args, json::value id = 1) {
  json::object params{};
  params["name"] = tool;
  params["arguments"] = std::move(args);
  return request("tools/call", std::move(params), std::move(id));
}

json::object rpc(wsplex::dispatcher& router, json::object req) {
  auto response = run_coro(router.handle(std::move(req)));
  REQUIRE(response.has_value());
  return std::move(*response);
}

std::int64_t error_code(const json::object& response) {
  REQUIRE(response.contains("error"));
  return response.at("error").at("code").as_int64();
}

std::string error_message(const json::object& response) {
  return std::string{response.at("error").at("message").as_string().c_str()};
}

bool starts_with(const std::string& s, std::string_view prefix) {
  return s.starts_with(prefix);
}

bool contains(const std::string& s, std::string_view part) {
  return s.find(part) != std::string::npos;
}

}  // namespace

TEST_CASE("initialize") {
  wsplex::dispatcher router{test_config(), test_registry()};
  auto response = rpc(router, request("initialize"));

  CHECK(response.at("jsonrpc").as_string() == "2.0");
  CHECK(response.at("id").as_int64() == 1);
  const auto& result = response.at("result").as_object();
  CHECK(result.at("protocolVersion").as_string() == "2024-11-05");
  CHECK(result.at("capabilities").at("tools").is_object());
  CHECK(result.at("serverInfo").at("name").as_string() == "wsplex");
}

TEST_CASE("ping") {
  wsplex::dispatcher router{test_config(), test_registry()};
  auto response = rpc(router, request("ping", {}, "p-1"));
  CHECK(response.at("id").as_string() == "p-1");
  CHECK(response.at("result").as_object().empty());
}

TEST_CASE("notifications-get-no-response") {
  wsplex::dispatcher router{test_config(), test_registry()};

  json::object note{
      {"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
  CHECK_FALSE(run_coro(router.handle(note)).has_value());

  // Even an unknown method stays silent without an id
  json::object bogus{{"jsonrpc", "2.0"}, {"method", "bogus"}};
  CHECK_FALSE(run_coro(router.handle(bogus)).has_value());

  // A tools/call notification is executed but not answered
  auto call = tool_call("echo", {});
  call.erase("id");
  CHECK_FALSE(run_coro(router.handle(call)).has_value());
}

TEST_CASE("tools-list-advertises-workspace") {
  wsplex::dispatcher router{test_config(), test_registry()};
  auto response = rpc(router, request("tools/list"));

  const auto& tools = response.at("result").at("tools").as_array();
  REQUIRE(tools.size() == 4);
  for (const auto& t : tools) {
    const auto& schema = t.at("inputSchema").as_object();
    CHECK(
        schema.at("properties").at("workspace").at("type").as_string() ==
        "string");
    const auto& required = schema.at("required").as_array();
    REQUIRE(!required.empty());
    CHECK(required.at(0).as_string() == "workspace");
  }
  const auto& needs_file = tools.at(3).at("inputSchema").at("required");
  CHECK(needs_file.as_array().size() == 2);
  CHECK(needs_file.as_array().at(1).as_string() == "file_path");
}

TEST_CASE("builtin-registry") {
  auto registry = wsplex::tool_registry::builtin();
  CHECK(registry.find("exec_repl") != nullptr);
  CHECK(registry.find("investigate_environment") != nullptr);
  CHECK(registry.find("usage_instructions") != nullptr);
  CHECK(registry.find("remove-trailing-whitespace") != nullptr);
  CHECK(registry.find("nope") == nullptr);
}

TEST_CASE("registry-from-json") {
  SUBCASE("valid") {
    auto doc = json::parse(R"({"tools":[
        {"name":"a","description":"first"},
        {"name":"b","inputSchema":{"type":"object","required":["x"]}}]})");
    auto registry = wsplex::tool_registry::from_json(doc);
    REQUIRE(registry.all().size() == 2);
    CHECK(registry.find("a")->description == "first");
    CHECK(wsplex::missing_argument(*registry.find("b"), {}) == "x");
  }
  SUBCASE("duplicate") {
    auto doc = json::parse(R"({"tools":[{"name":"a"},{"name":"a"}]})");
    CHECK_THROWS_AS(
        wsplex::tool_registry::from_json(doc), wsplex::config_error);
  }
  SUBCASE("not a list") {
    CHECK_THROWS_AS(
        wsplex::tool_registry::from_json(json::parse(R"({"tools":1})")),
        wsplex::config_error);
  }
  SUBCASE("nameless") {
    auto doc = json::parse(R"({"tools":[{"description":"x"}]})");
    CHECK_THROWS_AS(
        wsplex::tool_registry::from_json(doc), wsplex::config_error);
  }
}

TEST_CASE("registry-load") {
  scratch_dir tmp;
  auto file = tmp.path / "tools.json";

  touch(file, R"({"tools":[{"name":"only"}]})");
  auto registry = wsplex::tool_registry::load(file);
  CHECK(registry.all().size() == 1);

  touch(file, "{not json");
  CHECK_THROWS_AS(wsplex::tool_registry::load(file), wsplex::config_error);
  CHECK_THROWS_AS(
      wsplex::tool_registry::load(tmp.path / "missing.json"),
      wsplex::config_error);
}

TEST_CASE("protocol-errors") {
  wsplex::dispatcher router{test_config(), test_registry()};

  SUBCASE("unknown method") {
    auto response = rpc(router, request("resources/list"));
    CHECK(error_code(response) == wsplex::jsonrpc::METHOD_NOT_FOUND);
    CHECK(error_message(response) == "Method not found: resources/list");
  }
  SUBCASE("tools/call without params") {
    auto response = rpc(router, request("tools/call"));
    CHECK(error_code(response) == wsplex::jsonrpc::INVALID_PARAMS);
  }
  SUBCASE("unknown tool") {
    auto response = rpc(router, tool_call("frobnicate", {}));
    CHECK(error_code(response) == wsplex::jsonrpc::INVALID_PARAMS);
    CHECK(error_message(response) == "Tool not found: frobnicate");
  }
  SUBCASE("missing method") {
    json::object req{{"jsonrpc", "2.0"}, {"id", 3}};
    auto response = rpc(router, req);
    CHECK(error_code(response) == wsplex::jsonrpc::INVALID_REQUEST);
    CHECK(response.at("id").as_int64() == 3);
  }
}

TEST_CASE("frame-errors") {
  wsplex::dispatcher router{test_config(), test_registry()};

  SUBCASE("unparsable") {
    auto response = run_coro(router.handle_frame("{\"jsonrpc\": "));
    REQUIRE(response.has_value());
    CHECK(error_code(*response) == wsplex::jsonrpc::PARSE_ERROR);
    CHECK(response->at("id").is_null());
  }
  SUBCASE("not an object") {
    auto response = run_coro(router.handle_frame("[1, 2]"));
    REQUIRE(response.has_value());
    CHECK(error_code(*response) == wsplex::jsonrpc::INVALID_REQUEST);
    CHECK(response->at("id").is_null());
  }
  SUBCASE("valid frame") {
    auto response = run_coro(router.handle_frame(
        R"({"jsonrpc":"2.0","id":"abc","method":"ping"})"));
    REQUIRE(response.has_value());
    CHECK(response->at("id").as_string() == "abc");
  }
}

TEST_CASE("argument-validation") {
  wsplex::dispatcher router{test_config(), test_registry()};

  SUBCASE("missing workspace") {
    auto response = rpc(router, tool_call("echo", {{"text", "hi"}}));
    CHECK_FALSE(response.contains("error"));
    CHECK(text_of(response) == "Error: workspace parameter is required");
  }
  SUBCASE("empty workspace") {
    auto response = rpc(router, tool_call("echo", {{"workspace", ""}}));
    CHECK(text_of(response) == "Error: workspace parameter is required");
  }
  SUBCASE("arguments missing altogether") {
    json::object params{{"name", "echo"}};
    auto response = rpc(router, request("tools/call", std::move(params)));
    CHECK_FALSE(response.contains("error"));
    CHECK(response.contains("result"));
    CHECK(text_of(response) == "Error: workspace parameter is required");
  }
  SUBCASE("missing tool argument") {
    scratch_dir tmp;
    auto response = rpc(
        router, tool_call("needs_file", {{"workspace", tmp.path.string()}}));
    CHECK(text_of(response) == "Error: file_path parameter is required");
    // Rejected before any lookup
    CHECK(router.locator().walk_count() == 0);
  }
}

TEST_CASE("backend-not-found") {
  scratch_dir tmp;
  auto ws = tmp.mkdir("project");
  wsplex::dispatcher router{test_config(), test_registry()};

  auto response =
      rpc(router, tool_call("echo", {{"workspace", ws.string()}}));
  auto text = text_of(response);
  CHECK(starts_with(text, "Error: backend not found for workspace"));
  CHECK(contains(text, ws.string()));
  CHECK(contains(text, "wsplex-backend --workspace"));
}

TEST_CASE("backend-not-running") {
  scratch_dir tmp;
  touch(tmp.path / test_names().socket);
  write_marker(tmp.path, dead_pid());
  wsplex::dispatcher router{test_config(), test_registry()};

  auto response =
      rpc(router, tool_call("echo", {{"workspace", tmp.path.string()}}));
  auto text = text_of(response);
  CHECK(starts_with(text, "Error: backend not running"));
  CHECK(contains(text, "process is dead"));
  CHECK(contains(text, "wsplex-backend --workspace"));

  // Cleaned up, and the next call walks again
  CHECK_FALSE(fs::exists(tmp.path / test_names().socket));
  CHECK_FALSE(fs::exists(tmp.path / test_names().pid));
  response =
      rpc(router, tool_call("echo", {{"workspace", tmp.path.string()}}));
  CHECK(starts_with(text_of(response), "Error: backend not found"));
  CHECK(router.locator().walk_count() == 2);
}

TEST_CASE("backend-vanished-after-lookup") {
  scratch_dir tmp;
  wsplex::dispatcher router{test_config(), test_registry()};
  {
    wsplex::backend_host host{tmp.path, backend_tools("x"), test_names()};
    host.start();
    auto response = rpc(
        router, tool_call(
                    "echo", {{"workspace", tmp.path.string()}, {"text", "up"}}));
    CHECK(text_of(response) == "up");
  }

  // The lookup is still cached but the socket is gone
  auto response =
      rpc(router, tool_call("echo", {{"workspace", tmp.path.string()}}));
  CHECK_FALSE(response.contains("error"));
  auto text = text_of(response);
  CHECK(starts_with(text, "Error: backend not found for workspace"));
  CHECK(contains(text, "wsplex-backend --workspace"));
  CHECK(router.locator().walk_count() == 1);
}

TEST_CASE("backend-unreachable") {
  scratch_dir tmp;
  // Marker names a live process, but nothing listens on the socket name
  touch(tmp.path / test_names().socket);
  write_marker(tmp.path, ::getpid());
  wsplex::dispatcher router{test_config(), test_registry()};

  auto response =
      rpc(router, tool_call("echo", {{"workspace", tmp.path.string()}}));
  CHECK_FALSE(response.contains("error"));
  CHECK(starts_with(text_of(response), "Error: backend unreachable"));
  // A live marker keeps the artifacts in place
  CHECK(fs::exists(tmp.path / test_names().socket));
  CHECK(fs::exists(tmp.path / test_names().pid));
}

TEST_CASE("backend-hangs-up-without-reply") {
  scratch_dir tmp;
  write_marker(tmp.path, ::getpid());
  scripted_backend backend{tmp.path / test_names().socket, ""};
  wsplex::dispatcher router{test_config(), test_registry()};

  auto response =
      rpc(router, tool_call("echo", {{"workspace", tmp.path.string()}}));
  CHECK_FALSE(response.contains("error"));
  CHECK(
      text_of(response) ==
      "Error: backend closed the connection without replying");
}

TEST_CASE("backend-read-timeout") {
  scratch_dir tmp;
  silent_backend silent{tmp.path};
  auto cfg = test_config();
  cfg.read_timeout = 300ms;
  wsplex::dispatcher router{cfg, test_registry()};

  json::object response{};
  auto ms = elapsed_ms([&] {
    response =
        rpc(router, tool_call("echo", {{"workspace", tmp.path.string()}}));
  });
  CHECK(starts_with(text_of(response), "Error: timed out waiting for backend"));
  CHECK(ms >= 300);
  CHECK(ms < 3000);
}

TEST_CASE("forward-from-subdirectory") {
  scratch_dir tmp;
  auto sub = tmp.mkdir("src/deep");
  wsplex::backend_host host{tmp.path, backend_tools("root"), test_names()};
  host.start();
  wsplex::dispatcher router{test_config(), test_registry()};

  auto response = rpc(
      router, tool_call(
                  "echo", {{"workspace", sub.string()}, {"text", "hello"}},
                  "req-9"));
  CHECK(response.at("id").as_string() == "req-9");
  CHECK(text_of(response) == "hello");
}

TEST_CASE("workspace-argument-is-not-forwarded") {
  scratch_dir tmp;
  std::promise<json::object> seen{};
  auto got = seen.get_future();
  wsplex::backend_host host{
      tmp.path,
      {{"echo",
        [&seen](const json::object& args) {
          seen.set_value(args);
          return std::string{"ok"};
        }}},
      test_names()};
  host.start();
  wsplex::dispatcher router{test_config(), test_registry()};

  auto response = rpc(
      router,
      tool_call("echo", {{"workspace", tmp.path.string()}, {"text", "t"}}));
  CHECK(text_of(response) == "ok");
  auto args = got.get();
  CHECK_FALSE(args.contains("workspace"));
  CHECK(args.at("text").as_string() == "t");
}

TEST_CASE("backend-error-reply") {
  scratch_dir tmp;
  wsplex::backend_host host{tmp.path, backend_tools("x"), test_names()};
  host.start();
  wsplex::dispatcher router{test_config(), test_registry()};

  auto response =
      rpc(router, tool_call("explode", {{"workspace", tmp.path.string()}}));
  CHECK_FALSE(response.contains("error"));
  auto text = text_of(response);
  CHECK(starts_with(text, "Error: backend returned error:"));
  CHECK(contains(text, "kaboom"));
}

TEST_CASE("concurrent-workspaces-stay-separate") {
  scratch_dir tmp;
  std::vector<fs::path> workspaces{
      tmp.mkdir("alpha"), tmp.mkdir("beta"), tmp.mkdir("gamma")};
  std::vector<std::unique_ptr<wsplex::backend_host>> hosts{};
  for (const auto& ws : workspaces) {
    hosts.push_back(std::make_unique<wsplex::backend_host>(
        ws, backend_tools(ws.filename().string()), test_names()));
    hosts.back()->start();
  }
  wsplex::dispatcher router{test_config(), test_registry()};

  net::io_context ctx{4};
  std::vector<std::future<std::optional<json::object>>> replies{};
  for (int round = 0; round < 5; ++round) {
    for (std::size_t i = 0; i < workspaces.size(); ++i) {
      auto id = static_cast<std::int64_t>(round * 10 + i);
      replies.push_back(net::co_spawn(
          ctx,
          router.handle(tool_call(
              "whoami", {{"workspace", workspaces[i].string()}}, id)),
          net::use_future));
    }
  }
  std::vector<std::thread> threads{};
  for (int i = 0; i < 4; ++i) threads.emplace_back([&ctx] { ctx.run(); });
  for (auto& t : threads) t.join();

  for (auto& f : replies) {
    auto response = f.get();
    REQUIRE(response.has_value());
    auto i = static_cast<std::size_t>(response->at("id").as_int64() % 10);
    CHECK(text_of(*response) == workspaces[i].filename().string());
  }
}
