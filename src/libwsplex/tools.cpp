// SPDX-License-Identifier: MIT
#include "wsplex/tools.hpp"

#include <fmt/std.h>

#include <boost/json.hpp>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "utils.hpp"
#include "wsplex/config.hpp"

namespace wsplex {

namespace fs = std::filesystem;
namespace json = boost::json;

using utils::throwf;

namespace {

json::object string_param(std::string_view description) {
  json::object param{};
  param["type"] = "string";
  param["description"] = description;
  return param;
}

json::object make_schema(
    json::object properties, std::initializer_list<std::string_view> required) {
  json::object schema{};
  schema["type"] = "object";
  schema["properties"] = std::move(properties);
  json::array req{};
  for (auto r : required) req.emplace_back(r);
  schema["required"] = std::move(req);
  return schema;
}

}  // namespace

json::object routed_schema(const tool_descriptor& tool) {
  json::object schema{tool.input_schema};
  schema["type"] = "object";

  json::object properties{};
  if (auto* p = schema.if_contains("properties"); p && p->is_object())
    properties = p->as_object();
  properties[workspace_param] = string_param(
      "Workspace directory of the backend that should run this tool (the "
      "backend socket is looked up from here upwards)");
  schema["properties"] = std::move(properties);

  json::array required{};
  required.emplace_back(workspace_param);
  if (auto* r = schema.if_contains("required"); r && r->is_array()) {
    for (const auto& name : r->as_array()) {
      if (auto* s = name.if_string(); s && *s != workspace_param)
        required.push_back(name);
    }
  }
  schema["required"] = std::move(required);
  return schema;
}

std::optional<std::string> missing_argument(
    const tool_descriptor& tool, const json::object& args) {
  auto* required = tool.input_schema.if_contains("required");
  if (!required || !required->is_array()) return std::nullopt;

  for (const auto& entry : required->as_array()) {
    auto* name = entry.if_string();
    if (!name || *name == workspace_param) continue;
    auto* arg = args.if_contains(*name);
    if (!arg || arg->is_null()) return std::string{name->c_str()};
    if (auto* s = arg->if_string(); s && s->empty())
      return std::string{name->c_str()};
  }
  return std::nullopt;
}

tool_registry::tool_registry(std::vector<tool_descriptor> tools)
    : tools{std::move(tools)} {}

const tool_descriptor* tool_registry::find(std::string_view name) const {
  for (const auto& t : tools) {
    if (t.name == name) return &t;
  }
  return nullptr;
}

json::array tool_registry::describe() const {
  json::array out{};
  for (const auto& t : tools) {
    json::object d{};
    d["name"] = t.name;
    d["description"] = t.description;
    d["inputSchema"] = routed_schema(t);
    out.push_back(std::move(d));
  }
  return out;
}

tool_registry tool_registry::builtin() {
  std::vector<tool_descriptor> tools{};

  json::object exec_props{};
  exec_props["expression"] = string_param(
      "Expression to evaluate in the workspace's persistent session");
  tools.push_back(
      {"exec_repl",
       "Execute code in the workspace's shared, persistent REPL session.\n\n"
       "Call `usage_instructions` first.  The result is the raw text "
       "printed to stdout and stderr followed by the plain-text "
       "representation of the returned value.",
       make_schema(std::move(exec_props), {"expression"})});

  tools.push_back(
      {"investigate_environment",
       "Describe the backend's environment: working directory, active "
       "project, installed and development packages with their paths.",
       make_schema({}, {})});

  tools.push_back(
      {"usage_instructions",
       "Instructions and workflow guidelines for using the REPL tools.",
       make_schema({}, {})});

  json::object ws_props{};
  ws_props["file_path"] =
      string_param("Absolute path to the file to clean up");
  tools.push_back(
      {"remove-trailing-whitespace",
       "Remove trailing whitespace (spaces, tabs, mixed) from every line of "
       "a file.  Call it on each file you edited before handing back.",
       make_schema(std::move(ws_props), {"file_path"})});

  return tool_registry{std::move(tools)};
}

tool_registry tool_registry::from_json(const json::value& doc) {
  auto* root = doc.if_object();
  auto* list = root ? root->if_contains("tools") : nullptr;
  if (!list || !list->is_array())
    throwf<config_error>("tool registry must be an object with a 'tools' array");

  std::vector<tool_descriptor> tools{};
  std::set<std::string> seen{};
  for (const auto& entry : list->as_array()) {
    auto* obj = entry.if_object();
    if (!obj) throwf<config_error>("tool registry entries must be objects");

    auto* name = obj->if_contains("name");
    if (!name || !name->is_string() || name->as_string().empty())
      throwf<config_error>("tool registry entry without a name");

    tool_descriptor tool{};
    tool.name = name->as_string().c_str();
    if (!seen.insert(tool.name).second)
      throwf<config_error>("duplicate tool '{}'", tool.name);

    if (auto* d = obj->if_contains("description")) {
      if (!d->is_string())
        throwf<config_error>("tool '{}': description must be a string", tool.name);
      tool.description = d->as_string().c_str();
    }

    if (auto* s = obj->if_contains("inputSchema")) {
      if (!s->is_object())
        throwf<config_error>("tool '{}': inputSchema must be an object", tool.name);
      tool.input_schema = s->as_object();
    } else {
      tool.input_schema = make_schema({}, {});
    }
    tools.push_back(std::move(tool));
  }
  return tool_registry{std::move(tools)};
}

tool_registry tool_registry::load(const fs::path& file) {
  std::ifstream in{file};
  if (!in) throwf<config_error>("cannot open tool registry {}", file);

  std::string text{std::istreambuf_iterator<char>{in}, {}};
  std::error_code ec{};
  json::value doc = json::parse(text, ec);
  if (ec)
    throwf<config_error>("cannot parse tool registry {}: {}", file, ec.message());

  auto registry = from_json(doc);
  LOG_INFO("loaded {} tool(s) from {}", registry.all().size(), file);
  return registry;
}

}  // namespace wsplex
