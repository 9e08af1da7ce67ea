// SPDX-License-Identifier: MIT
#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wsplex {

namespace fs = std::filesystem;
namespace json = boost::json;

struct config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A tool served by the backends.  @c input_schema is the backend's own
// schema, without the routing parameter.
struct tool_descriptor {
  std::string name;
  std::string description;
  json::object input_schema;
};

// Schema as advertised by the router: @p tool's schema plus a required
// string @c workspace parameter, listed first.
json::object routed_schema(const tool_descriptor& tool);

// First parameter the tool requires that @p args lacks (or holds as an
// empty string), if any.
std::optional<std::string> missing_argument(
    const tool_descriptor& tool, const json::object& args);

class tool_registry {
 public:
  tool_registry() = default;
  explicit tool_registry(std::vector<tool_descriptor> tools);

  [[nodiscard]] const tool_descriptor* find(std::string_view name) const;
  [[nodiscard]] const std::vector<tool_descriptor>& all() const {
    return tools;
  }

  // Descriptors for a tools/list result.
  [[nodiscard]] json::array describe() const;

  static tool_registry builtin();

  // Parse @c {"tools":[{name, description, inputSchema}...]}.
  static tool_registry from_json(const json::value& doc);
  static tool_registry load(const fs::path& file);

 private:
  std::vector<tool_descriptor> tools;
};

}  // namespace wsplex
