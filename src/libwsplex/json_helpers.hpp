#pragma once

#include <boost/json.hpp>
#include <exception>
#include <string>
#include <string_view>
#include <typeinfo>

#include <fmt/format.h>

#include "utils.hpp"

namespace wsplex {

namespace json = boost::json;

// MCP tool-call result carrying a single text item.
inline json::object text_content(std::string_view text) {
  json::object item;
  item["type"] = "text";
  item["text"] = text;
  json::array content;
  content.push_back(std::move(item));
  json::object res;
  res["content"] = std::move(content);
  return res;
}

// Text of the first content item of a tool-call result, or the whole
// result serialized when it has no such item.
inline std::string result_text(const json::value& result) {
  if (auto* obj = result.if_object()) {
    if (auto* content = obj->if_contains("content")) {
      if (auto* arr = content->if_array(); arr && !arr->empty()) {
        if (auto* first = arr->front().if_object()) {
          if (auto* text = first->if_contains("text")) {
            if (auto* s = text->if_string()) return {s->data(), s->size()};
          }
          return {};
        }
      }
    }
  }
  if (auto* s = result.if_string()) return {s->data(), s->size()};
  return json::serialize(result);
}

// String member @p key of @p obj, or empty when absent or not a string.
inline std::string_view string_member(
    const json::object& obj, std::string_view key) {
  if (auto* v = obj.if_contains(key)) {
    if (auto* s = v->if_string()) return {s->data(), s->size()};
  }
  return {};
}

inline std::string describe_exception(const std::exception& e) {
  return fmt::format(
      "{}: {}", utils::demangle_symbol(typeid(e).name()), e.what());
}

}  // namespace wsplex
