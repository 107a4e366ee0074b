#pragma once

#include <boost/json.hpp>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "utils.hpp"

namespace cbridge {

namespace json = boost::json;

/// Pretty printing (two-space indent, like the persisted state file)

inline void pretty_print(
    std::string& out, const json::value& jv, std::string& indent) {
  switch (jv.kind()) {
    case json::kind::object: {
      const auto& obj = jv.get_object();
      if (obj.empty()) {
        out += "{}";
        break;
      }
      out += "{\n";
      indent.append(2, ' ');
      bool first = true;
      for (const auto& kv : obj) {
        if (!first) out += ",\n";
        first = false;
        out += indent;
        out += json::serialize(json::string{kv.key()});
        out += ": ";
        pretty_print(out, kv.value(), indent);
      }
      indent.resize(indent.size() - 2);
      out += "\n";
      out += indent;
      out += "}";
      break;
    }
    case json::kind::array: {
      const auto& arr = jv.get_array();
      if (arr.empty()) {
        out += "[]";
        break;
      }
      out += "[\n";
      indent.append(2, ' ');
      bool first = true;
      for (const auto& v : arr) {
        if (!first) out += ",\n";
        first = false;
        out += indent;
        pretty_print(out, v, indent);
      }
      indent.resize(indent.size() - 2);
      out += "\n";
      out += indent;
      out += "]";
      break;
    }
    default:
      out += json::serialize(jv);
  }
}

inline std::string pretty_print(const json::value& jv) {
  std::string out;
  std::string indent;
  pretty_print(out, jv, indent);
  return out;
}

/// Argument accessors.  A JSON null counts as absent; a value of the wrong
/// kind throws std::invalid_argument naming the key.

inline std::optional<std::string> get_string(
    const json::object& obj, std::string_view key) {
  const auto* v = obj.if_contains(key);
  if (!v || v->is_null()) return std::nullopt;
  if (const auto* s = v->if_string()) return std::string{*s};
  utils::throwf<std::invalid_argument>("'{}' must be a string", key);
}

inline std::string require_string(
    const json::object& obj, std::string_view key) {
  auto s = get_string(obj, key);
  if (!s) utils::throwf<std::invalid_argument>("missing '{}'", key);
  return *s;
}

inline std::optional<std::int64_t> get_int(
    const json::object& obj, std::string_view key) {
  const auto* v = obj.if_contains(key);
  if (!v || v->is_null()) return std::nullopt;
  if (const auto* i = v->if_int64()) return *i;
  if (const auto* u = v->if_uint64();
      u && *u <= static_cast<std::uint64_t>(INT64_MAX))
    return static_cast<std::int64_t>(*u);
  // [-2^63, 2^63) holds every double that converts; NaN fails both tests.
  if (const auto* d = v->if_double(); d && *d >= -0x1p63 && *d < 0x1p63 &&
                                      std::trunc(*d) == *d)
    return static_cast<std::int64_t>(*d);
  utils::throwf<std::invalid_argument>("'{}' must be an integer", key);
}

inline std::optional<bool> get_bool(
    const json::object& obj, std::string_view key) {
  const auto* v = obj.if_contains(key);
  if (!v || v->is_null()) return std::nullopt;
  if (const auto* b = v->if_bool()) return *b;
  utils::throwf<std::invalid_argument>("'{}' must be a boolean", key);
}

inline std::optional<json::object> get_object(
    const json::object& obj, std::string_view key) {
  const auto* v = obj.if_contains(key);
  if (!v || v->is_null()) return std::nullopt;
  if (const auto* o = v->if_object()) return *o;
  utils::throwf<std::invalid_argument>("'{}' must be an object", key);
}

inline std::optional<std::vector<std::string>> get_string_list(
    const json::object& obj, std::string_view key) {
  const auto* v = obj.if_contains(key);
  if (!v || v->is_null()) return std::nullopt;
  const auto* arr = v->if_array();
  if (!arr)
    utils::throwf<std::invalid_argument>("'{}' must be an array", key);
  std::vector<std::string> res;
  for (const auto& item : *arr) {
    const auto* s = item.if_string();
    if (!s)
      utils::throwf<std::invalid_argument>(
          "'{}' must contain only strings", key);
    res.emplace_back(*s);
  }
  return res;
}

inline json::value optional_to_json(const std::optional<std::string>& s) {
  if (s) return json::string{*s};
  return nullptr;
}

inline json::array strings_to_json(const std::vector<std::string>& v) {
  return json::array(v.begin(), v.end());
}

}  // namespace cbridge
