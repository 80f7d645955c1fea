#pragma once

#include "flowcore/core/error.hpp"

#include <glaze/json.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <compare>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace flowcore {

using JsonValue = glz::generic_json<glz::num_mode::i64>;
using JsonArray = JsonValue::array_t;
using JsonObject = JsonValue::object_t;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto make_object() -> JsonValue {
  return JsonValue{JsonObject{}};
}

[[nodiscard]] inline auto make_array() -> JsonValue {
  return JsonValue{JsonArray{}};
}

namespace json {

// Numeric view of a value regardless of whether it was stored as an integer
// or a double.
[[nodiscard]] inline auto as_double(const JsonValue &value)
    -> std::optional<double> {
  if (const auto *i = value.get_if<std::int64_t>()) {
    return static_cast<double>(*i);
  }
  if (const auto *d = value.get_if<double>()) {
    return *d;
  }
  return std::nullopt;
}

[[nodiscard]] inline auto as_int(const JsonValue &value)
    -> std::optional<std::int64_t> {
  if (const auto *i = value.get_if<std::int64_t>()) {
    return *i;
  }
  if (const auto *d = value.get_if<double>()) {
    if (std::isfinite(*d) && std::trunc(*d) == *d) {
      return static_cast<std::int64_t>(*d);
    }
  }
  return std::nullopt;
}

[[nodiscard]] inline auto is_number(const JsonValue &value) -> bool {
  return as_double(value).has_value();
}

[[nodiscard]] inline auto as_string(const JsonValue &value)
    -> std::optional<std::string_view> {
  if (const auto *s = value.get_if<std::string>()) {
    return std::string_view{*s};
  }
  return std::nullopt;
}

[[nodiscard]] inline auto as_bool(const JsonValue &value)
    -> std::optional<bool> {
  if (const auto *b = value.get_if<bool>()) {
    return *b;
  }
  return std::nullopt;
}

[[nodiscard]] inline auto as_array(const JsonValue &value)
    -> const JsonArray * {
  return value.get_if<JsonArray>();
}

[[nodiscard]] inline auto as_object(const JsonValue &value)
    -> const JsonObject * {
  return value.get_if<JsonObject>();
}

[[nodiscard]] inline auto is_null(const JsonValue &value) -> bool {
  return value.is_null();
}

// Python-style truthiness: null, false, 0, "" and empty containers are
// falsy.
[[nodiscard]] inline auto truthy(const JsonValue &value) -> bool {
  if (value.is_null()) {
    return false;
  }
  if (auto b = as_bool(value)) {
    return *b;
  }
  if (auto d = as_double(value)) {
    return *d != 0.0;
  }
  if (auto s = as_string(value)) {
    return !s->empty();
  }
  if (const auto *arr = as_array(value)) {
    return !arr->empty();
  }
  if (const auto *obj = as_object(value)) {
    return !obj->empty();
  }
  return false;
}

// Structural equality; integers and doubles compare numerically.
[[nodiscard]] inline auto equal(const JsonValue &lhs, const JsonValue &rhs)
    -> bool {
  const auto *li = lhs.get_if<std::int64_t>();
  const auto *ri = rhs.get_if<std::int64_t>();
  if (li != nullptr && ri != nullptr) {
    return *li == *ri;
  }
  if (auto a = as_double(lhs)) {
    auto b = as_double(rhs);
    return b && *a == *b;
  }
  if (auto a = as_string(lhs)) {
    auto b = as_string(rhs);
    return b && *a == *b;
  }
  if (auto a = as_bool(lhs)) {
    auto b = as_bool(rhs);
    return b && *a == *b;
  }
  if (const auto *arr = as_array(lhs)) {
    const auto *other = as_array(rhs);
    if (other == nullptr || arr->size() != other->size()) {
      return false;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
      if (!equal((*arr)[i], (*other)[i])) {
        return false;
      }
    }
    return true;
  }
  if (const auto *obj = as_object(lhs)) {
    const auto *other = as_object(rhs);
    if (other == nullptr || obj->size() != other->size()) {
      return false;
    }
    for (const auto &[key, v] : *obj) {
      auto it = other->find(key);
      if (it == other->end() || !equal(v, it->second)) {
        return false;
      }
    }
    return true;
  }
  return lhs.is_null() && rhs.is_null();
}

// Ordering for number/number, string/string and bool/bool pairs; nullopt
// when the two values are not mutually ordered.
[[nodiscard]] inline auto compare(const JsonValue &lhs, const JsonValue &rhs)
    -> std::optional<std::partial_ordering> {
  const auto *li = lhs.get_if<std::int64_t>();
  const auto *ri = rhs.get_if<std::int64_t>();
  if (li != nullptr && ri != nullptr) {
    return *li <=> *ri;
  }
  if (auto a = as_double(lhs)) {
    if (auto b = as_double(rhs)) {
      return *a <=> *b;
    }
    return std::nullopt;
  }
  if (auto a = as_string(lhs)) {
    if (auto b = as_string(rhs)) {
      return a->compare(*b) <=> 0;
    }
    return std::nullopt;
  }
  if (auto a = as_bool(lhs)) {
    if (auto b = as_bool(rhs)) {
      return *a <=> *b;
    }
  }
  return std::nullopt;
}

// Resolve a dot-delimited path ("data.state", "items.0.name"). Numeric
// segments index into arrays.
[[nodiscard]] inline auto find_path(const JsonValue &root,
                                    std::string_view path)
    -> const JsonValue * {
  const JsonValue *cur = &root;
  for (auto part : path | std::views::split('.')) {
    std::string_view key(part.begin(), part.end());
    if (const auto *obj = as_object(*cur)) {
      auto it = obj->find(key);
      if (it == obj->end()) {
        return nullptr;
      }
      cur = &it->second;
    } else if (const auto *arr = as_array(*cur)) {
      std::size_t index{};
      auto [ptr, ec] =
          std::from_chars(key.data(), key.data() + key.size(), index);
      if (ec != std::errc{} || ptr != key.data() + key.size() ||
          index >= arr->size()) {
        return nullptr;
      }
      cur = &(*arr)[index];
    } else {
      return nullptr;
    }
  }
  return cur;
}

[[nodiscard]] inline auto all_finite(const JsonValue &value) -> bool {
  if (const auto *d = value.get_if<double>()) {
    return std::isfinite(*d);
  }
  if (const auto *arr = as_array(value)) {
    return std::ranges::all_of(
        *arr, [](const JsonValue &e) { return all_finite(e); });
  }
  if (const auto *obj = as_object(value)) {
    return std::ranges::all_of(
        *obj, [](const auto &kv) { return all_finite(kv.second); });
  }
  return true;
}

} // namespace json
} // namespace flowcore
