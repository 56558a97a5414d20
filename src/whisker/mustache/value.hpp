#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "whisker/callback.hpp"

namespace whisker::mustache {

enum class value_type : uint8_t {
  undefined = 0,
  none = 1,
  boolean = 2,
  integer = 3,
  floating = 4,
  string = 5,
  array = 6,
  object = 7,
  lambda = 8
};

struct value;
struct object_entry;

struct string_value {
  std::string_view view = {};
};

struct array_value {
  const value * items = nullptr;
  size_t count = 0;
};

struct object_value {
  const object_entry * entries = nullptr;
  size_t count = 0;
};

enum class lambda_kind : uint8_t {
  variable = 0,
  section = 1,
  section_render = 2
};

// Renders template text against the scope of the section being expanded.
using render_fn = ::whisker::callback<bool(std::string_view text, std::string & out)>;

using variable_lambda_fn = ::whisker::callback<bool(std::string & out)>;
using section_lambda_fn = ::whisker::callback<bool(std::string_view raw, std::string & out)>;
using section_render_lambda_fn =
  ::whisker::callback<bool(std::string_view raw, const render_fn & render, std::string & out)>;

/**
 * Host callable. The arity is fixed when the host builds the value:
 * - `variable`: no argument, its text is re-rendered as a template.
 * - `section`: receives the raw section text, its text is re-rendered.
 * - `section_render`: receives the raw section text and a render callback,
 *   its text is written verbatim.
 * Returning false aborts the render with `WHISKER_ERR_LAMBDA_FAILED`.
 */
struct lambda_value {
  lambda_kind kind = lambda_kind::variable;
  variable_lambda_fn variable = {};
  section_lambda_fn section = {};
  section_render_lambda_fn section_render = {};
};

/**
 * Read-only view over host data. Strings, arrays and objects point at
 * storage owned by the caller, which must outlive every render using it.
 */
struct value {
  value_type type = value_type::undefined;
  bool bool_v = false;
  int64_t int_v = 0;
  double float_v = 0.0;
  string_value string_v = {};
  array_value array_v = {};
  object_value object_v = {};
  lambda_value lambda_v = {};
};

struct object_entry {
  std::string_view key = {};
  value val = {};
};

inline value make_undefined() noexcept {
  return value{};
}

inline value make_none() noexcept {
  value v;
  v.type = value_type::none;
  return v;
}

inline value make_bool(const bool b) noexcept {
  value v;
  v.type = value_type::boolean;
  v.bool_v = b;
  return v;
}

inline value make_int(const int64_t i) noexcept {
  value v;
  v.type = value_type::integer;
  v.int_v = i;
  v.float_v = static_cast<double>(i);
  return v;
}

inline value make_float(const double d) noexcept {
  value v;
  v.type = value_type::floating;
  v.float_v = d;
  return v;
}

inline value make_string(std::string_view view) noexcept {
  value v;
  v.type = value_type::string;
  v.string_v.view = view;
  return v;
}

inline value make_array(const value * items, const size_t count) noexcept {
  value v;
  v.type = value_type::array;
  v.array_v.items = items;
  v.array_v.count = count;
  return v;
}

inline value make_object(const object_entry * entries, const size_t count) noexcept {
  value v;
  v.type = value_type::object;
  v.object_v.entries = entries;
  v.object_v.count = count;
  return v;
}

inline value make_lambda(const variable_lambda_fn fn) noexcept {
  value v;
  v.type = value_type::lambda;
  v.lambda_v.kind = lambda_kind::variable;
  v.lambda_v.variable = fn;
  return v;
}

inline value make_section_lambda(const section_lambda_fn fn) noexcept {
  value v;
  v.type = value_type::lambda;
  v.lambda_v.kind = lambda_kind::section;
  v.lambda_v.section = fn;
  return v;
}

inline value make_render_lambda(const section_render_lambda_fn fn) noexcept {
  value v;
  v.type = value_type::lambda;
  v.lambda_v.kind = lambda_kind::section_render;
  v.lambda_v.section_render = fn;
  return v;
}

// Absent, none, false, empty string and empty array. An empty object is not.
inline bool value_is_falsey(const value * v) noexcept {
  if (v == nullptr) {
    return true;
  }
  switch (v->type) {
    case value_type::undefined:
    case value_type::none:
      return true;
    case value_type::boolean:
      return !v->bool_v;
    case value_type::string:
      return v->string_v.view.empty();
    case value_type::array:
      return v->array_v.count == 0;
    case value_type::integer:
    case value_type::floating:
    case value_type::object:
    case value_type::lambda:
      return false;
  }
  return false;
}

}  // namespace whisker::mustache
