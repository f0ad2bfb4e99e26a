#pragma once

// pxjson accessors: typed extraction from values with path-tracked errors.
//
//   get_if<T>(v)        exact type (numbers interconvert), nullopt otherwise
//   as<T>(v)            also coerces numbers and bools to text and numeric text
//                       to numbers; nullopt otherwise
//   get<T>(v[, k])      like get_if, throws access_error
//   to<T>(v[, k])       like as, throws access_error
//
// The `_or_null` forms of get/to return an empty result for null (and for a
// missing key or index) but still throw on a type mismatch. Keyed and indexed
// forms put the key or `[index]` into the error path; the closure forms
// (get_object, get_array, map, flat_map) prefix it onto errors thrown inside
// the callback.

#include <pxjson/chars.hpp>
#include <pxjson/decimal.hpp>
#include <pxjson/error.hpp>
#include <pxjson/value.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pxjson {

namespace detail {

enum class conv_status { ok, type_mismatch, out_of_range };

template <class T>
struct accessor_traits;

template <>
struct accessor_traits<bool> {
  static constexpr json_type type = json_type::boolean;
  static constexpr const char* name = "bool";
};

template <>
struct accessor_traits<std::string> {
  static constexpr json_type type = json_type::string;
  static constexpr const char* name = "string";
};

template <>
struct accessor_traits<std::int64_t> {
  static constexpr json_type type = json_type::number;
  static constexpr const char* name = "int64";
};

template <>
struct accessor_traits<std::int32_t> {
  static constexpr json_type type = json_type::number;
  static constexpr const char* name = "int32";
};

template <>
struct accessor_traits<double> {
  static constexpr json_type type = json_type::number;
  static constexpr const char* name = "double";
};

template <>
struct accessor_traits<decimal> {
  static constexpr json_type type = json_type::number;
  static constexpr const char* name = "decimal";
};

template <>
struct accessor_traits<object> {
  static constexpr json_type type = json_type::object;
  static constexpr const char* name = "object";
};

template <>
struct accessor_traits<array> {
  static constexpr json_type type = json_type::array;
  static constexpr const char* name = "array";
};

// Types handed out by reference rather than by value.
template <class T>
struct is_ref_type : std::false_type {};
template <>
struct is_ref_type<std::string> : std::true_type {};
template <>
struct is_ref_type<object> : std::true_type {};
template <>
struct is_ref_type<array> : std::true_type {};

template <class T>
using get_result_t = std::conditional_t<is_ref_type<T>::value, const T&, T>;

template <class T>
using get_if_result_t = std::conditional_t<is_ref_type<T>::value, const T*, std::optional<T>>;

template <class T>
struct is_convertible_target
    : std::integral_constant<bool, std::is_same<T, std::string>::value || std::is_same<T, std::int64_t>::value ||
                                       std::is_same<T, std::int32_t>::value || std::is_same<T, double>::value ||
                                       std::is_same<T, decimal>::value> {};

// A string that is exactly one JSON number, as int64 when it fits and as an
// exact decimal otherwise.
inline std::optional<value> parse_numeric_text(std::string_view s) {
  auto dec = decimal::parse(s);
  if (!dec) return std::nullopt;
  if (s.find_first_of(".eE") == std::string_view::npos) {
    std::int64_t i = 0;
    if (parse_int64(s, i)) return value::integer(i);
  }
  return value(std::move(*dec));
}

// Text of a number (or numeric string) for out-of-range diagnostics.
inline std::string number_text(const value& v) {
  switch (v.type()) {
    case value::kind::int64: return format_int64(*v.get_ptr<std::int64_t>());
    case value::kind::float64: return format_double(*v.get_ptr<double>());
    case value::kind::decimal: return v.get_ptr<decimal>()->to_string();
    case value::kind::string: return *v.get_ptr<std::string>();
    default: return json_type_name(json_type_of(v));
  }
}

inline conv_status convert(const value& v, bool, bool& out) {
  const bool* b = v.get_ptr<bool>();
  if (!b) return conv_status::type_mismatch;
  out = *b;
  return conv_status::ok;
}

inline conv_status convert(const value& v, bool coerce, std::int64_t& out) {
  switch (v.type()) {
    case value::kind::int64:
      out = *v.get_ptr<std::int64_t>();
      return conv_status::ok;
    case value::kind::float64: {
      const double d = *v.get_ptr<double>();
      // 2^63 itself is not representable; -2^63 is.
      if (!(d < 9223372036854775808.0 && d >= -9223372036854775808.0)) return conv_status::out_of_range;
      out = static_cast<std::int64_t>(d);
      return conv_status::ok;
    }
    case value::kind::decimal: {
      const auto i = v.get_ptr<decimal>()->to_int64();
      if (!i) return conv_status::out_of_range;
      out = *i;
      return conv_status::ok;
    }
    case value::kind::string: {
      if (!coerce) return conv_status::type_mismatch;
      const auto n = parse_numeric_text(*v.get_ptr<std::string>());
      if (!n) return conv_status::type_mismatch;
      return convert(*n, false, out);
    }
    default:
      return conv_status::type_mismatch;
  }
}

inline conv_status convert(const value& v, bool coerce, std::int32_t& out) {
  std::int64_t wide = 0;
  const conv_status s = convert(v, coerce, wide);
  if (s != conv_status::ok) return s;
  if (wide < std::numeric_limits<std::int32_t>::min() || wide > std::numeric_limits<std::int32_t>::max()) {
    return conv_status::out_of_range;
  }
  out = static_cast<std::int32_t>(wide);
  return conv_status::ok;
}

inline conv_status convert(const value& v, bool coerce, double& out) {
  switch (v.type()) {
    case value::kind::int64:
      out = static_cast<double>(*v.get_ptr<std::int64_t>());
      return conv_status::ok;
    case value::kind::float64:
      out = *v.get_ptr<double>();
      return conv_status::ok;
    case value::kind::decimal: {
      const double d = v.get_ptr<decimal>()->to_double();
      if (!std::isfinite(d)) return conv_status::out_of_range;
      out = d;
      return conv_status::ok;
    }
    case value::kind::string: {
      if (!coerce) return conv_status::type_mismatch;
      const auto n = parse_numeric_text(*v.get_ptr<std::string>());
      if (!n) return conv_status::type_mismatch;
      return convert(*n, false, out);
    }
    default:
      return conv_status::type_mismatch;
  }
}

inline conv_status convert(const value& v, bool coerce, decimal& out) {
  switch (v.type()) {
    case value::kind::int64:
      out = decimal::from_int64(*v.get_ptr<std::int64_t>());
      return conv_status::ok;
    case value::kind::float64: {
      auto d = decimal::from_double(*v.get_ptr<double>());
      if (!d) return conv_status::out_of_range;
      out = std::move(*d);
      return conv_status::ok;
    }
    case value::kind::decimal:
      out = *v.get_ptr<decimal>();
      return conv_status::ok;
    case value::kind::string: {
      if (!coerce) return conv_status::type_mismatch;
      auto d = decimal::parse(*v.get_ptr<std::string>());
      if (!d) return conv_status::type_mismatch;
      out = std::move(*d);
      return conv_status::ok;
    }
    default:
      return conv_status::type_mismatch;
  }
}

inline conv_status convert(const value& v, bool coerce, std::string& out) {
  if (const std::string* s = v.get_ptr<std::string>()) {
    out = *s;
    return conv_status::ok;
  }
  if (!coerce) return conv_status::type_mismatch;
  switch (v.type()) {
    case value::kind::null: out = "null"; return conv_status::ok;
    case value::kind::boolean: out = *v.get_ptr<bool>() ? "true" : "false"; return conv_status::ok;
    case value::kind::int64: out = format_int64(*v.get_ptr<std::int64_t>()); return conv_status::ok;
    case value::kind::float64: out = format_double(*v.get_ptr<double>()); return conv_status::ok;
    case value::kind::decimal: out = v.get_ptr<decimal>()->to_string(); return conv_status::ok;
    default: return conv_status::type_mismatch;
  }
}

template <class T>
access_error make_access_error(conv_status s, const value& v, bool nullable) {
  if (s == conv_status::out_of_range) {
    return access_error::out_of_range(std::nullopt, number_text(v), accessor_traits<T>::name);
  }
  return access_error::missing_or_invalid_type(std::nullopt, expected_type{accessor_traits<T>::type, nullable},
                                               json_type_of(v));
}

template <class T>
T convert_or_throw(const value& v, bool coerce, bool nullable) {
  T out{};
  const conv_status s = convert(v, coerce, out);
  if (s != conv_status::ok) throw make_access_error<T>(s, v, nullable);
  return out;
}

inline const value* lookup(const object& o, std::string_view key) noexcept { return o.find(key); }

inline const value* lookup(const array& a, std::size_t index) noexcept {
  return index < a.size() ? &a[index] : nullptr;
}

inline std::string path_segment(std::string_view key) { return std::string(key); }

inline std::string path_segment(std::size_t index) {
  std::string out = "[";
  out += std::to_string(index);
  out.push_back(']');
  return out;
}

// Runs `fn`, nesting the path of any access_error it throws under `at`.
template <class Key, class Fn>
decltype(auto) scoped(Key at, Fn&& fn) {
  try {
    return fn();
  } catch (const access_error& e) {
    throw e.with_prefix(path_segment(at));
  }
}

// Looks up `at` in `c` and applies `fn` to the element; a missing element is
// an error that names `expected`.
template <class Container, class Key, class Fn>
decltype(auto) required_at(const Container& c, Key at, json_type expected, Fn&& fn) {
  const value* v = lookup(c, at);
  if (!v) {
    throw access_error::missing_or_invalid_type(path_segment(at), expected_type{expected, false}, std::nullopt);
  }
  return scoped(at, [&]() -> decltype(auto) { return fn(*v); });
}

// Like `required_at`, but a missing element yields an empty result.
template <class Container, class Key, class Fn>
auto optional_at(const Container& c, Key at, Fn&& fn) -> decltype(fn(std::declval<const value&>())) {
  using result = decltype(fn(std::declval<const value&>()));
  const value* v = lookup(c, at);
  if (!v) return result{};
  return scoped(at, [&]() -> result { return fn(*v); });
}

} // namespace detail

// ---- non-converting optional ----

template <class T>
detail::get_if_result_t<T> get_if(const value& v) {
  if constexpr (detail::is_ref_type<T>::value) {
    return v.get_ptr<T>();
  } else {
    T out{};
    if (detail::convert(v, false, out) != detail::conv_status::ok) return std::nullopt;
    return out;
  }
}

// ---- converting optional ----

template <class T>
std::optional<T> as(const value& v) {
  static_assert(detail::is_convertible_target<T>::value, "pxjson::as<T>: unsupported target type");
  if (v.is_null()) return std::nullopt;
  T out{};
  if (detail::convert(v, true, out) != detail::conv_status::ok) return std::nullopt;
  return out;
}

// ---- non-converting throwing ----

template <class T>
detail::get_result_t<T> get(const value& v) {
  if constexpr (detail::is_ref_type<T>::value) {
    if (const T* p = v.get_ptr<T>()) return *p;
    throw detail::make_access_error<T>(detail::conv_status::type_mismatch, v, false);
  } else {
    return detail::convert_or_throw<T>(v, false, false);
  }
}

template <class T>
detail::get_if_result_t<T> get_or_null(const value& v) {
  if (v.is_null()) return {};
  if constexpr (detail::is_ref_type<T>::value) {
    if (const T* p = v.get_ptr<T>()) return p;
    throw detail::make_access_error<T>(detail::conv_status::type_mismatch, v, true);
  } else {
    return detail::convert_or_throw<T>(v, false, true);
  }
}

template <class T>
detail::get_result_t<T> get(const object& o, std::string_view key) {
  return detail::required_at(o, key, detail::accessor_traits<T>::type,
                          [](const value& v) -> detail::get_result_t<T> { return get<T>(v); });
}

template <class T>
detail::get_result_t<T> get(const array& a, std::size_t index) {
  return detail::required_at(a, index, detail::accessor_traits<T>::type,
                          [](const value& v) -> detail::get_result_t<T> { return get<T>(v); });
}

template <class T>
detail::get_result_t<T> get(const value& v, std::string_view key) {
  return get<T>(get<object>(v), key);
}

template <class T>
detail::get_result_t<T> get(const value& v, std::size_t index) {
  return get<T>(get<array>(v), index);
}

template <class T>
detail::get_if_result_t<T> get_or_null(const object& o, std::string_view key) {
  return detail::optional_at(o, key, [](const value& v) { return get_or_null<T>(v); });
}

template <class T>
detail::get_if_result_t<T> get_or_null(const array& a, std::size_t index) {
  return detail::optional_at(a, index, [](const value& v) { return get_or_null<T>(v); });
}

template <class T>
detail::get_if_result_t<T> get_or_null(const value& v, std::string_view key) {
  return get_or_null<T>(get<object>(v), key);
}

template <class T>
detail::get_if_result_t<T> get_or_null(const value& v, std::size_t index) {
  return get_or_null<T>(get<array>(v), index);
}

// ---- converting throwing ----

template <class T>
T to(const value& v) {
  static_assert(detail::is_convertible_target<T>::value, "pxjson::to<T>: unsupported target type");
  return detail::convert_or_throw<T>(v, true, false);
}

template <class T>
std::optional<T> to_or_null(const value& v) {
  static_assert(detail::is_convertible_target<T>::value, "pxjson::to_or_null<T>: unsupported target type");
  if (v.is_null()) return std::nullopt;
  return detail::convert_or_throw<T>(v, true, true);
}

template <class T>
T to(const object& o, std::string_view key) {
  return detail::required_at(o, key, detail::accessor_traits<T>::type, [](const value& v) { return to<T>(v); });
}

template <class T>
T to(const array& a, std::size_t index) {
  return detail::required_at(a, index, detail::accessor_traits<T>::type, [](const value& v) { return to<T>(v); });
}

template <class T>
T to(const value& v, std::string_view key) {
  return to<T>(get<object>(v), key);
}

template <class T>
T to(const value& v, std::size_t index) {
  return to<T>(get<array>(v), index);
}

template <class T>
std::optional<T> to_or_null(const object& o, std::string_view key) {
  return detail::optional_at(o, key, [](const value& v) { return to_or_null<T>(v); });
}

template <class T>
std::optional<T> to_or_null(const array& a, std::size_t index) {
  return detail::optional_at(a, index, [](const value& v) { return to_or_null<T>(v); });
}

template <class T>
std::optional<T> to_or_null(const value& v, std::string_view key) {
  return to_or_null<T>(get<object>(v), key);
}

template <class T>
std::optional<T> to_or_null(const value& v, std::size_t index) {
  return to_or_null<T>(get<array>(v), index);
}

// ---- closure forms ----

template <class Fn>
decltype(auto) get_object(const object& o, std::string_view key, Fn&& fn) {
  return detail::required_at(o, key, json_type::object,
                          [&](const value& v) -> decltype(auto) { return fn(get<object>(v)); });
}

template <class Fn>
decltype(auto) get_object(const array& a, std::size_t index, Fn&& fn) {
  return detail::required_at(a, index, json_type::object,
                          [&](const value& v) -> decltype(auto) { return fn(get<object>(v)); });
}

template <class Fn>
decltype(auto) get_object(const value& v, std::string_view key, Fn&& fn) {
  return get_object(get<object>(v), key, std::forward<Fn>(fn));
}

template <class Fn>
decltype(auto) get_object(const value& v, std::size_t index, Fn&& fn) {
  return get_object(get<array>(v), index, std::forward<Fn>(fn));
}

template <class Fn>
decltype(auto) get_array(const object& o, std::string_view key, Fn&& fn) {
  return detail::required_at(o, key, json_type::array,
                          [&](const value& v) -> decltype(auto) { return fn(get<array>(v)); });
}

template <class Fn>
decltype(auto) get_array(const array& a, std::size_t index, Fn&& fn) {
  return detail::required_at(a, index, json_type::array,
                          [&](const value& v) -> decltype(auto) { return fn(get<array>(v)); });
}

template <class Fn>
decltype(auto) get_array(const value& v, std::string_view key, Fn&& fn) {
  return get_array(get<object>(v), key, std::forward<Fn>(fn));
}

template <class Fn>
decltype(auto) get_array(const value& v, std::size_t index, Fn&& fn) {
  return get_array(get<array>(v), index, std::forward<Fn>(fn));
}

// The _or_null closure forms skip `fn` for a missing or null element and
// return nullopt.
template <class Fn>
auto get_object_or_null(const object& o, std::string_view key, Fn&& fn)
    -> std::optional<std::decay_t<std::invoke_result_t<Fn&, const object&>>> {
  using result = std::optional<std::decay_t<std::invoke_result_t<Fn&, const object&>>>;
  return detail::optional_at(o, key, [&](const value& v) -> result {
    const object* p = get_or_null<object>(v);
    if (!p) return std::nullopt;
    return result(fn(*p));
  });
}

template <class Fn>
auto get_object_or_null(const array& a, std::size_t index, Fn&& fn)
    -> std::optional<std::decay_t<std::invoke_result_t<Fn&, const object&>>> {
  using result = std::optional<std::decay_t<std::invoke_result_t<Fn&, const object&>>>;
  return detail::optional_at(a, index, [&](const value& v) -> result {
    const object* p = get_or_null<object>(v);
    if (!p) return std::nullopt;
    return result(fn(*p));
  });
}

template <class Fn>
auto get_object_or_null(const value& v, std::string_view key, Fn&& fn) {
  return get_object_or_null(get<object>(v), key, std::forward<Fn>(fn));
}

template <class Fn>
auto get_object_or_null(const value& v, std::size_t index, Fn&& fn) {
  return get_object_or_null(get<array>(v), index, std::forward<Fn>(fn));
}

template <class Fn>
auto get_array_or_null(const object& o, std::string_view key, Fn&& fn)
    -> std::optional<std::decay_t<std::invoke_result_t<Fn&, const array&>>> {
  using result = std::optional<std::decay_t<std::invoke_result_t<Fn&, const array&>>>;
  return detail::optional_at(o, key, [&](const value& v) -> result {
    const array* p = get_or_null<array>(v);
    if (!p) return std::nullopt;
    return result(fn(*p));
  });
}

template <class Fn>
auto get_array_or_null(const array& a, std::size_t index, Fn&& fn)
    -> std::optional<std::decay_t<std::invoke_result_t<Fn&, const array&>>> {
  using result = std::optional<std::decay_t<std::invoke_result_t<Fn&, const array&>>>;
  return detail::optional_at(a, index, [&](const value& v) -> result {
    const array* p = get_or_null<array>(v);
    if (!p) return std::nullopt;
    return result(fn(*p));
  });
}

template <class Fn>
auto get_array_or_null(const value& v, std::string_view key, Fn&& fn) {
  return get_array_or_null(get<object>(v), key, std::forward<Fn>(fn));
}

template <class Fn>
auto get_array_or_null(const value& v, std::size_t index, Fn&& fn) {
  return get_array_or_null(get<array>(v), index, std::forward<Fn>(fn));
}

// Applies `fn` to every element; errors are prefixed with the element index.
template <class Fn>
auto map(const array& a, Fn&& fn) -> std::vector<std::decay_t<std::invoke_result_t<Fn&, const value&>>> {
  std::vector<std::decay_t<std::invoke_result_t<Fn&, const value&>>> out;
  out.reserve(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    out.push_back(detail::scoped(i, [&]() -> decltype(auto) { return fn(a[i]); }));
  }
  return out;
}

template <class Fn>
auto map(const value& v, Fn&& fn) {
  return map(get<array>(v), std::forward<Fn>(fn));
}

// `fn` returns an optional; empty results are dropped.
template <class Fn>
auto flat_map(const array& a, Fn&& fn)
    -> std::vector<typename std::decay_t<std::invoke_result_t<Fn&, const value&>>::value_type> {
  std::vector<typename std::decay_t<std::invoke_result_t<Fn&, const value&>>::value_type> out;
  for (std::size_t i = 0; i < a.size(); ++i) {
    auto r = detail::scoped(i, [&]() -> decltype(auto) { return fn(a[i]); });
    if (r) out.push_back(std::move(*r));
  }
  return out;
}

template <class Fn>
auto flat_map(const value& v, Fn&& fn) {
  return flat_map(get<array>(v), std::forward<Fn>(fn));
}

} // namespace pxjson
