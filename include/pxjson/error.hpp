#pragma once

// pxjson error types: parser error codes and records, and the path-tracked
// errors thrown by the accessor layer.

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace pxjson {

enum class error_code {
  ok = 0,
  invalid_syntax,
  invalid_number,
  invalid_escape,
  invalid_unicode_scalar,
  lone_leading_surrogate_in_unicode_escape,
  control_character_in_string,
  expected_colon,
  missing_key,
  non_string_key,
  missing_value,
  trailing_comma,
  trailing_characters,
  unexpected_eof,
  exceeded_depth_limit,
  invalid_encoding
};

inline const char* error_code_name(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::invalid_syntax: return "invalid_syntax";
    case error_code::invalid_number: return "invalid_number";
    case error_code::invalid_escape: return "invalid_escape";
    case error_code::invalid_unicode_scalar: return "invalid_unicode_scalar";
    case error_code::lone_leading_surrogate_in_unicode_escape: return "lone_leading_surrogate_in_unicode_escape";
    case error_code::control_character_in_string: return "control_character_in_string";
    case error_code::expected_colon: return "expected_colon";
    case error_code::missing_key: return "missing_key";
    case error_code::non_string_key: return "non_string_key";
    case error_code::missing_value: return "missing_value";
    case error_code::trailing_comma: return "trailing_comma";
    case error_code::trailing_characters: return "trailing_characters";
    case error_code::unexpected_eof: return "unexpected_eof";
    case error_code::exceeded_depth_limit: return "exceeded_depth_limit";
    case error_code::invalid_encoding: return "invalid_encoding";
  }
  return "unknown";
}

// Position of a parse error. Line and column are zero-based and counted in
// Unicode scalars; `offset` is the number of scalars consumed so far.
struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{0};
  std::size_t column{0};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline bool operator==(const error& a, const error& b) noexcept {
  return a.code == b.code && a.line == b.line && a.column == b.column;
}

inline bool operator!=(const error& a, const error& b) noexcept { return !(a == b); }

inline std::string describe(const error& e) {
  std::string out = error_code_name(e.code);
  out += " at line ";
  out += std::to_string(e.line);
  out += ", column ";
  out += std::to_string(e.column);
  return out;
}

class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e)
      : std::runtime_error("pxjson: " + describe(e)), err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

// Coarse JSON types used in accessor diagnostics. All numeric
// representations report as `number`.
enum class json_type { null, boolean, string, number, object, array };

inline const char* json_type_name(json_type t) noexcept {
  switch (t) {
    case json_type::null: return "null";
    case json_type::boolean: return "bool";
    case json_type::string: return "string";
    case json_type::number: return "number";
    case json_type::object: return "object";
    case json_type::array: return "array";
  }
  return "unknown";
}

struct expected_type {
  json_type type{json_type::null};
  bool nullable{false};
};

class access_error : public std::runtime_error {
public:
  enum class kind { missing_or_invalid_type, out_of_range };

  // `actual` is empty when the value is missing altogether.
  static access_error missing_or_invalid_type(std::optional<std::string> path, expected_type expected,
                                              std::optional<json_type> actual) {
    return access_error(kind::missing_or_invalid_type, std::move(path), expected, actual, {}, {});
  }

  static access_error out_of_range(std::optional<std::string> path, std::string value_text, std::string target) {
    return access_error(kind::out_of_range, std::move(path), expected_type{json_type::number, false},
                        json_type::number, std::move(value_text), std::move(target));
  }

  kind error_kind() const noexcept { return kind_; }
  const std::optional<std::string>& path() const noexcept { return path_; }
  expected_type expected() const noexcept { return expected_; }
  const std::optional<json_type>& actual() const noexcept { return actual_; }
  const std::string& value_text() const noexcept { return value_text_; }
  const std::string& target() const noexcept { return target_; }

  // Returns a copy whose path is nested under `prefix` (a key, or `[i]`).
  access_error with_prefix(std::string_view prefix) const {
    std::string p(prefix);
    if (path_) {
      if (!path_->empty() && (*path_)[0] == '[') {
        p += *path_;
      } else {
        p.push_back('.');
        p += *path_;
      }
    }
    return access_error(kind_, std::move(p), expected_, actual_, value_text_, target_);
  }

private:
  access_error(kind k, std::optional<std::string> path, expected_type expected, std::optional<json_type> actual,
               std::string value_text, std::string target)
      : std::runtime_error(format(k, path, expected, actual, value_text, target)),
        kind_(k),
        path_(std::move(path)),
        expected_(expected),
        actual_(actual),
        value_text_(std::move(value_text)),
        target_(std::move(target)) {}

  static std::string format(kind k, const std::optional<std::string>& path, expected_type expected,
                            const std::optional<json_type>& actual, const std::string& value_text,
                            const std::string& target) {
    std::string out;
    if (path) {
      out += *path;
      out += ": ";
    }
    if (k == kind::out_of_range) {
      out += "value ";
      out += value_text;
      out += " is out of range for ";
      out += target;
      return out;
    }
    out += "expected ";
    out += json_type_name(expected.type);
    if (expected.nullable) out += " or null";
    out += ", found ";
    out += actual ? json_type_name(*actual) : "missing value";
    return out;
  }

  kind kind_;
  std::optional<std::string> path_;
  expected_type expected_;
  std::optional<json_type> actual_;
  std::string value_text_;
  std::string target_;
};

} // namespace pxjson
