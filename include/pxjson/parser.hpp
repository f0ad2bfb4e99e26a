#pragma once

// pxjson parser: a pull-based state machine turning a scalar sequence into
// parse events. One forward pass, no backtracking, O(depth) extra memory.

#include <pxjson/chars.hpp>
#include <pxjson/decimal.hpp>
#include <pxjson/encoding.hpp>
#include <pxjson/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pxjson {

// Config: default maximum container nesting.
// Override by defining PXJSON_DEFAULT_DEPTH_LIMIT before including this header.
#ifndef PXJSON_DEFAULT_DEPTH_LIMIT
  #define PXJSON_DEFAULT_DEPTH_LIMIT 10000
#endif

struct parse_options {
  // Reject a comma directly before `]` or `}`.
  bool strict{true};
  // Decode non-integral and out-of-range numbers as exact decimals instead of doubles.
  bool use_decimals{false};
  std::size_t depth_limit{PXJSON_DEFAULT_DEPTH_LIMIT};
  // Accept any number of concatenated top-level values.
  bool streaming{false};
};

enum class event_type {
  object_start,
  object_end,
  array_start,
  array_end,
  string_value,
  int64_value,
  double_value,
  decimal_value,
  bool_value,
  null_value,
  error
};

inline const char* event_type_name(event_type t) noexcept {
  switch (t) {
    case event_type::object_start: return "object_start";
    case event_type::object_end: return "object_end";
    case event_type::array_start: return "array_start";
    case event_type::array_end: return "array_end";
    case event_type::string_value: return "string";
    case event_type::int64_value: return "int64";
    case event_type::double_value: return "double";
    case event_type::decimal_value: return "decimal";
    case event_type::bool_value: return "bool";
    case event_type::null_value: return "null";
    case event_type::error: return "error";
  }
  return "unknown";
}

// Only the member matching `type` is meaningful. Inside an object, each
// member is a string_value event for the key followed by the value's events.
struct event {
  event_type type{event_type::null_value};
  bool b{false};
  std::int64_t i{0};
  double d{0.0};
  decimal dec;
  std::string str;
  error err;
};

class parser {
public:
  parser(scalar_reader reader, parse_options opt = {}) : reader_(reader), opt_(opt) {}

  // `text` is UTF-8 and must outlive the parser.
  explicit parser(std::string_view text, parse_options opt = {})
      : parser(scalar_reader(text, encoding::utf8), opt) {}

  // Produces the next event. Returns false once the input is exhausted or
  // after an error event has been produced.
  bool next(event& ev) {
    char32_t c = 0;
    // Only the comma states loop, and they always move to a state that returns.
    while (true) {
      switch (state_) {
        case state::array_comma:
          if (!skip_ws(c)) return fail(ev, error_code::unexpected_eof);
          if (c == U',') {
            state_ = state::array_element;
            first_ = false;
            continue;
          }
          if (c == U']') {
            pop();
            ev.type = event_type::array_end;
            return true;
          }
          return fail(ev, error_code::invalid_syntax);

        case state::object_comma:
          if (!skip_ws(c)) return fail(ev, error_code::unexpected_eof);
          if (c == U',') {
            state_ = state::object_key;
            first_ = false;
            continue;
          }
          if (c == U'}') {
            pop();
            ev.type = event_type::object_end;
            return true;
          }
          return fail(ev, error_code::invalid_syntax);

        case state::initial:
          if (!skip_ws(c)) {
            if (opt_.streaming) {
              state_ = state::finished;
              return false;
            }
            return fail(ev, error_code::unexpected_eof);
          }
          return begin_value(c, ev, state::end);

        case state::array_element:
          if (!skip_ws(c)) return fail(ev, error_code::unexpected_eof);
          if (c == U']') {
            if (!first_ && opt_.strict) return fail(ev, error_code::trailing_comma);
            pop();
            ev.type = event_type::array_end;
            return true;
          }
          if (c == U',') return fail(ev, error_code::missing_value);
          return begin_value(c, ev, state::array_comma);

        case state::object_key:
          if (!skip_ws(c)) return fail(ev, error_code::unexpected_eof);
          if (c == U'}') {
            if (!first_ && opt_.strict) return fail(ev, error_code::trailing_comma);
            pop();
            ev.type = event_type::object_end;
            return true;
          }
          if (c == U',' || c == U':') return fail(ev, error_code::missing_key);
          if (c != U'"') return fail(ev, error_code::non_string_key);
          if (!lex_string(ev)) return true;
          ev.type = event_type::string_value;
          state_ = state::object_value;
          return true;

        case state::object_value:
          if (!skip_ws(c)) return fail(ev, error_code::unexpected_eof);
          if (c != U':') return fail(ev, error_code::expected_colon);
          if (!skip_ws(c)) return fail(ev, error_code::unexpected_eof);
          if (c == U',' || c == U'}') return fail(ev, error_code::missing_value);
          return begin_value(c, ev, state::object_comma);

        case state::end:
          if (!skip_ws(c)) {
            state_ = state::finished;
            return false;
          }
          if (opt_.streaming) return begin_value(c, ev, state::end);
          return fail(ev, error_code::trailing_characters);

        case state::finished:
          return false;
      }
    }
  }

  // Position of the last consumed scalar.
  std::size_t line() const noexcept { return line_; }
  std::size_t column() const noexcept { return column_; }
  std::size_t depth() const noexcept { return stack_.size(); }
  const parse_options& options() const noexcept { return opt_; }

private:
  enum class state { initial, array_element, array_comma, object_key, object_value, object_comma, end, finished };
  enum class container { array, object };

  bool bump(char32_t& c) {
    bool ok = false;
    if (has_peek_) {
      has_peek_ = false;
      ok = peek_ok_;
      c = peek_;
    } else {
      ok = reader_.next(c);
    }
    // Reading past the end still advances the column.
    if (ok && c == U'\n') {
      ++line_;
      column_ = 0;
    } else {
      ++column_;
    }
    if (ok) ++offset_;
    return ok;
  }

  bool peek(char32_t& c) {
    if (!has_peek_) {
      peek_ok_ = reader_.next(peek_);
      has_peek_ = true;
    }
    c = peek_;
    return peek_ok_;
  }

  bool skip_ws(char32_t& c) {
    while (bump(c)) {
      if (!detail::is_ws(c)) return true;
    }
    return false;
  }

  bool fail(event& ev, error_code code) { return fail_at(ev, code, line_, column_); }

  bool fail_at(event& ev, error_code code, std::size_t line, std::size_t column) {
    ev.type = event_type::error;
    ev.err.code = code;
    ev.err.offset = offset_;
    ev.err.line = line;
    ev.err.column = column;
    state_ = state::finished;
    return true;
  }

  void pop() {
    stack_.pop_back();
    if (stack_.empty()) {
      state_ = state::end;
    } else {
      state_ = (stack_.back() == container::array) ? state::array_comma : state::object_comma;
    }
  }

  // Emits the first event of the value starting with `c`. Scalars move the
  // machine to `after`; containers push onto the stack.
  bool begin_value(char32_t c, event& ev, state after) {
    switch (c) {
      case U'[':
      case U'{':
        if (stack_.size() >= opt_.depth_limit) return fail(ev, error_code::exceeded_depth_limit);
        if (c == U'[') {
          stack_.push_back(container::array);
          state_ = state::array_element;
          ev.type = event_type::array_start;
        } else {
          stack_.push_back(container::object);
          state_ = state::object_key;
          ev.type = event_type::object_start;
        }
        first_ = true;
        return true;
      case U'"':
        if (!lex_string(ev)) return true;
        ev.type = event_type::string_value;
        state_ = after;
        return true;
      case U't':
        if (!lex_literal(U"rue", ev)) return true;
        ev.type = event_type::bool_value;
        ev.b = true;
        state_ = after;
        return true;
      case U'f':
        if (!lex_literal(U"alse", ev)) return true;
        ev.type = event_type::bool_value;
        ev.b = false;
        state_ = after;
        return true;
      case U'n':
        if (!lex_literal(U"ull", ev)) return true;
        ev.type = event_type::null_value;
        state_ = after;
        return true;
      default:
        if (c == U'-' || detail::is_digit(c)) {
          if (!lex_number(c, ev)) return true;
          state_ = after;
          return true;
        }
        return fail(ev, error_code::invalid_syntax);
    }
  }

  // The literal's first scalar has been consumed; errors point at it.
  bool lex_literal(std::u32string_view rest, event& ev) {
    const std::size_t line = line_;
    const std::size_t column = column_;
    char32_t c = 0;
    for (char32_t expected : rest) {
      if (!bump(c) || c != expected) {
        fail_at(ev, error_code::invalid_syntax, line, column);
        return false;
      }
    }
    return true;
  }

  bool read_hex4(std::uint32_t& out, event& ev) {
    out = 0;
    char32_t c = 0;
    for (int k = 0; k < 4; ++k) {
      if (!bump(c)) {
        fail(ev, error_code::unexpected_eof);
        return false;
      }
      const int h = detail::hex_val(c);
      if (h < 0) {
        fail(ev, error_code::invalid_escape);
        return false;
      }
      out = (out << 4) | static_cast<std::uint32_t>(h);
    }
    return true;
  }

  // The opening quote has been consumed.
  bool lex_string(event& ev) {
    std::string& out = ev.str;
    out.clear();
    char32_t c = 0;
    while (bump(c)) {
      if (c == U'"') return true;
      if (c == U'\\') {
        if (!bump(c)) {
          fail(ev, error_code::unexpected_eof);
          return false;
        }
        switch (c) {
          case U'"': out.push_back('"'); break;
          case U'\\': out.push_back('\\'); break;
          case U'/': out.push_back('/'); break;
          case U'b': out.push_back('\b'); break;
          case U'f': out.push_back('\f'); break;
          case U'n': out.push_back('\n'); break;
          case U'r': out.push_back('\r'); break;
          case U't': out.push_back('\t'); break;
          case U'u': {
            std::uint32_t cu = 0;
            if (!read_hex4(cu, ev)) return false;
            if (detail::is_lead_surrogate(cu)) {
              if (!bump(c)) {
                fail(ev, error_code::unexpected_eof);
                return false;
              }
              if (c != U'\\') {
                fail(ev, error_code::lone_leading_surrogate_in_unicode_escape);
                return false;
              }
              if (!bump(c)) {
                fail(ev, error_code::unexpected_eof);
                return false;
              }
              if (c != U'u') {
                fail(ev, error_code::lone_leading_surrogate_in_unicode_escape);
                return false;
              }
              std::uint32_t trail = 0;
              if (!read_hex4(trail, ev)) return false;
              if (!detail::is_trail_surrogate(trail)) {
                fail(ev, error_code::lone_leading_surrogate_in_unicode_escape);
                return false;
              }
              cu = 0x10000u + ((cu - 0xD800u) << 10) + (trail - 0xDC00u);
            } else if (detail::is_trail_surrogate(cu)) {
              fail(ev, error_code::invalid_unicode_scalar);
              return false;
            }
            detail::append_utf8(out, cu);
            break;
          }
          default:
            fail(ev, error_code::invalid_escape);
            return false;
        }
        continue;
      }
      if (c < 0x20) {
        fail(ev, error_code::control_character_in_string);
        return false;
      }
      detail::append_utf8(out, static_cast<std::uint32_t>(c));
    }
    fail(ev, error_code::unexpected_eof);
    return false;
  }

  bool take_digits() {
    char32_t c = 0;
    bool any = false;
    while (peek(c) && detail::is_digit(c) && bump(c)) {
      num_.push_back(static_cast<char>(c));
      any = true;
    }
    return any;
  }

  // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  bool lex_number(char32_t first, event& ev) {
    num_.clear();
    num_.push_back(static_cast<char>(first));
    char32_t c = first;

    if (first == U'-') {
      if (!peek(c) || !detail::is_digit(c) || !bump(c)) {
        fail(ev, error_code::invalid_number);
        return false;
      }
      num_.push_back(static_cast<char>(c));
    }
    if (c == U'0') {
      if (peek(c) && detail::is_digit(c)) {
        (void)bump(c);
        fail(ev, error_code::invalid_number);
        return false;
      }
    } else {
      take_digits();
    }

    bool is_int = true;
    if (peek(c) && c == U'.' && bump(c)) {
      is_int = false;
      num_.push_back('.');
      if (!take_digits()) {
        (void)bump(c);
        fail(ev, error_code::invalid_number);
        return false;
      }
    }
    if (peek(c) && (c == U'e' || c == U'E') && bump(c)) {
      is_int = false;
      num_.push_back(static_cast<char>(c));
      if (peek(c) && (c == U'+' || c == U'-') && bump(c)) {
        num_.push_back(static_cast<char>(c));
      }
      if (!take_digits()) {
        (void)bump(c);
        fail(ev, error_code::invalid_number);
        return false;
      }
    }

    if (is_int && detail::parse_int64(num_, ev.i)) {
      ev.type = event_type::int64_value;
      return true;
    }
    // Fractions, exponents and integers outside int64.
    if (opt_.use_decimals) {
      auto dec = decimal::parse(num_);
      if (!dec) {
        fail(ev, error_code::invalid_number);
        return false;
      }
      ev.dec = std::move(*dec);
      ev.type = event_type::decimal_value;
      return true;
    }
    ev.d = detail::parse_double(num_);
    ev.type = event_type::double_value;
    return true;
  }

  scalar_reader reader_;
  parse_options opt_;
  state state_{state::initial};
  bool first_{true};
  std::vector<container> stack_;
  std::string num_;

  char32_t peek_{0};
  bool peek_ok_{false};
  bool has_peek_{false};

  std::size_t offset_{0};
  std::size_t line_{0};
  std::size_t column_{0};
};

} // namespace pxjson
