#pragma once

// Character-level helpers shared by the parser, the decimal type and the
// encoder.

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace pxjson {

// Config: floating-point parsing backend.
// Override by defining PXJSON_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef PXJSON_USE_FROM_CHARS_DOUBLE
  #define PXJSON_USE_FROM_CHARS_DOUBLE 1
#endif

namespace detail {

constexpr char32_t replacement_character = 0xFFFD;

inline bool is_ws(char32_t c) noexcept {
  return c == U' ' || c == U'\n' || c == U'\r' || c == U'\t';
}

inline bool is_digit(char32_t c) noexcept { return c >= U'0' && c <= U'9'; }

inline int hex_val(char32_t c) noexcept {
  if (c >= U'0' && c <= U'9') return static_cast<int>(c - U'0');
  if (c >= U'a' && c <= U'f') return 10 + static_cast<int>(c - U'a');
  if (c >= U'A' && c <= U'F') return 10 + static_cast<int>(c - U'A');
  return -1;
}

inline bool is_lead_surrogate(std::uint32_t cu) noexcept { return cu >= 0xD800u && cu <= 0xDBFFu; }
inline bool is_trail_surrogate(std::uint32_t cu) noexcept { return cu >= 0xDC00u && cu <= 0xDFFFu; }

inline void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

// Decimal exponent of the leading significant digit of a JSON number token,
// used to tell overflow from underflow.
inline long long leading_exponent(std::string_view token) noexcept {
  std::size_t i = (!token.empty() && token[0] == '-') ? 1u : 0u;
  long long int_digits = 0;
  long long lead_zeros = 0;
  bool seen_nonzero = false;
  for (; i < token.size() && is_digit(static_cast<unsigned char>(token[i])); ++i) {
    if (token[i] != '0') seen_nonzero = true;
    if (seen_nonzero) ++int_digits;
  }
  if (i < token.size() && token[i] == '.') {
    for (++i; i < token.size() && is_digit(static_cast<unsigned char>(token[i])); ++i) {
      if (seen_nonzero) continue;
      if (token[i] != '0') seen_nonzero = true;
      else ++lead_zeros;
    }
  }
  long long exp = 0;
  if (i < token.size() && (token[i] == 'e' || token[i] == 'E')) {
    ++i;
    bool neg = false;
    if (i < token.size() && (token[i] == '+' || token[i] == '-')) neg = token[i++] == '-';
    for (; i < token.size() && is_digit(static_cast<unsigned char>(token[i])); ++i) {
      if (exp < 1000000000LL) exp = exp * 10 + (token[i] - '0');
    }
    if (neg) exp = -exp;
  }
  return exp + (int_digits > 0 ? int_digits : -lead_zeros);
}

inline double parse_double(std::string_view token) {
  // Backend choice:
  // - from_chars: locale-free and allocation-free, performance varies by STL.
  // - strtod: available everywhere, but honours the C locale's decimal point.
#if defined(PXJSON_USE_FROM_CHARS_DOUBLE) && PXJSON_USE_FROM_CHARS_DOUBLE && defined(__cpp_lib_to_chars)
  double v = 0.0;
  const char* first = token.data();
  const char* last = token.data() + token.size();
  auto r = std::from_chars(first, last, v, std::chars_format::general);
  if (r.ec == std::errc::result_out_of_range) {
    const bool neg = !token.empty() && token[0] == '-';
    if (leading_exponent(token) > 0) {
      return neg ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    }
    return neg ? -0.0 : 0.0;
  }
  if (r.ec == std::errc{} && r.ptr == last) return v;
  throw std::invalid_argument("pxjson: not a number: " + std::string(token));
#else
  // Token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
#endif
}

// Parses a JSON integer token (no fraction or exponent). Returns false when
// the token does not fit in int64.
inline bool parse_int64(std::string_view token, std::int64_t& out) noexcept {
  const char* first = token.data();
  const char* last = token.data() + token.size();
  auto r = std::from_chars(first, last, out, 10);
  return r.ec == std::errc{} && r.ptr == last;
}

template <class Out>
inline void append_int64(Out& out, std::int64_t v) {
  char buf[32];
  auto r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc{}) {
    throw std::runtime_error("pxjson: failed to format integer");
  }
  out.append(buf, static_cast<std::size_t>(r.ptr - buf));
}

// A whole-valued double keeps a ".0" so that it reads back as a double.
template <class Out>
inline void append_double_text(Out& out, const char* p, std::size_t n) {
  out.append(p, n);
  for (std::size_t i = 0; i < n; ++i) {
    if (p[i] == '.' || p[i] == 'e' || p[i] == 'E') return;
  }
  out.append(".0", 2);
}

template <class Out>
inline void append_double(Out& out, double d) {
  if (!std::isfinite(d)) {
    throw std::runtime_error("pxjson: cannot encode NaN/Inf as JSON number");
  }
  // Shortest general representation first, then a max_digits10 round-trip
  // path if the implementation refuses.
  char buf[64];
  auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::general);
  if (r.ec == std::errc{}) {
    append_double_text(out, buf, static_cast<std::size_t>(r.ptr - buf));
    return;
  }

  r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::general,
                    std::numeric_limits<double>::max_digits10);
  if (r.ec == std::errc{}) {
    append_double_text(out, buf, static_cast<std::size_t>(r.ptr - buf));
    return;
  }

  const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(buf)) {
    throw std::runtime_error("pxjson: failed to format double");
  }
  append_double_text(out, buf, static_cast<std::size_t>(n));
}

inline std::string format_double(double d) {
  std::string out;
  append_double(out, d);
  return out;
}

inline std::string format_int64(std::int64_t v) {
  std::string out;
  append_int64(out, v);
  return out;
}

} // namespace detail
} // namespace pxjson
