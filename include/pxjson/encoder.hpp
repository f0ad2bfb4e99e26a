#pragma once

// pxjson encoder: writes JSON text for handler callbacks (and so for whole
// values through `walk`) into any sink with append(const char*, size_t) and
// push_back(char).

#include <pxjson/chars.hpp>
#include <pxjson/decimal.hpp>
#include <pxjson/handler.hpp>
#include <pxjson/value.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#if defined(_M_X64) || defined(__SSE2__)
  #include <emmintrin.h>
#endif

namespace pxjson {

struct encode_options {
  // Newlines and two-space indentation.
  bool pretty{false};
  // Write `/` as `\/`.
  bool escape_slashes{false};
  // Fold trailing zeros of decimals into the exponent before writing.
  bool normalize_decimals{false};
};

// Adapts a std::ostream to the sink interface.
class ostream_sink {
public:
  explicit ostream_sink(std::ostream& os) : os_(os) {}

  void append(const char* p, std::size_t n) { os_.write(p, static_cast<std::streamsize>(n)); }
  void push_back(char c) { os_.put(c); }

private:
  std::ostream& os_;
};

namespace detail {

inline bool needs_escape(unsigned char c, bool escape_slashes) noexcept {
  return c == '"' || c == '\\' || c <= 0x1F || (escape_slashes && c == '/');
}

inline std::size_t find_first_escape(std::string_view s, bool escape_slashes) noexcept {
  const char* p = s.data();
  const std::size_t n = s.size();
  std::size_t i = 0;

#if defined(_M_X64) || defined(__SSE2__)
  const __m128i q = _mm_set1_epi8('"');
  const __m128i bs = _mm_set1_epi8('\\');
  const __m128i sl = _mm_set1_epi8(escape_slashes ? '/' : '"');
  const __m128i k1f = _mm_set1_epi8(0x1F);
  const __m128i zero = _mm_setzero_si128();

  while (i + 16 <= n) {
    const __m128i v = _mm_loadu_si128(reinterpret_cast<const __m128i*>(p + i));
    const __m128i is_q = _mm_cmpeq_epi8(v, q);
    const __m128i is_bs = _mm_cmpeq_epi8(v, bs);
    const __m128i is_sl = _mm_cmpeq_epi8(v, sl);
    // Bytes <= 0x1F saturate to zero.
    const __m128i is_ctrl = _mm_cmpeq_epi8(_mm_subs_epu8(v, k1f), zero);
    const __m128i any = _mm_or_si128(_mm_or_si128(is_q, is_bs), _mm_or_si128(is_sl, is_ctrl));
    const int mask = _mm_movemask_epi8(any);
    if (mask != 0) {
#if defined(_MSC_VER)
      unsigned long bit = 0;
      _BitScanForward(&bit, static_cast<unsigned long>(mask));
      return i + static_cast<std::size_t>(bit);
#else
      return i + static_cast<std::size_t>(__builtin_ctz(static_cast<unsigned>(mask)));
#endif
    }
    i += 16;
  }
#endif

  for (; i < n; ++i) {
    if (needs_escape(static_cast<unsigned char>(p[i]), escape_slashes)) return i;
  }
  return n;
}

template <class Sink>
void write_escaped(Sink& out, std::string_view s, bool escape_slashes) {
  static constexpr char hex[] = "0123456789ABCDEF";

  const char* data = s.data();
  const std::size_t n = s.size();
  const std::size_t first = find_first_escape(s, escape_slashes);

  out.push_back('"');
  if (first == n) {
    out.append(data, n);
    out.push_back('"');
    return;
  }

  if (first > 0) out.append(data, first);

  std::size_t chunk_begin = first;
  for (std::size_t i = first; i < n; ++i) {
    const unsigned char uc = static_cast<unsigned char>(data[i]);
    if (!needs_escape(uc, escape_slashes)) continue;

    if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
    chunk_begin = i + 1;
    switch (data[i]) {
      case '"': out.append("\\\"", 2); break;
      case '\\': out.append("\\\\", 2); break;
      case '/': out.append("\\/", 2); break;
      case '\b': out.append("\\b", 2); break;
      case '\f': out.append("\\f", 2); break;
      case '\n': out.append("\\n", 2); break;
      case '\r': out.append("\\r", 2); break;
      case '\t': out.append("\\t", 2); break;
      default:
        out.append("\\u00", 4);
        out.push_back(hex[(uc >> 4) & 0xF]);
        out.push_back(hex[uc & 0xF]);
        break;
    }
  }

  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

} // namespace detail

// Streams JSON text into `Sink` as handler callbacks arrive. The sink must
// outlive the writer.
template <class Sink>
class writer final : public handler {
public:
  explicit writer(Sink& out, encode_options opt = {}) : out_(out), opt_(opt) {}

  void null_value() override {
    before_value();
    out_.append("null", 4);
  }

  void bool_value(bool b) override {
    before_value();
    if (b) out_.append("true", 4);
    else out_.append("false", 5);
  }

  void string_value(std::string_view s) override {
    before_value();
    detail::write_escaped(out_, s, opt_.escape_slashes);
  }

  void int64_value(std::int64_t i) override {
    before_value();
    detail::append_int64(out_, i);
  }

  void double_value(double d) override {
    before_value();
    detail::append_double(out_, d);
  }

  void decimal_value(const decimal& d) override {
    before_value();
    const std::string text = opt_.normalize_decimals ? d.normalized().to_string() : d.to_string();
    out_.append(text.data(), text.size());
  }

  void start_object(std::size_t) override {
    before_value();
    out_.push_back('{');
    stack_.push_back(level{true, true});
  }

  void key(std::string_view k) override {
    if (stack_.empty() || !stack_.back().is_object) throw std::logic_error("pxjson: key() outside of an object");
    next_member();
    detail::write_escaped(out_, k, opt_.escape_slashes);
    if (opt_.pretty) out_.append(": ", 2);
    else out_.push_back(':');
    after_key_ = true;
  }

  void end_object() override { close('}', true); }

  void start_array(std::size_t) override {
    before_value();
    out_.push_back('[');
    stack_.push_back(level{false, true});
  }

  void end_array() override { close(']', false); }

private:
  struct level {
    bool is_object;
    bool first;
  };

  void newline_indent(std::size_t depth) {
    out_.push_back('\n');
    for (std::size_t i = 0; i < depth; ++i) out_.append("  ", 2);
  }

  void next_member() {
    level& l = stack_.back();
    if (!l.first) out_.push_back(',');
    l.first = false;
    if (opt_.pretty) newline_indent(stack_.size());
  }

  void before_value() {
    if (after_key_) {
      after_key_ = false;
      return;
    }
    if (stack_.empty()) return;
    if (stack_.back().is_object) throw std::logic_error("pxjson: object member without key()");
    next_member();
  }

  void close(char bracket, bool is_object) {
    if (stack_.empty() || stack_.back().is_object != is_object || after_key_) {
      throw std::logic_error("pxjson: unbalanced end of container");
    }
    const bool empty = stack_.back().first;
    stack_.pop_back();
    if (opt_.pretty && !empty) newline_indent(stack_.size());
    out_.push_back(bracket);
  }

  Sink& out_;
  encode_options opt_;
  std::vector<level> stack_;
  bool after_key_{false};
};

template <class Sink, std::enable_if_t<!std::is_base_of<std::ostream, Sink>::value, int> = 0>
void encode_to(Sink& out, const value& v, encode_options opt = {}) {
  writer<Sink> w(out, opt);
  walk(v, w);
}

inline void encode_to(std::ostream& os, const value& v, encode_options opt = {}) {
  ostream_sink sink(os);
  encode_to(sink, v, opt);
}

inline std::string encode(const value& v, encode_options opt = {}) {
  struct encode_reserve_hints {
    std::size_t compact{256};
    std::size_t pretty{256};
  };
  thread_local encode_reserve_hints hints;

  std::string out;
  std::size_t& hint = opt.pretty ? hints.pretty : hints.compact;
  out.reserve(hint);
  encode_to(out, v, opt);

  constexpr std::size_t min_hint = 256;
  constexpr std::size_t max_hint = 16u * 1024u * 1024u;
  const std::size_t sz = out.size();
  hint = (sz < min_hint) ? min_hint : (sz > max_hint ? max_hint : sz);
  return out;
}

} // namespace pxjson
