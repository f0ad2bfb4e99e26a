#pragma once

// pxjson decoder: drives a parser into a handler and assembles values, either
// one document at a time (eager) or as a sequence of concatenated documents.

#include <pxjson/encoding.hpp>
#include <pxjson/error.hpp>
#include <pxjson/handler.hpp>
#include <pxjson/parser.hpp>
#include <pxjson/value.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace pxjson {

struct parse_result {
  value val;
  error err;
};

namespace detail {

enum class feed_status { value, error, exhausted };

// Pulls the events of exactly one top-level value and forwards them to `h`.
// A string event in key position becomes `h.key()`.
inline feed_status feed_value(parser& p, handler& h, event& ev, error& err) {
  std::vector<bool> in_object;
  bool expect_key = false;
  bool started = false;

  while (p.next(ev)) {
    started = true;
    switch (ev.type) {
      case event_type::error:
        err = ev.err;
        return feed_status::error;
      case event_type::object_start:
        h.start_object(0);
        in_object.push_back(true);
        expect_key = true;
        continue;
      case event_type::array_start:
        h.start_array(0);
        in_object.push_back(false);
        expect_key = false;
        continue;
      case event_type::object_end:
        h.end_object();
        in_object.pop_back();
        break;
      case event_type::array_end:
        h.end_array();
        in_object.pop_back();
        break;
      case event_type::string_value:
        if (expect_key) {
          h.key(ev.str);
          expect_key = false;
          continue;
        }
        h.string_value(ev.str);
        break;
      case event_type::int64_value: h.int64_value(ev.i); break;
      case event_type::double_value: h.double_value(ev.d); break;
      case event_type::decimal_value: h.decimal_value(ev.dec); break;
      case event_type::bool_value: h.bool_value(ev.b); break;
      case event_type::null_value: h.null_value(); break;
    }
    // A value is complete.
    if (in_object.empty()) return feed_status::value;
    expect_key = in_object.back();
  }
  if (!started) return feed_status::exhausted;
  // Unreachable with a well-behaved parser: it reports an error before
  // running dry inside a value.
  err.code = error_code::unexpected_eof;
  err.line = p.line();
  err.column = p.column();
  return feed_status::error;
}

// After one value in non-streaming mode: the rest must be whitespace.
inline error finish(parser& p, event& ev) {
  if (p.next(ev) && ev.type == event_type::error) return ev.err;
  return error{};
}

} // namespace detail

// Feeds one complete JSON text from `p` into `h`. Outside streaming mode the
// remaining input must be whitespace. Returns the parse error, if any; events
// delivered before an error are not retracted.
inline error decode_events(parser& p, handler& h) {
  event ev;
  error err;
  switch (detail::feed_value(p, h, ev, err)) {
    case detail::feed_status::error:
      return err;
    case detail::feed_status::exhausted:
      // Only a streaming parser runs dry without a value.
      return error{};
    case detail::feed_status::value:
      break;
  }
  if (p.options().streaming) return error{};
  return detail::finish(p, ev);
}

// Decodes a UTF-8 JSON text holding exactly one value.
inline parse_result decode(std::string_view text, parse_options opt = {}) {
  opt.streaming = false;
  parser p(text, opt);
  value_builder b;
  parse_result r;
  r.err = decode_events(p, b);
  if (!r.err) r.val = b.take();
  return r;
}

// Decodes JSON bytes in any of the five Unicode encodings, with or without BOM.
inline parse_result decode_bytes(std::string_view bytes, parse_options opt = {}) {
  const encoding_result enc = detect_encoding(bytes);
  parse_result r;
  if (enc.err) {
    r.err = enc.err;
    return r;
  }
  opt.streaming = false;
  parser p(make_scalar_reader(bytes, enc), opt);
  value_builder b;
  r.err = decode_events(p, b);
  if (!r.err) r.val = b.take();
  return r;
}

inline value decode_or_throw(std::string_view text, parse_options opt = {}) {
  parse_result r = decode(text, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.val);
}

inline value decode_bytes_or_throw(std::string_view bytes, parse_options opt = {}) {
  parse_result r = decode_bytes(bytes, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.val);
}

// Lazily decodes concatenated top-level values. Each element is a value or
// the terminal error; nothing follows an error. The input must outlive the
// decoder.
class stream_decoder {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = parse_result;
    using difference_type = std::ptrdiff_t;
    using pointer = const parse_result*;
    using reference = const parse_result&;

    iterator() = default;
    explicit iterator(stream_decoder* d) : d_(d) { advance(); }

    reference operator*() const { return *cur_; }
    pointer operator->() const { return &*cur_; }

    iterator& operator++() {
      advance();
      return *this;
    }

    friend bool operator==(const iterator& a, const iterator& b) noexcept { return a.d_ == b.d_; }
    friend bool operator!=(const iterator& a, const iterator& b) noexcept { return a.d_ != b.d_; }

  private:
    void advance() {
      cur_ = d_->next();
      if (!cur_) d_ = nullptr;
    }

    stream_decoder* d_{nullptr};
    std::optional<parse_result> cur_;
  };

  stream_decoder(scalar_reader reader, parse_options opt) : parser_(reader, with_streaming(opt)) {}

  // A decoder that yields `err` once.
  explicit stream_decoder(error err) : parser_(scalar_reader(), with_streaming({})), pending_(err) {}

  std::optional<parse_result> next() {
    if (done_) return std::nullopt;
    parse_result r;
    if (pending_) {
      done_ = true;
      r.err = pending_;
      return r;
    }
    builder_.reset();
    switch (detail::feed_value(parser_, builder_, ev_, r.err)) {
      case detail::feed_status::value:
        r.val = builder_.take();
        return r;
      case detail::feed_status::error:
        done_ = true;
        return r;
      case detail::feed_status::exhausted:
        break;
    }
    done_ = true;
    return std::nullopt;
  }

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  static parse_options with_streaming(parse_options opt) {
    opt.streaming = true;
    return opt;
  }

  parser parser_;
  value_builder builder_;
  event ev_;
  error pending_;
  bool done_{false};
};

inline stream_decoder decode_stream(std::string_view text, parse_options opt = {}) {
  return stream_decoder(scalar_reader(text, encoding::utf8), opt);
}

inline stream_decoder decode_stream_bytes(std::string_view bytes, parse_options opt = {}) {
  const encoding_result enc = detect_encoding(bytes);
  if (enc.err) return stream_decoder(enc.err);
  return stream_decoder(make_scalar_reader(bytes, enc), opt);
}

} // namespace pxjson
