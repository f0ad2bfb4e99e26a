#pragma once

// pxjson handler: the visitor/builder seam. `walk` drives a handler from a
// value tree, `value_builder` assembles a tree from handler calls, and the
// encoder's writer is a handler too.

#include <pxjson/decimal.hpp>
#include <pxjson/value.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pxjson {

// Receives value-shaped callbacks. Inside an object every member is announced
// by `key()` followed by exactly one value (scalar or container).
class handler {
public:
  virtual ~handler() = default;

  virtual void null_value() = 0;
  virtual void bool_value(bool b) = 0;
  virtual void string_value(std::string_view s) = 0;
  virtual void int64_value(std::int64_t i) = 0;
  virtual void double_value(double d) = 0;
  virtual void decimal_value(const decimal& d) = 0;

  virtual void start_object(std::size_t size_hint) = 0;
  virtual void key(std::string_view k) = 0;
  virtual void end_object() = 0;

  virtual void start_array(std::size_t size_hint) = 0;
  virtual void end_array() = 0;
};

// Feeds `v` into `h` depth-first. Iterative: deep trees do not recurse.
inline void walk(const value& v, handler& h) {
  struct frame {
    const value* v{nullptr};
    std::size_t idx{0};
  };
  std::vector<frame> stack;
  stack.push_back(frame{&v, 0});

  while (!stack.empty()) {
    frame& f = stack.back();
    const value& cur = *f.v;

    switch (cur.type()) {
      case value::kind::null:
        h.null_value();
        stack.pop_back();
        break;
      case value::kind::boolean:
        h.bool_value(*cur.get_ptr<bool>());
        stack.pop_back();
        break;
      case value::kind::string:
        h.string_value(*cur.get_ptr<std::string>());
        stack.pop_back();
        break;
      case value::kind::int64:
        h.int64_value(*cur.get_ptr<std::int64_t>());
        stack.pop_back();
        break;
      case value::kind::float64:
        h.double_value(*cur.get_ptr<double>());
        stack.pop_back();
        break;
      case value::kind::decimal:
        h.decimal_value(*cur.get_ptr<decimal>());
        stack.pop_back();
        break;
      case value::kind::array: {
        const array& a = *cur.get_ptr<array>();
        if (f.idx == 0) h.start_array(a.size());
        if (f.idx == a.size()) {
          h.end_array();
          stack.pop_back();
          break;
        }
        const value* child = &a[f.idx++];
        stack.push_back(frame{child, 0});  // invalidates `f`
        break;
      }
      case value::kind::object: {
        const object& o = *cur.get_ptr<object>();
        if (f.idx == 0) h.start_object(o.size());
        if (f.idx == o.size()) {
          h.end_object();
          stack.pop_back();
          break;
        }
        const auto& kv = *(o.begin() + static_cast<std::ptrdiff_t>(f.idx++));
        h.key(kv.first);
        stack.push_back(frame{&kv.second, 0});
        break;
      }
    }
  }
}

// Builds a value from handler callbacks. Duplicate keys keep the position of
// their first occurrence and the value of their last.
class value_builder final : public handler {
public:
  void null_value() override { put(value()); }
  void bool_value(bool b) override { put(value(b)); }
  void string_value(std::string_view s) override { put(value(std::string(s))); }
  void int64_value(std::int64_t i) override { put(value::integer(i)); }
  void double_value(double d) override { put(value::number(d)); }
  void decimal_value(const decimal& d) override { put(value(d)); }

  void start_object(std::size_t) override {
    stack_.push_back(level{value(object{}), {}});
  }

  void key(std::string_view k) override {
    if (stack_.empty() || !stack_.back().v.is_object()) {
      throw std::logic_error("pxjson: key() outside of an object");
    }
    stack_.back().pending_key.assign(k.data(), k.size());
  }

  void end_object() override { close(); }

  void start_array(std::size_t size_hint) override {
    array a;
    a.reserve(size_hint);
    stack_.push_back(level{value(std::move(a)), {}});
  }

  void end_array() override { close(); }

  // True once a complete top-level value has been built.
  bool done() const noexcept { return stack_.empty() && has_root_; }

  std::size_t depth() const noexcept { return stack_.size(); }

  // Moves the finished value out and resets the builder.
  value take() {
    if (!done()) throw std::logic_error("pxjson: value_builder has no complete value");
    has_root_ = false;
    return std::move(root_);
  }

  void reset() {
    stack_.clear();
    root_ = value();
    has_root_ = false;
  }

private:
  struct level {
    value v;
    std::string pending_key;
  };

  void put(value v) {
    if (stack_.empty()) {
      if (has_root_) throw std::logic_error("pxjson: value_builder already holds a value");
      root_ = std::move(v);
      has_root_ = true;
      return;
    }
    level& top = stack_.back();
    if (array* a = top.v.get_ptr<array>()) {
      a->push_back(std::move(v));
      return;
    }
    top.v.get_ptr<object>()->insert_or_assign(std::move(top.pending_key), std::move(v));
    top.pending_key.clear();
  }

  void close() {
    if (stack_.empty()) throw std::logic_error("pxjson: unbalanced end of container");
    value finished = std::move(stack_.back().v);
    stack_.pop_back();
    put(std::move(finished));
  }

  std::vector<level> stack_;
  value root_;
  bool has_root_{false};
};

} // namespace pxjson
