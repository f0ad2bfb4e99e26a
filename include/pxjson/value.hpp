#pragma once

// pxjson value model: the tagged-union `value`, the insertion-ordered
// `object` and the `array` container.

#include <pxjson/decimal.hpp>
#include <pxjson/error.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pxjson {

class value;

using array = std::vector<value>;

// Key/value pairs in insertion order with unique keys. Small objects are
// searched linearly; larger ones keep a key index next to the entries.
class object {
public:
  using entry = std::pair<std::string, value>;
  using container = std::vector<entry>;
  using const_iterator = container::const_iterator;

  object() = default;
  object(std::initializer_list<entry> init);

  std::size_t size() const noexcept;
  bool empty() const noexcept;
  const_iterator begin() const noexcept;
  const_iterator end() const noexcept;

  const value* find(std::string_view key) const noexcept;
  value* find(std::string_view key) noexcept;
  bool contains(std::string_view key) const noexcept;

  // Throws std::out_of_range when the key is absent.
  const value& at(std::string_view key) const;

  // Inserts null when the key is absent.
  value& operator[](std::string_view key);

  // Replaces the value of an existing key in place (keeping its position) or
  // appends a new entry. Returns the previous value, if any.
  std::optional<value> insert_or_assign(std::string key, value v);

  // Removes the entry for `key` and returns its value, if any.
  std::optional<value> erase(std::string_view key);

  void clear() noexcept;
  void reserve(std::size_t n);

  friend bool operator==(const object& a, const object& b);

private:
  static constexpr std::size_t kIndexThreshold = 16;
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  std::size_t find_index(std::string_view key) const noexcept;
  void rebuild_index();

  container entries_;
  std::map<std::string, std::size_t, std::less<>> index_;
};

class value {
public:
  enum class kind { null, boolean, string, int64, float64, decimal, object, array };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}
  value(bool b) : data_(b) {}

  template <class T, std::enable_if_t<std::is_integral<T>::value && !std::is_same<T, bool>::value, int> = 0>
  value(T i) {
    if constexpr (std::is_unsigned<T>::value && sizeof(T) >= sizeof(std::int64_t)) {
      if (i > static_cast<T>(std::numeric_limits<std::int64_t>::max())) {
        data_ = *decimal::parse(std::to_string(i));
        return;
      }
    }
    data_ = static_cast<std::int64_t>(i);
  }

  value(double d) : data_(d) {}
  value(decimal d) : data_(std::move(d)) {}
  value(std::string s) : data_(std::move(s)) {}
  value(std::string_view s) : data_(std::string(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(object o) : data_(std::move(o)) {}
  value(array a) : data_(std::move(a)) {}

  static value integer(std::int64_t i) {
    value v;
    v.data_ = i;
    return v;
  }

  static value number(double d) {
    value v;
    v.data_ = d;
    return v;
  }

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::null;
      case 1: return kind::boolean;
      case 2: return kind::string;
      case 3: return kind::int64;
      case 4: return kind::float64;
      case 5: return kind::decimal;
      case 6: return kind::object;
      case 7: return kind::array;
      default: return kind::null;
    }
  }

  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_int64() const noexcept { return std::holds_alternative<std::int64_t>(data_); }
  bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_decimal() const noexcept { return std::holds_alternative<decimal>(data_); }
  bool is_number() const noexcept { return is_int64() || is_double() || is_decimal(); }
  bool is_object() const noexcept { return std::holds_alternative<object>(data_); }
  bool is_array() const noexcept { return std::holds_alternative<array>(data_); }

  // Exact-alternative access: nullptr unless the value holds a T.
  template <class T>
  const T* get_ptr() const noexcept { return std::get_if<T>(&data_); }

  template <class T>
  T* get_ptr() noexcept { return std::get_if<T>(&data_); }

  // Visits the held alternative; null is passed as std::monostate.
  template <class Visitor>
  decltype(auto) visit(Visitor&& vis) const {
    return std::visit(std::forward<Visitor>(vis), data_);
  }

  const value* find(std::string_view key) const noexcept {
    const object* o = get_ptr<object>();
    return o ? o->find(key) : nullptr;
  }

  value* find(std::string_view key) noexcept {
    object* o = get_ptr<object>();
    return o ? o->find(key) : nullptr;
  }

private:
  // index: 0 null, 1 bool, 2 string, 3 int64, 4 double, 5 decimal, 6 object, 7 array
  std::variant<std::monostate, bool, std::string, std::int64_t, double, decimal, object, array> data_;
};

inline json_type json_type_of(const value& v) noexcept {
  switch (v.type()) {
    case value::kind::null: return json_type::null;
    case value::kind::boolean: return json_type::boolean;
    case value::kind::string: return json_type::string;
    case value::kind::int64:
    case value::kind::float64:
    case value::kind::decimal: return json_type::number;
    case value::kind::object: return json_type::object;
    case value::kind::array: return json_type::array;
  }
  return json_type::null;
}

// Numbers compare by value across representations; objects compare without
// regard to key order.
inline bool operator==(const value& a, const value& b) {
  using kind = value::kind;
  const kind ka = a.type();
  const kind kb = b.type();

  if (ka == kb) {
    switch (ka) {
      case kind::null: return true;
      case kind::boolean: return *a.get_ptr<bool>() == *b.get_ptr<bool>();
      case kind::string: return *a.get_ptr<std::string>() == *b.get_ptr<std::string>();
      case kind::int64: return *a.get_ptr<std::int64_t>() == *b.get_ptr<std::int64_t>();
      case kind::float64: return *a.get_ptr<double>() == *b.get_ptr<double>();
      case kind::decimal: return *a.get_ptr<decimal>() == *b.get_ptr<decimal>();
      case kind::object: return *a.get_ptr<object>() == *b.get_ptr<object>();
      case kind::array: return *a.get_ptr<array>() == *b.get_ptr<array>();
    }
    return false;
  }

  if (!a.is_number() || !b.is_number()) return false;

  // Order the pair so that `x` has the lower-ranked representation.
  const value& x = (ka < kb) ? a : b;
  const value& y = (ka < kb) ? b : a;
  if (x.is_int64() && y.is_double()) {
    return static_cast<double>(*x.get_ptr<std::int64_t>()) == *y.get_ptr<double>();
  }
  if (x.is_int64() && y.is_decimal()) {
    return decimal::from_int64(*x.get_ptr<std::int64_t>()) == *y.get_ptr<decimal>();
  }
  // double vs decimal
  const auto d = decimal::from_double(*x.get_ptr<double>());
  return d && *d == *y.get_ptr<decimal>();
}

inline bool operator!=(const value& a, const value& b) { return !(a == b); }

// ---- object ----

inline object::object(std::initializer_list<entry> init) {
  entries_.reserve(init.size());
  for (const auto& kv : init) insert_or_assign(kv.first, kv.second);
}

inline std::size_t object::size() const noexcept { return entries_.size(); }
inline bool object::empty() const noexcept { return entries_.empty(); }
inline object::const_iterator object::begin() const noexcept { return entries_.begin(); }
inline object::const_iterator object::end() const noexcept { return entries_.end(); }

inline std::size_t object::find_index(std::string_view key) const noexcept {
  if (!index_.empty()) {
    auto it = index_.find(key);
    return it == index_.end() ? npos : it->second;
  }
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].first == key) return i;
  }
  return npos;
}

inline void object::rebuild_index() {
  index_.clear();
  if (entries_.size() <= kIndexThreshold) return;
  for (std::size_t i = 0; i < entries_.size(); ++i) index_.emplace(entries_[i].first, i);
}

inline const value* object::find(std::string_view key) const noexcept {
  const std::size_t i = find_index(key);
  return i == npos ? nullptr : &entries_[i].second;
}

inline value* object::find(std::string_view key) noexcept {
  const std::size_t i = find_index(key);
  return i == npos ? nullptr : &entries_[i].second;
}

inline bool object::contains(std::string_view key) const noexcept { return find_index(key) != npos; }

inline const value& object::at(std::string_view key) const {
  const value* v = find(key);
  if (!v) throw std::out_of_range("pxjson: no such key: " + std::string(key));
  return *v;
}

inline value& object::operator[](std::string_view key) {
  const std::size_t i = find_index(key);
  if (i != npos) return entries_[i].second;
  insert_or_assign(std::string(key), value());
  return entries_.back().second;
}

inline std::optional<value> object::insert_or_assign(std::string key, value v) {
  const std::size_t i = find_index(key);
  if (i != npos) {
    std::optional<value> old(std::move(entries_[i].second));
    entries_[i].second = std::move(v);
    return old;
  }
  entries_.emplace_back(std::move(key), std::move(v));
  if (!index_.empty()) {
    index_.emplace(entries_.back().first, entries_.size() - 1);
  } else if (entries_.size() > kIndexThreshold) {
    rebuild_index();
  }
  return std::nullopt;
}

inline std::optional<value> object::erase(std::string_view key) {
  const std::size_t i = find_index(key);
  if (i == npos) return std::nullopt;
  std::optional<value> old(std::move(entries_[i].second));
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
  rebuild_index();
  return old;
}

inline void object::clear() noexcept {
  entries_.clear();
  index_.clear();
}

inline void object::reserve(std::size_t n) { entries_.reserve(n); }

inline bool operator==(const object& a, const object& b) {
  if (a.size() != b.size()) return false;
  for (const auto& kv : a) {
    const value* other = b.find(kv.first);
    if (!other || !(kv.second == *other)) return false;
  }
  return true;
}

inline bool operator!=(const object& a, const object& b) { return !(a == b); }

} // namespace pxjson
