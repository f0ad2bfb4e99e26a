#pragma once

// pxjson::decimal: an exact base-10 number, stored as sign, coefficient digits
// and a power-of-ten exponent. Used for numbers decoded with `use_decimals`.

#include <pxjson/chars.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pxjson {

class decimal {
public:
  decimal() = default;

  // Parses a complete JSON number literal. Returns nullopt on anything else
  // (leading '+', leading zeros, missing digits, trailing bytes).
  static std::optional<decimal> parse(std::string_view text) {
    std::size_t i = 0;
    const std::size_t n = text.size();
    decimal d;
    d.digits_.clear();

    if (i < n && text[i] == '-') {
      d.negative_ = true;
      ++i;
    }
    if (i >= n) return std::nullopt;
    if (text[i] == '0') {
      d.digits_.push_back('0');
      ++i;
    } else if (text[i] >= '1' && text[i] <= '9') {
      while (i < n && detail::is_digit(static_cast<unsigned char>(text[i]))) d.digits_.push_back(text[i++]);
    } else {
      return std::nullopt;
    }

    std::int64_t frac_len = 0;
    if (i < n && text[i] == '.') {
      ++i;
      if (i >= n || !detail::is_digit(static_cast<unsigned char>(text[i]))) return std::nullopt;
      while (i < n && detail::is_digit(static_cast<unsigned char>(text[i]))) {
        d.digits_.push_back(text[i++]);
        ++frac_len;
      }
    }

    std::int64_t exp = 0;
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
      ++i;
      bool exp_neg = false;
      if (i < n && (text[i] == '+' || text[i] == '-')) {
        exp_neg = text[i] == '-';
        ++i;
      }
      if (i >= n || !detail::is_digit(static_cast<unsigned char>(text[i]))) return std::nullopt;
      while (i < n && detail::is_digit(static_cast<unsigned char>(text[i]))) {
        exp = exp * 10 + (text[i] - '0');
        if (exp > kExponentLimit) return std::nullopt;
        ++i;
      }
      if (exp_neg) exp = -exp;
    }
    if (i != n) return std::nullopt;

    const std::size_t nz = d.digits_.find_first_not_of('0');
    if (nz == std::string::npos) {
      d.digits_.assign(1, '0');
    } else if (nz > 0) {
      d.digits_.erase(0, nz);
    }
    d.exponent_ = exp - frac_len;
    return d;
  }

  static decimal from_int64(std::int64_t v) {
    decimal d;
    std::string text = detail::format_int64(v);
    if (text[0] == '-') {
      d.negative_ = true;
      text.erase(0, 1);
    }
    d.digits_ = std::move(text);
    return d;
  }

  // Uses the shortest text that round-trips to `v`. Non-finite values have no
  // decimal representation.
  static std::optional<decimal> from_double(double v) {
    if (!std::isfinite(v)) return std::nullopt;
    return parse(detail::format_double(v));
  }

  bool negative() const noexcept { return negative_; }
  const std::string& digits() const noexcept { return digits_; }
  std::int64_t exponent() const noexcept { return exponent_; }
  bool is_zero() const noexcept { return digits_.size() == 1 && digits_[0] == '0'; }

  // Exact text of the stored digits. Plain notation while the exponent is not
  // positive and the adjusted exponent is at least -6, scientific otherwise.
  std::string to_string() const {
    std::string out;
    if (negative_) out.push_back('-');
    const std::int64_t adjusted = exponent_ + static_cast<std::int64_t>(digits_.size()) - 1;
    if (exponent_ <= 0 && adjusted >= -6) {
      if (exponent_ == 0) {
        out += digits_;
        return out;
      }
      const std::size_t scale = static_cast<std::size_t>(-exponent_);
      std::string s = digits_;
      if (s.size() <= scale) s.insert(0, scale - s.size() + 1, '0');
      s.insert(s.size() - scale, 1, '.');
      out += s;
      return out;
    }
    out.push_back(digits_[0]);
    if (digits_.size() > 1) {
      out.push_back('.');
      out.append(digits_, 1, std::string::npos);
    }
    out.push_back('E');
    out.push_back(adjusted < 0 ? '-' : '+');
    out += std::to_string(adjusted < 0 ? -adjusted : adjusted);
    return out;
  }

  // Same value with trailing zeros folded into the exponent; zero becomes
  // an unsigned "0".
  decimal normalized() const {
    decimal d = *this;
    if (d.is_zero()) {
      d.negative_ = false;
      d.exponent_ = 0;
      return d;
    }
    std::size_t keep = d.digits_.size();
    while (keep > 1 && d.digits_[keep - 1] == '0') --keep;
    d.exponent_ += static_cast<std::int64_t>(d.digits_.size() - keep);
    d.digits_.resize(keep);
    return d;
  }

  double to_double() const { return detail::parse_double(to_string()); }

  // Integral part (truncated toward zero), or nullopt when it does not fit.
  std::optional<std::int64_t> to_int64() const {
    const decimal n = normalized();
    if (n.is_zero()) return 0;

    std::string int_digits;
    if (n.exponent_ >= 0) {
      if (static_cast<std::int64_t>(n.digits_.size()) + n.exponent_ > 19) return std::nullopt;
      int_digits = n.digits_;
      int_digits.append(static_cast<std::size_t>(n.exponent_), '0');
    } else {
      const std::int64_t keep = static_cast<std::int64_t>(n.digits_.size()) + n.exponent_;
      if (keep <= 0) return 0;
      int_digits = n.digits_.substr(0, static_cast<std::size_t>(keep));
    }
    if (n.negative_) int_digits.insert(0, 1, '-');

    std::int64_t out = 0;
    if (!detail::parse_int64(int_digits, out)) return std::nullopt;
    return out;
  }

  friend bool operator==(const decimal& a, const decimal& b) {
    const decimal x = a.normalized();
    const decimal y = b.normalized();
    return x.negative_ == y.negative_ && x.exponent_ == y.exponent_ && x.digits_ == y.digits_;
  }

  friend bool operator!=(const decimal& a, const decimal& b) { return !(a == b); }

private:
  // parse() rejects exponents with a larger magnitude.
  static constexpr std::int64_t kExponentLimit = 1000000000000LL;

  bool negative_{false};
  std::string digits_{"0"};
  std::int64_t exponent_{0};
};

} // namespace pxjson
