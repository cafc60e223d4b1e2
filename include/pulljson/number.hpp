#pragma once

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

#include "text.hpp"

namespace pulljson {

// Exact JSON number: an arbitrary-length integer, or a decimal
// (-1)^negative * coefficient * 10^exponent. Never a binary float.
class number {
public:
  using big_int = boost::multiprecision::cpp_int;

  enum class kind { integer, decimal };

  number() = default;

  static number integer(std::int64_t v) {
    number n;
    n.negative_ = v < 0;
    n.coef_ = boost::multiprecision::abs(big_int(v));
    return n;
  }

  static number integer(const big_int& v) {
    number n;
    n.negative_ = v.sign() < 0;
    n.coef_ = boost::multiprecision::abs(v);
    return n;
  }

  static number decimal(const big_int& coefficient, std::int64_t exponent) {
    number n;
    n.kind_ = kind::decimal;
    n.negative_ = coefficient.sign() < 0;
    n.coef_ = boost::multiprecision::abs(coefficient);
    n.exp_ = exponent;
    return n;
  }

  // Optional minus sign followed by digits, no leading zeros.
  static std::optional<number> parse_integer(std::string_view token);

  // Full JSON number grammar, integers included. Throws std::out_of_range when
  // the exponent does not fit.
  static std::optional<number> parse_decimal(std::string_view token);

  // Integer first, decimal otherwise.
  static number parse(std::string_view token) {
    if (auto i = parse_integer(token)) return std::move(*i);
    if (auto d = parse_decimal(token)) return std::move(*d);
    throw std::invalid_argument("pulljson: not a JSON number: " + std::string(token));
  }

  kind type() const noexcept { return kind_; }
  bool is_integer() const noexcept { return kind_ == kind::integer; }
  bool is_decimal() const noexcept { return kind_ == kind::decimal; }
  bool is_negative() const noexcept { return negative_; }

  // Magnitude; the sign is is_negative().
  const big_int& coefficient() const noexcept { return coef_; }
  std::int64_t exponent() const noexcept { return exp_; }

  big_int as_integer() const {
    if (!is_integer()) throw std::runtime_error("pulljson: number is not an integer");
    return negative_ ? big_int(-coef_) : coef_;
  }

  bool fits_int64() const {
    if (!is_integer()) return false;
    const big_int limit = big_int((std::numeric_limits<std::int64_t>::max)()) + (negative_ ? 1 : 0);
    return coef_ <= limit;
  }

  std::int64_t as_int64() const {
    if (!fits_int64()) throw std::range_error("pulljson: number does not fit int64");
    if (!negative_) return coef_.convert_to<std::int64_t>();
    if (coef_ == big_int((std::numeric_limits<std::int64_t>::max)()) + 1) {
      return (std::numeric_limits<std::int64_t>::min)();
    }
    return -coef_.convert_to<std::int64_t>();
  }

  double to_double() const {
    const std::string s = to_string();
    return std::strtod(s.c_str(), nullptr);
  }

  // Integers print as digits. Decimals use positional notation while the
  // exponent is <= 0 and the value is not tiny, scientific otherwise.
  std::string to_string() const {
    std::string out;
    if (negative_) out.push_back('-');
    const std::string digits = coef_.str();
    if (kind_ == kind::integer) {
      out += digits;
      return out;
    }

    const auto n = static_cast<std::int64_t>(digits.size());
    const std::int64_t adjusted = exp_ + (n - 1);
    if (exp_ <= 0 && adjusted >= -6) {
      const std::int64_t point = n + exp_;
      if (exp_ == 0) {
        out += digits;
      } else if (point > 0) {
        out.append(digits, 0, static_cast<std::size_t>(point));
        out.push_back('.');
        out.append(digits, static_cast<std::size_t>(point), std::string::npos);
      } else {
        out += "0.";
        out.append(static_cast<std::size_t>(-point), '0');
        out += digits;
      }
      return out;
    }

    out.push_back(digits[0]);
    if (n > 1) {
      out.push_back('.');
      out.append(digits, 1, std::string::npos);
    }
    out.push_back('E');
    if (adjusted >= 0) out.push_back('+');
    out += std::to_string(adjusted);
    return out;
  }

  // Numeric equality: 1 == 1.0 == 10E-1, and -0 == 0.
  friend bool operator==(const number& a, const number& b) {
    const bool za = a.coef_.is_zero();
    const bool zb = b.coef_.is_zero();
    if (za || zb) return za && zb;
    if (a.negative_ != b.negative_) return false;
    if (a.exp_ == b.exp_) return a.coef_ == b.coef_;

    big_int ca = a.coef_;
    big_int cb = b.coef_;
    std::int64_t ea = a.exp_;
    std::int64_t eb = b.exp_;
    strip_trailing_zeros(ca, ea);
    strip_trailing_zeros(cb, eb);
    return ea == eb && ca == cb;
  }

  friend bool operator!=(const number& a, const number& b) { return !(a == b); }

  friend std::ostream& operator<<(std::ostream& os, const number& n) { return os << n.to_string(); }

private:
  static void strip_trailing_zeros(big_int& c, std::int64_t& e) {
    const big_int ten = 10;
    big_int q;
    big_int r;
    for (;;) {
      boost::multiprecision::divide_qr(c, ten, q, r);
      if (!r.is_zero()) return;
      c.swap(q);
      ++e;
    }
  }

  static big_int parse_digits(std::string_view digits) {
    // 18 decimal digits always fit in uint64; fold them in a block at a time.
    big_int out = 0;
    std::size_t i = 0;
    while (i < digits.size()) {
      const std::size_t take = (digits.size() - i < 18u) ? digits.size() - i : 18u;
      std::uint64_t block = 0;
      std::uint64_t scale = 1;
      for (std::size_t k = 0; k < take; ++k) {
        block = block * 10u + static_cast<std::uint64_t>(digits[i + k] - '0');
        scale *= 10u;
      }
      out *= scale;
      out += block;
      i += take;
    }
    return out;
  }

  big_int coef_{0};
  std::int64_t exp_{0};
  bool negative_{false};
  kind kind_{kind::integer};
};

inline std::optional<number> number::parse_integer(std::string_view token) {
  std::size_t i = 0;
  bool neg = false;
  if (i < token.size() && token[i] == '-') {
    neg = true;
    ++i;
  }
  if (i >= token.size()) return std::nullopt;
  if (token[i] == '0' && token.size() - i > 1) return std::nullopt;
  for (std::size_t k = i; k < token.size(); ++k) {
    if (!detail::is_digit(token[k])) return std::nullopt;
  }

  number n;
  n.coef_ = parse_digits(token.substr(i));
  // Negative zero is canonicalized for integers.
  n.negative_ = neg && !n.coef_.is_zero();
  return n;
}

inline std::optional<number> number::parse_decimal(std::string_view token) {
  // JSON number grammar:
  // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  constexpr std::uint64_t exp_limit = 1000000000000000000ull;
  const std::size_t size = token.size();
  std::size_t i = 0;
  if (i >= size) return std::nullopt;

  bool neg = false;
  if (token[i] == '-') {
    neg = true;
    ++i;
    if (i >= size) return std::nullopt;
  }

  const std::size_t int_begin = i;
  if (token[i] == '0') {
    ++i;
    if (i < size && detail::is_digit(token[i])) return std::nullopt;
  } else {
    if (token[i] < '1' || token[i] > '9') return std::nullopt;
    while (i < size && detail::is_digit(token[i])) ++i;
  }
  const std::size_t int_end = i;

  std::size_t frac_begin = i;
  std::size_t frac_end = i;
  if (i < size && token[i] == '.') {
    ++i;
    frac_begin = i;
    if (i >= size || !detail::is_digit(token[i])) return std::nullopt;
    while (i < size && detail::is_digit(token[i])) ++i;
    frac_end = i;
  }

  std::int64_t exp = 0;
  if (i < size && (token[i] == 'e' || token[i] == 'E')) {
    ++i;
    if (i >= size) return std::nullopt;
    bool exp_neg = false;
    if (token[i] == '+' || token[i] == '-') {
      exp_neg = token[i] == '-';
      ++i;
      if (i >= size) return std::nullopt;
    }
    if (!detail::is_digit(token[i])) return std::nullopt;
    std::uint64_t acc = 0;
    bool overflow = false;
    while (i < size && detail::is_digit(token[i])) {
      const auto d = static_cast<std::uint64_t>(token[i] - '0');
      if (acc > (exp_limit - d) / 10u) {
        overflow = true;
      } else {
        acc = acc * 10u + d;
      }
      ++i;
    }
    if (overflow) throw std::out_of_range("pulljson: number exponent out of range");
    exp = exp_neg ? -static_cast<std::int64_t>(acc) : static_cast<std::int64_t>(acc);
  }

  if (i != size) return std::nullopt;

  const std::size_t frac_len = frac_end - frac_begin;
  if (frac_len > exp_limit) throw std::out_of_range("pulljson: number exponent out of range");

  std::string digits;
  digits.reserve((int_end - int_begin) + frac_len);
  digits.append(token.data() + int_begin, int_end - int_begin);
  digits.append(token.data() + frac_begin, frac_len);

  number n;
  n.kind_ = kind::decimal;
  n.negative_ = neg;
  n.coef_ = parse_digits(digits);
  n.exp_ = exp - static_cast<std::int64_t>(frac_len);
  return n;
}

} // namespace pulljson
