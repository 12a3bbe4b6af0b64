// include/qsym/poly.hpp
#pragma once
#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "qsym/rational.hpp"

namespace qsym {

// Dense univariate polynomial over Q, lowest degree first. Trailing zero
// coefficients are always trimmed, so the zero polynomial is empty.
class QPoly {
public:
  QPoly() = default;
  explicit QPoly(std::vector<Rational> coeffs);

  static QPoly zero() { return QPoly(); }
  static QPoly one() { return constant(Rational(1)); }
  static QPoly constant(const Rational &c);
  static QPoly x();
  static QPoly monomial(const Rational &c, std::size_t deg);
  // c0 + c1*x
  static QPoly linear(const Rational &c0, const Rational &c1);
  static QPoly from_ints(std::initializer_list<long> coeffs);

  // -1 for the zero polynomial.
  int degree() const noexcept { return static_cast<int>(c_.size()) - 1; }
  bool is_zero() const noexcept { return c_.empty(); }
  bool is_constant() const noexcept { return c_.size() <= 1; }
  const std::vector<Rational> &coeffs() const noexcept { return c_; }
  Rational coeff(std::size_t i) const;
  // Zero for the zero polynomial.
  Rational leading_coeff() const;

  QPoly scalar_mul(const Rational &c) const;
  // Throws std::invalid_argument if c == 0.
  QPoly scalar_div(const Rational &c) const;
  QPoly make_monic() const;

  Rational eval(const Rational &x) const;

  // p(q*x) and p(q^j*x).
  QPoly q_shift(const Rational &q) const;
  QPoly q_shift_n(const Rational &q, std::int64_t j) const;

  // Throws std::invalid_argument for a zero divisor.
  std::pair<QPoly, QPoly> div_rem(const QPoly &divisor) const;
  // Throws std::logic_error when the division leaves a remainder.
  QPoly exact_div(const QPoly &divisor) const;

  std::string to_string(const std::string &var = "x") const;

  friend bool operator==(const QPoly &a, const QPoly &b) { return a.c_ == b.c_; }
  friend bool operator!=(const QPoly &a, const QPoly &b) { return !(a == b); }

private:
  void trim();
  std::vector<Rational> c_;
};

QPoly operator+(const QPoly &a, const QPoly &b);
QPoly operator-(const QPoly &a, const QPoly &b);
QPoly operator*(const QPoly &a, const QPoly &b);
QPoly operator-(const QPoly &a);

// Monic gcd over Q; gcd(0, 0) == 0.
QPoly poly_gcd(const QPoly &a, const QPoly &b);

// Unique polynomial of degree < points.size() through (x_i, y_i).
// Throws std::invalid_argument on a repeated abscissa.
QPoly lagrange_interpolate(const std::vector<std::pair<Rational, Rational>> &points);

} // namespace qsym
