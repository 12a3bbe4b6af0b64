// include/qsym/qmonomial.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "qsym/rational.hpp"

namespace qsym {

// coeff * q^power: the atomic building block of series parameters.
struct QMonomial {
  Rational coeff{1};
  std::int64_t power = 0;

  QMonomial() = default;
  QMonomial(Rational c, std::int64_t m) : coeff(std::move(c)), power(m) {}

  static QMonomial q_power(std::int64_t m) { return QMonomial(Rational(1), m); }
  static QMonomial constant(Rational c) { return QMonomial(std::move(c), 0); }

  // coeff * q^power at a concrete base.
  Rational eval(const Rational &q) const;

  // n when this monomial is exactly q^{-n} with n >= 0.
  std::optional<std::int64_t> neg_power_order() const;

  // Throws std::invalid_argument for a zero coefficient with exp < 0.
  QMonomial pow(std::int64_t exp) const;

  // Empty unless power is even and coeff is the square of a rational >= 0.
  std::optional<QMonomial> sqrt() const;

  std::string to_string() const;
};

QMonomial operator*(const QMonomial &a, const QMonomial &b);
// Throws std::invalid_argument when b has a zero coefficient.
QMonomial operator/(const QMonomial &a, const QMonomial &b);
QMonomial operator-(const QMonomial &a);
bool operator==(const QMonomial &a, const QMonomial &b);
bool operator!=(const QMonomial &a, const QMonomial &b);

// Accepts "c*q^m", "q^m", "q", "-q^m", "c". Throws std::invalid_argument.
QMonomial parse_qmonomial(const std::string &text);

} // namespace qsym
