// include/qsym/ratfunc.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "qsym/poly.hpp"
#include "qsym/rational.hpp"

namespace qsym {

// numer/denom in lowest terms with a monic denominator, so structural
// equality is mathematical equality. Zero is 0/1.
class RatFunc {
public:
  RatFunc() : num_(), den_(QPoly::one()) {}
  // Throws std::invalid_argument if denom is zero.
  RatFunc(const QPoly &numer, const QPoly &denom);

  static RatFunc zero() { return RatFunc(); }
  static RatFunc one() { return from_rational(Rational(1)); }
  static RatFunc from_poly(const QPoly &p) { return RatFunc(p, QPoly::one()); }
  static RatFunc from_rational(const Rational &c) {
    return from_poly(QPoly::constant(c));
  }

  const QPoly &numer() const noexcept { return num_; }
  const QPoly &denom() const noexcept { return den_; }
  bool is_zero() const noexcept { return num_.is_zero(); }
  bool is_polynomial() const noexcept { return den_.degree() == 0; }

  // Empty at a pole.
  std::optional<Rational> eval(const Rational &x) const;

  // f(q*x) and f(q^j*x).
  RatFunc q_shift(const Rational &q) const;
  RatFunc q_shift_n(const Rational &q, std::int64_t j) const;

  std::string to_string(const std::string &var = "x") const;

  friend bool operator==(const RatFunc &a, const RatFunc &b) {
    return a.num_ == b.num_ && a.den_ == b.den_;
  }
  friend bool operator!=(const RatFunc &a, const RatFunc &b) { return !(a == b); }

private:
  QPoly num_;
  QPoly den_;
};

RatFunc operator+(const RatFunc &a, const RatFunc &b);
RatFunc operator-(const RatFunc &a, const RatFunc &b);
RatFunc operator*(const RatFunc &a, const RatFunc &b);
// Throws std::invalid_argument when b is zero.
RatFunc operator/(const RatFunc &a, const RatFunc &b);
RatFunc operator-(const RatFunc &a);

} // namespace qsym
