// src/ratfunc.cpp
#include "qsym/ratfunc.hpp"

#include <stdexcept>
#include <string>

namespace qsym {

RatFunc::RatFunc(const QPoly &numer, const QPoly &denom) {
  if (denom.is_zero())
    throw std::invalid_argument("RatFunc: zero denominator");
  if (numer.is_zero()) {
    den_ = QPoly::one();
    return;
  }
  QPoly g = poly_gcd(numer, denom);
  QPoly n = numer.exact_div(g);
  QPoly d = denom.exact_div(g);
  Rational lc = d.leading_coeff();
  num_ = n.scalar_div(lc);
  den_ = d.scalar_div(lc);
}

std::optional<Rational> RatFunc::eval(const Rational &x) const {
  Rational d = den_.eval(x);
  if (sgn(d) == 0)
    return std::nullopt;
  Rational v = num_.eval(x) / d;
  return v;
}

RatFunc RatFunc::q_shift(const Rational &q) const {
  return RatFunc(num_.q_shift(q), den_.q_shift(q));
}

RatFunc RatFunc::q_shift_n(const Rational &q, std::int64_t j) const {
  return RatFunc(num_.q_shift_n(q, j), den_.q_shift_n(q, j));
}

std::string RatFunc::to_string(const std::string &var) const {
  if (is_polynomial())
    return num_.to_string(var);
  return "(" + num_.to_string(var) + ")/(" + den_.to_string(var) + ")";
}

RatFunc operator+(const RatFunc &a, const RatFunc &b) {
  return RatFunc(a.numer() * b.denom() + b.numer() * a.denom(),
                 a.denom() * b.denom());
}

RatFunc operator-(const RatFunc &a, const RatFunc &b) {
  return RatFunc(a.numer() * b.denom() - b.numer() * a.denom(),
                 a.denom() * b.denom());
}

RatFunc operator*(const RatFunc &a, const RatFunc &b) {
  return RatFunc(a.numer() * b.numer(), a.denom() * b.denom());
}

RatFunc operator/(const RatFunc &a, const RatFunc &b) {
  if (b.is_zero())
    throw std::invalid_argument("RatFunc: division by zero");
  return RatFunc(a.numer() * b.denom(), a.denom() * b.numer());
}

RatFunc operator-(const RatFunc &a) { return RatFunc(-a.numer(), a.denom()); }

} // namespace qsym
