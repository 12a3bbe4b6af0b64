// src/poly.cpp
#include "qsym/poly.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace qsym {

QPoly::QPoly(std::vector<Rational> coeffs) : c_(std::move(coeffs)) { trim(); }

void QPoly::trim() {
  while (!c_.empty() && sgn(c_.back()) == 0)
    c_.pop_back();
}

QPoly QPoly::constant(const Rational &c) { return QPoly(std::vector<Rational>{c}); }

QPoly QPoly::x() { return monomial(Rational(1), 1); }

QPoly QPoly::monomial(const Rational &c, std::size_t deg) {
  std::vector<Rational> v(deg + 1);
  v[deg] = c;
  return QPoly(std::move(v));
}

QPoly QPoly::linear(const Rational &c0, const Rational &c1) {
  return QPoly(std::vector<Rational>{c0, c1});
}

QPoly QPoly::from_ints(std::initializer_list<long> coeffs) {
  std::vector<Rational> v;
  v.reserve(coeffs.size());
  for (long c : coeffs)
    v.emplace_back(c);
  return QPoly(std::move(v));
}

Rational QPoly::coeff(std::size_t i) const {
  return i < c_.size() ? c_[i] : Rational(0);
}

Rational QPoly::leading_coeff() const {
  return c_.empty() ? Rational(0) : c_.back();
}

QPoly QPoly::scalar_mul(const Rational &c) const {
  if (sgn(c) == 0)
    return QPoly();
  std::vector<Rational> v(c_.size());
  for (std::size_t i = 0; i < c_.size(); ++i)
    v[i] = c_[i] * c;
  return QPoly(std::move(v));
}

QPoly QPoly::scalar_div(const Rational &c) const {
  if (sgn(c) == 0)
    throw std::invalid_argument("QPoly::scalar_div: division by zero");
  std::vector<Rational> v(c_.size());
  for (std::size_t i = 0; i < c_.size(); ++i)
    v[i] = c_[i] / c;
  return QPoly(std::move(v));
}

QPoly QPoly::make_monic() const {
  if (c_.empty() || c_.back() == 1)
    return *this;
  return scalar_div(c_.back());
}

Rational QPoly::eval(const Rational &x) const {
  Rational acc(0);
  for (auto it = c_.rbegin(); it != c_.rend(); ++it)
    acc = acc * x + *it;
  return acc;
}

QPoly QPoly::q_shift(const Rational &q) const {
  if (c_.empty() || q == 1)
    return *this;
  std::vector<Rational> v(c_.size());
  Rational qi(1);
  for (std::size_t i = 0; i < c_.size(); ++i) {
    v[i] = c_[i] * qi;
    qi *= q;
  }
  return QPoly(std::move(v));
}

QPoly QPoly::q_shift_n(const Rational &q, std::int64_t j) const {
  if (j == 0 || c_.empty())
    return *this;
  return q_shift(qsym::pow(q, j));
}

std::pair<QPoly, QPoly> QPoly::div_rem(const QPoly &divisor) const {
  if (divisor.is_zero())
    throw std::invalid_argument("QPoly::div_rem: division by zero polynomial");
  if (degree() < divisor.degree())
    return {QPoly(), *this};

  std::vector<Rational> rem = c_;
  const std::size_t dd = divisor.c_.size() - 1;
  const Rational &lc = divisor.c_.back();
  std::vector<Rational> quot(c_.size() - dd);

  for (std::size_t i = quot.size(); i-- > 0;) {
    const Rational &top = rem[i + dd];
    if (sgn(top) == 0)
      continue;
    Rational f = top / lc;
    for (std::size_t k = 0; k <= dd; ++k)
      rem[i + k] -= f * divisor.c_[k];
    quot[i] = f;
  }
  return {QPoly(std::move(quot)), QPoly(std::move(rem))};
}

QPoly QPoly::exact_div(const QPoly &divisor) const {
  auto [q, r] = div_rem(divisor);
  if (!r.is_zero())
    throw std::logic_error("QPoly::exact_div: non-zero remainder");
  return q;
}

std::string QPoly::to_string(const std::string &var) const {
  if (c_.empty())
    return "0";
  std::string out;
  for (std::size_t i = c_.size(); i-- > 0;) {
    const Rational &c = c_[i];
    if (sgn(c) == 0)
      continue;
    Rational mag = abs(c);
    if (out.empty())
      out += sgn(c) < 0 ? "-" : "";
    else
      out += sgn(c) < 0 ? " - " : " + ";
    const bool unit = mag == 1 && i > 0;
    if (!unit)
      out += qsym::to_string(mag);
    if (i > 0) {
      if (!unit)
        out += "*";
      out += var;
      if (i > 1)
        out += "^" + std::to_string(i);
    }
  }
  return out;
}

QPoly operator+(const QPoly &a, const QPoly &b) {
  const auto &ac = a.coeffs();
  const auto &bc = b.coeffs();
  std::vector<Rational> v(std::max(ac.size(), bc.size()));
  for (std::size_t i = 0; i < v.size(); ++i)
    v[i] = a.coeff(i) + b.coeff(i);
  return QPoly(std::move(v));
}

QPoly operator-(const QPoly &a, const QPoly &b) {
  const auto &ac = a.coeffs();
  const auto &bc = b.coeffs();
  std::vector<Rational> v(std::max(ac.size(), bc.size()));
  for (std::size_t i = 0; i < v.size(); ++i)
    v[i] = a.coeff(i) - b.coeff(i);
  return QPoly(std::move(v));
}

QPoly operator*(const QPoly &a, const QPoly &b) {
  if (a.is_zero() || b.is_zero())
    return QPoly();
  const auto &ac = a.coeffs();
  const auto &bc = b.coeffs();
  std::vector<Rational> v(ac.size() + bc.size() - 1);
  for (std::size_t i = 0; i < ac.size(); ++i) {
    if (sgn(ac[i]) == 0)
      continue;
    for (std::size_t j = 0; j < bc.size(); ++j)
      v[i + j] += ac[i] * bc[j];
  }
  return QPoly(std::move(v));
}

QPoly operator-(const QPoly &a) { return a.scalar_mul(Rational(-1)); }

QPoly poly_gcd(const QPoly &a, const QPoly &b) {
  // Euclid over Q, renormalizing to monic after each step to keep the
  // remainder coefficients small.
  QPoly u = a.make_monic();
  QPoly v = b.make_monic();
  while (!v.is_zero()) {
    QPoly r = u.div_rem(v).second;
    u = std::move(v);
    v = r.make_monic();
  }
  return u;
}

QPoly lagrange_interpolate(
    const std::vector<std::pair<Rational, Rational>> &points) {
  for (std::size_t i = 0; i < points.size(); ++i)
    for (std::size_t j = i + 1; j < points.size(); ++j)
      if (points[i].first == points[j].first)
        throw std::invalid_argument("lagrange_interpolate: repeated abscissa");

  QPoly out;
  for (std::size_t i = 0; i < points.size(); ++i) {
    const auto &[xi, yi] = points[i];
    if (sgn(yi) == 0)
      continue;
    QPoly basis = QPoly::one();
    Rational denom(1);
    for (std::size_t j = 0; j < points.size(); ++j) {
      if (j == i)
        continue;
      const Rational &xj = points[j].first;
      basis = basis * QPoly::linear(-xj, Rational(1));
      denom *= xi - xj;
    }
    Rational scale = yi / denom;
    out = out + basis.scalar_mul(scale);
  }
  return out;
}

} // namespace qsym
