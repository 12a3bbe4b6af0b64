// src/term_ratio.cpp
#include "qsym/term_ratio.hpp"

#include <cstdint>

namespace qsym {

RatFunc term_ratio(const HypergeometricSeries &series, const Rational &q) {
  QPoly numer = QPoly::one();
  for (const auto &a : series.upper)
    numer = numer * QPoly::linear(Rational(1), -a.eval(q));

  // (q;q)_k contributes the (1 - q*x) factor.
  QPoly denom = QPoly::linear(Rational(1), -q);
  for (const auto &b : series.lower)
    denom = denom * QPoly::linear(Rational(1), -b.eval(q));

  // ((-1)^e x^e) * z with e = 1 + s - r.
  const std::int64_t e = series.extra_exponent();
  Rational extra = series.argument.eval(q);
  if (e % 2 != 0)
    extra = -extra;

  if (e >= 0) {
    numer = numer * QPoly::monomial(extra, static_cast<std::size_t>(e));
  } else {
    denom = denom * QPoly::monomial(Rational(1), static_cast<std::size_t>(-e));
    numer = numer.scalar_mul(extra);
  }
  return RatFunc(numer, denom);
}

std::vector<Rational> term_values(const RatFunc &ratio, const Rational &q,
                                  std::size_t count) {
  std::vector<Rational> out;
  if (count == 0)
    return out;
  out.reserve(count);
  out.emplace_back(1);
  Rational term(1);
  Rational qk(1);
  for (std::size_t k = 0; k + 1 < count; ++k) {
    if (sgn(term) != 0) {
      auto r = ratio.eval(qk);
      term = r ? Rational(term * *r) : Rational(0);
    }
    out.push_back(term);
    qk *= q;
  }
  return out;
}

Rational definite_sum(const HypergeometricSeries &series, const Rational &q,
                      std::size_t max_terms) {
  const RatFunc ratio = term_ratio(series, q);
  Rational sum(1);
  Rational term(1);
  Rational qk(1);
  for (std::size_t k = 0; k < max_terms; ++k) {
    auto r = ratio.eval(qk);
    if (!r || sgn(*r) == 0)
      break;
    term *= *r;
    sum += term;
    qk *= q;
  }
  return sum;
}

} // namespace qsym
