// include/qsym/gosper.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "qsym/poly.hpp"
#include "qsym/ratfunc.hpp"
#include "qsym/rational.hpp"
#include "qsym/series.hpp"

namespace qsym {

// r(x) = sigma(x)/tau(x) * c(q*x)/c(x) with gcd(sigma(x), tau(q^j*x)) == 1
// for every positive j inside the dispersion bound.
struct GosperNormalForm {
  QPoly sigma;
  QPoly tau;
  QPoly c;
};

struct GosperResult {
  bool summable = false;
  // y(x) with S_k = y(q^k) * t_k and S_{k+1} - S_k = t_k. Zero when not
  // summable.
  RatFunc certificate;
};

// Sorted j in [0, deg(a)*deg(b)] with deg gcd(a(x), b(q^j*x)) >= 1. Empty
// when either input is zero or constant.
std::vector<std::int64_t> q_dispersion(const QPoly &a, const QPoly &b,
                                       const Rational &q);
// Same, starting at j = 1.
std::vector<std::int64_t> q_dispersion_positive(const QPoly &a, const QPoly &b,
                                                const Rational &q);

GosperNormalForm gosper_normal_form(const QPoly &numer, const QPoly &denom,
                                    const Rational &q);

// Polynomial f with sigma(x)*f(q*x) - tau(x)*f(x) = c(x), if one exists.
std::optional<QPoly> solve_key_equation(const QPoly &sigma, const QPoly &tau,
                                        const QPoly &c, const Rational &q);

// q-Gosper: decides whether the terms of the series have a q-hypergeometric
// antidifference at base q.
GosperResult q_gosper(const HypergeometricSeries &series, const Rational &q);

} // namespace qsym
