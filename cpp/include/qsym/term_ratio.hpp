// include/qsym/term_ratio.hpp
#pragma once
#include <cstddef>
#include <vector>

#include "qsym/ratfunc.hpp"
#include "qsym/rational.hpp"
#include "qsym/series.hpp"

namespace qsym {

// t_{k+1}/t_k of the series at base q, as a rational function of x = q^k.
RatFunc term_ratio(const HypergeometricSeries &series, const Rational &q);

// F(0..count-1) with F(0) = 1 and F(k+1) = F(k) * ratio(q^k). A pole of the
// ratio makes that term and all later ones zero.
std::vector<Rational> term_values(const RatFunc &ratio, const Rational &q,
                                  std::size_t count);

// sum_k t_k by direct accumulation, stopping once the ratio vanishes or has
// a pole, or after max_terms ratio steps.
Rational definite_sum(const HypergeometricSeries &series, const Rational &q,
                      std::size_t max_terms);

} // namespace qsym
