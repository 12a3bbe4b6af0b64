// include/qsym/petkovsek.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "qsym/config.hpp"
#include "qsym/qmonomial.hpp"
#include "qsym/rational.hpp"

namespace qsym {

// scalar * q^{q_power_coeff * n(n-1)/2} * prod (a_i;q)_n / prod (b_j;q)_n
struct ClosedForm {
  Rational scalar{1};
  std::int64_t q_power_coeff = 0;
  std::vector<QMonomial> numer_factors;
  std::vector<QMonomial> denom_factors;
};

// One q-hypergeometric solution: S(n+1)/S(n) == ratio. closed_form is empty
// for geometric ratios q^m and for ratios with no small Pochhammer form.
struct PetkovsekSolution {
  Rational ratio;
  std::optional<ClosedForm> closed_form;
};

// Solves sum_j coeffs[j] * S(n+j) = 0 for constant-ratio solutions, i.e. the
// rational roots of the characteristic polynomial, sorted and distinct. The
// result is empty when no root is rational or the candidate search exceeds
// bounds. Throws std::invalid_argument for fewer than two coefficients or a
// zero leading coefficient.
std::vector<PetkovsekSolution> q_petkovsek(const std::vector<Rational> &coeffs,
                                           const Rational &q,
                                           const SearchBounds &bounds = {});

// (1-q^a)/(1-q^b) or a product of two such factors, searched over the ranges
// in bounds. Empty for zero, for q^m and for degenerate bases 0, 1, -1.
std::optional<ClosedForm> decompose_ratio(const Rational &ratio, const Rational &q,
                                          const SearchBounds &bounds = {});

} // namespace qsym
