// src/nonterminating.cpp
#include "qsym/nonterminating.hpp"

#include <utility>

#include "qsym/log.hpp"
#include "qsym/term_ratio.hpp"
#include "qsym/zeilberger.hpp"

namespace qsym {
namespace {

ProofResult fail(ProofFailure kind, std::int64_t at, std::string reason) {
  log::core()->debug("prove_nonterminating: {} ({})", reason, to_string(kind));
  ProofResult r;
  r.failure = kind;
  r.failed_at = at;
  r.reason = std::move(reason);
  return r;
}

} // namespace

const char *to_string(ProofFailure f) noexcept {
  switch (f) {
  case ProofFailure::none:
    return "none";
  case ProofFailure::not_terminating:
    return "not_terminating";
  case ProofFailure::no_recurrence:
    return "no_recurrence";
  case ProofFailure::recurrence_mismatch:
    return "recurrence_mismatch";
  case ProofFailure::initial_condition_mismatch:
    return "initial_condition_mismatch";
  }
  return "?";
}

ProofResult prove_nonterminating(const SeriesBuilder &lhs, const ValueBuilder &rhs,
                                 const Rational &q, std::int64_t n_test,
                                 const SearchBounds &bounds,
                                 const IndexDetector &detector) {
  const HypergeometricSeries base = lhs(n_test);
  if (!base.termination_order())
    return fail(ProofFailure::not_terminating, n_test,
                "left side at n = " + std::to_string(n_test) + " is not terminating");

  const ZeilbergerResult zr = q_zeilberger(base, q, detector(base, n_test, q), bounds);
  if (!zr.found)
    return fail(ProofFailure::no_recurrence, n_test,
                "no recurrence for the left side up to order " +
                    std::to_string(bounds.max_order));
  const std::size_t d = zr.order;

  std::vector<std::int64_t> checks{n_test};
  if (n_test >= 2)
    checks = {n_test - 2, n_test - 1, n_test};

  for (std::int64_t nv : checks) {
    const HypergeometricSeries s = lhs(nv);
    if (!s.termination_order())
      continue;
    const ZeilbergerResult local = q_zeilberger(s, q, detector(s, nv, q), bounds);
    if (!local.found)
      return fail(ProofFailure::no_recurrence, nv,
                  "no recurrence for the left side at n = " + std::to_string(nv));

    std::vector<Rational> values;
    values.reserve(local.order + 1);
    for (std::size_t j = 0; j <= local.order; ++j)
      values.push_back(rhs(nv + static_cast<std::int64_t>(j)));
    if (!check_recurrence_on_values(values, local.coefficients))
      return fail(ProofFailure::recurrence_mismatch, nv,
                  "right side does not satisfy the recurrence at n = " +
                      std::to_string(nv));
  }

  for (std::size_t n = 0; n <= d; ++n) {
    const auto ni = static_cast<std::int64_t>(n);
    if (definite_sum(lhs(ni), q, bounds.max_terms) != rhs(ni))
      return fail(ProofFailure::initial_condition_mismatch, ni,
                  "initial condition mismatch at n = " + std::to_string(n));
  }

  ProofResult out;
  out.proved = true;
  out.order = d;
  out.coefficients = zr.coefficients;
  out.initial_conditions_checked = d + 1;
  return out;
}

} // namespace qsym
