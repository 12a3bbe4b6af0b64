// include/qsym/nonterminating.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "qsym/config.hpp"
#include "qsym/rational.hpp"
#include "qsym/series.hpp"

namespace qsym {

enum class ProofFailure {
  none,
  not_terminating,            // lhs(n_test) has no q^{-n} parameter
  no_recurrence,              // q_zeilberger found nothing at failed_at
  recurrence_mismatch,        // rhs values violate the lhs recurrence at failed_at
  initial_condition_mismatch, // direct sum != rhs at n = failed_at
};

const char *to_string(ProofFailure f) noexcept;

struct ProofResult {
  bool proved = false;
  std::size_t order = 0;
  std::vector<Rational> coefficients;
  std::size_t initial_conditions_checked = 0;

  ProofFailure failure = ProofFailure::none;
  std::int64_t failed_at = 0;
  std::string reason; // empty when proved
};

// Chen-Hou-Mu style proof that sum lhs(n) == rhs(n) for all n >= 0: lhs(n)
// must terminate through a q^{-n} parameter. The recurrence found at n_test is
// re-derived at n_test-2..n_test and checked against rhs, then the initial
// values n = 0..order are compared by direct summation.
ProofResult prove_nonterminating(const SeriesBuilder &lhs, const ValueBuilder &rhs,
                                 const Rational &q, std::int64_t n_test,
                                 const SearchBounds &bounds = {},
                                 const IndexDetector &detector = detect_index_dependence);

} // namespace qsym
