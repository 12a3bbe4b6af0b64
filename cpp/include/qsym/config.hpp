// include/qsym/config.hpp
#pragma once
#include <cstddef>
#include <cstdint>

namespace qsym {

// Hard upper bounds for every search in the core. Rational sizes grow with
// each arithmetic step, so callers that need tighter cost control lower these
// rather than relying on any memory ceiling.
struct SearchBounds {
  std::size_t max_order = 3;   // largest recurrence order q_zeilberger tries
  std::size_t max_k = 50;      // term-index window for telescoping systems
  std::size_t max_terms = 100; // cap for direct finite summation

  // q-Petkovsek rational-root search
  std::size_t root_candidate_cap = 5000;   // |divisors(c_0)| * |divisors(c_d)|
  std::uint64_t divisor_trial_cap = 10000; // trial-division limit per integer

  // Closed-form decomposition search ranges
  std::int64_t geometric_power_range = 20; // ratio == q^m, |m| <= range
  std::int64_t single_factor_range = 10;   // (1-q^a)/(1-q^b)
  std::int64_t double_factor_range = 6;    // two-factor products
};

} // namespace qsym
