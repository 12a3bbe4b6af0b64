// include/qsym/series.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "qsym/qmonomial.hpp"
#include "qsym/rational.hpp"

namespace qsym {

// Which parameters of a series move with the summation-free index n.
// Upper positions shift q^{-n} -> q^{-(n+j)}; a flagged argument shifts
// z -> z*q^j.
struct IndexDependence {
  std::vector<std::size_t> upper;
  bool argument = false;
};

// _r phi_s (a_1..a_r; b_1..b_s; q, z), term ratio
//   t_{k+1}/t_k = prod(1 - a_i q^k) / ((1 - q^{k+1}) prod(1 - b_j q^k))
//                 * ((-1) q^k)^{1+s-r} * z
struct HypergeometricSeries {
  std::vector<QMonomial> upper;
  std::vector<QMonomial> lower;
  QMonomial argument;

  std::size_t r() const noexcept { return upper.size(); }
  std::size_t s() const noexcept { return lower.size(); }
  std::int64_t extra_exponent() const noexcept {
    return 1 + static_cast<std::int64_t>(s()) - static_cast<std::int64_t>(r());
  }

  // Smallest n such that some upper parameter is q^{-n}.
  std::optional<std::int64_t> termination_order() const;

  // The series at n+j. Throws std::invalid_argument for a position that is
  // not an upper parameter.
  HypergeometricSeries shifted(std::int64_t j, const IndexDependence &dep) const;

  std::string to_string() const;
};

// Builds the series (or a concrete value) for a given n.
using SeriesBuilder = std::function<HypergeometricSeries(std::int64_t)>;
using ValueBuilder = std::function<Rational(std::int64_t)>;

// Caller-supplied detection of index-dependent parameters.
using IndexDetector = std::function<IndexDependence(
    const HypergeometricSeries &, std::int64_t n, const Rational &q)>;

// Default heuristic: upper parameters whose value at q equals q^{-n}, and the
// argument when its q-power is non-zero. Works for the standard terminating
// shapes (q-Vandermonde, q-Saalschutz, 1phi0); non-standard shapes should
// pass their own IndexDependence.
IndexDependence detect_index_dependence(const HypergeometricSeries &series,
                                        std::int64_t n, const Rational &q);

} // namespace qsym
