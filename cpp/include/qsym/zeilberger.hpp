// include/qsym/zeilberger.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "qsym/config.hpp"
#include "qsym/ratfunc.hpp"
#include "qsym/rational.hpp"
#include "qsym/series.hpp"

namespace qsym {

// sum_{j=0..order} coefficients[j] * S(n+j) = 0 with coefficients[order] == 1,
// proved by G(n,k) = certificate(q^k) * F(n,k).
struct ZeilbergerResult {
  bool found = false;
  std::size_t order = 0;
  std::vector<Rational> coefficients;
  RatFunc certificate;
};

// Called once per tried order with whether that order produced a recurrence.
using OrderCb = std::function<void(std::size_t order, bool solved)>;

// q-Zeilberger creative telescoping at a concrete base q. Tries orders
// 1..bounds.max_order and returns the first recurrence found; found == false
// when every order fails. Throws std::invalid_argument if the series has no
// upper parameter of the form q^{-n}.
ZeilbergerResult q_zeilberger(const HypergeometricSeries &series, const Rational &q,
                              const IndexDependence &dep,
                              const SearchBounds &bounds = {}, const OrderCb &cb = {});

// Independent check of
//   sum_j c_j F(n+j,k) == G(n,k+1) - G(n,k),  G(n,k) = R(q^k) F(n,k)
// for k = 0..max_k, with term values recomputed from the term ratios.
// Points where F(n,k) or F(n,k+1) is zero, or where R has a pole, are not
// checked. Throws std::invalid_argument for an empty coefficient vector.
bool verify_wz_certificate(const HypergeometricSeries &series, const Rational &q,
                           const IndexDependence &dep,
                           const std::vector<Rational> &coefficients,
                           const RatFunc &certificate, std::size_t max_k);

// sum_j coefficients[j] * values[j] == 0. Throws std::invalid_argument when
// the lengths differ.
bool check_recurrence_on_values(const std::vector<Rational> &values,
                                const std::vector<Rational> &coefficients);

// For n = n_start .. n_start+n_count-1: rebuild the series, re-derive a
// recurrence of order at most expected_order + 1 and check it against the
// directly summed S(n..n+d).
bool verify_recurrence(const SeriesBuilder &builder, std::size_t expected_order,
                       const Rational &q, std::int64_t n_start, std::size_t n_count,
                       const SearchBounds &bounds = {},
                       const IndexDetector &detector = detect_index_dependence);

} // namespace qsym
