// src/zeilberger.cpp
#include "qsym/zeilberger.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "qsym/gosper.hpp"
#include "qsym/linalg.hpp"
#include "qsym/log.hpp"
#include "qsym/term_ratio.hpp"

namespace qsym {
namespace {

struct Telescoper {
  std::vector<Rational> coefficients; // c_0..c_d, c_d == 1
  std::vector<Rational> g;            // g_1..g_M
};

// F(n+j, k) for j = 0..d and k = 0..count-1.
std::vector<std::vector<Rational>> shifted_term_values(const HypergeometricSeries &series,
                                                       const Rational &q,
                                                       const IndexDependence &dep,
                                                       std::size_t d, std::size_t count) {
  std::vector<std::vector<Rational>> f;
  f.reserve(d + 1);
  for (std::size_t j = 0; j <= d; ++j) {
    const HypergeometricSeries s =
        j == 0 ? series : series.shifted(static_cast<std::int64_t>(j), dep);
    f.push_back(term_values(term_ratio(s, q), q, count));
  }
  return f;
}

// Unknowns g_1..g_M then c_0..c_{d-1}; one equation per k = 0..M:
//   g_{k+1} - g_k - sum_{j<d} c_j F(n+j,k) = F(n+d,k),  g_0 = g_{M+1} = 0.
std::optional<Telescoper> solve_telescoper(const HypergeometricSeries &series,
                                           const Rational &q, const IndexDependence &dep,
                                           std::size_t d, std::size_t max_k) {
  const auto f = shifted_term_values(series, q, dep, d, max_k + 1);

  std::size_t last = 0;
  for (std::size_t j = 0; j <= d; ++j)
    for (std::size_t k = 0; k <= max_k; ++k)
      if (sgn(f[j][k]) != 0)
        last = std::max(last, k);

  if (last == max_k) {
    log::core()->debug("q_zeilberger: order {} terms still nonzero at k = {}", d, max_k);
    return std::nullopt;
  }
  if (last == 0)
    return std::nullopt;

  const std::size_t m = last;
  Matrix a(m + 1, std::vector<Rational>(m + d));
  std::vector<Rational> b(m + 1);
  for (std::size_t k = 0; k <= m; ++k) {
    if (k + 1 <= m)
      a[k][k] += 1;
    if (k >= 1)
      a[k][k - 1] -= 1;
    for (std::size_t j = 0; j < d; ++j)
      a[k][m + j] = -f[j][k];
    b[k] = f[d][k];
  }

  auto sol = solve_linear_system(a, b);
  if (!sol)
    return std::nullopt;

  Telescoper t;
  t.g.assign(sol->begin(), sol->begin() + static_cast<std::ptrdiff_t>(m));
  t.coefficients.assign(sol->begin() + static_cast<std::ptrdiff_t>(m), sol->end());
  // c_d is fixed to 1, so the recurrence is never the zero vector; free c_j
  // come back as 0.
  t.coefficients.emplace_back(1);
  return t;
}

// R(q^k) = g_k / F(n,k) at every sampled k with F(n,k) != 0, R(1) = 0. The
// numerator f = R*c is interpolated through those points, c being the Gosper
// adjustment polynomial of the base term ratio.
RatFunc reconstruct_certificate(const HypergeometricSeries &series, const Rational &q,
                                const std::vector<Rational> &g) {
  const RatFunc ratio = term_ratio(series, q);
  const GosperNormalForm nf = gosper_normal_form(ratio.numer(), ratio.denom(), q);
  const auto f0 = term_values(ratio, q, g.size() + 1);

  std::vector<std::pair<Rational, Rational>> points;
  points.reserve(g.size() + 1);
  points.emplace_back(Rational(1), Rational(0));
  Rational qk(1);
  for (std::size_t k = 1; k <= g.size(); ++k) {
    qk *= q;
    if (sgn(f0[k]) == 0)
      break;
    Rational y = g[k - 1] / f0[k];
    y *= nf.c.eval(qk);
    points.emplace_back(qk, std::move(y));
  }
  return RatFunc(lagrange_interpolate(points), nf.c);
}

} // namespace

ZeilbergerResult q_zeilberger(const HypergeometricSeries &series, const Rational &q,
                              const IndexDependence &dep, const SearchBounds &bounds,
                              const OrderCb &cb) {
  if (!series.termination_order())
    throw std::invalid_argument("q_zeilberger: series is not terminating: " +
                                series.to_string());
  if (sgn(q) == 0 || q == 1 || q == -1)
    throw std::invalid_argument("q_zeilberger: base must not be 0 or +-1");

  ZeilbergerResult out;
  for (std::size_t d = 1; d <= bounds.max_order; ++d) {
    auto t = solve_telescoper(series, q, dep, d, bounds.max_k);
    if (cb)
      cb(d, t.has_value());
    if (!t)
      continue;

    out.found = true;
    out.order = d;
    out.coefficients = std::move(t->coefficients);
    out.certificate = reconstruct_certificate(series, q, t->g);
    log::core()->debug("q_zeilberger: order {} recurrence, certificate {}", d,
                       out.certificate.to_string());
    return out;
  }
  log::core()->debug("q_zeilberger: no recurrence up to order {}", bounds.max_order);
  return out;
}

bool verify_wz_certificate(const HypergeometricSeries &series, const Rational &q,
                           const IndexDependence &dep,
                           const std::vector<Rational> &coefficients,
                           const RatFunc &certificate, std::size_t max_k) {
  if (coefficients.empty())
    throw std::invalid_argument("verify_wz_certificate: empty coefficient vector");
  const std::size_t d = coefficients.size() - 1;
  const auto f = shifted_term_values(series, q, dep, d, max_k + 2);

  Rational qk(1);
  for (std::size_t k = 0; k <= max_k; ++k, qk *= q) {
    Rational lhs(0);
    for (std::size_t j = 0; j <= d; ++j)
      lhs += coefficients[j] * f[j][k];

    // Past the base term's termination G is 0/0 in this representation; a
    // nonzero left side here is not checkable.
    if (sgn(f[0][k]) == 0) {
      if (sgn(lhs) != 0)
        log::core()->debug("verify_wz_certificate: unchecked dead zone at k = {}", k);
      continue;
    }

    auto r_k = certificate.eval(qk);
    if (!r_k)
      continue;
    if (sgn(f[0][k + 1]) == 0)
      continue;
    const Rational qk1 = qk * q;
    auto r_k1 = certificate.eval(qk1);
    if (!r_k1)
      continue;

    const Rational rhs = *r_k1 * f[0][k + 1] - *r_k * f[0][k];
    if (lhs != rhs) {
      log::core()->debug("verify_wz_certificate: mismatch at k = {}", k);
      return false;
    }
  }
  return true;
}

bool check_recurrence_on_values(const std::vector<Rational> &values,
                                const std::vector<Rational> &coefficients) {
  if (values.size() != coefficients.size())
    throw std::invalid_argument("check_recurrence_on_values: " +
                                std::to_string(values.size()) + " values for " +
                                std::to_string(coefficients.size()) + " coefficients");
  Rational acc(0);
  for (std::size_t j = 0; j < values.size(); ++j)
    acc += coefficients[j] * values[j];
  return sgn(acc) == 0;
}

bool verify_recurrence(const SeriesBuilder &builder, std::size_t expected_order,
                       const Rational &q, std::int64_t n_start, std::size_t n_count,
                       const SearchBounds &bounds, const IndexDetector &detector) {
  SearchBounds b = bounds;
  b.max_order = expected_order + 1;
  for (std::size_t i = 0; i < n_count; ++i) {
    const std::int64_t n = n_start + static_cast<std::int64_t>(i);
    const HypergeometricSeries s = builder(n);
    const ZeilbergerResult zr = q_zeilberger(s, q, detector(s, n, q), b);
    if (!zr.found)
      return false;

    std::vector<Rational> values;
    values.reserve(zr.order + 1);
    for (std::size_t j = 0; j <= zr.order; ++j)
      values.push_back(definite_sum(builder(n + static_cast<std::int64_t>(j)), q,
                                    bounds.max_terms));
    if (!check_recurrence_on_values(values, zr.coefficients))
      return false;
  }
  return true;
}

} // namespace qsym
