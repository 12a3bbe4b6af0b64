// src/gosper.cpp
#include "qsym/gosper.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

#include "qsym/linalg.hpp"
#include "qsym/log.hpp"
#include "qsym/term_ratio.hpp"

namespace qsym {
namespace {

std::vector<std::int64_t> dispersion_from(const QPoly &a, const QPoly &b,
                                          const Rational &q, std::int64_t start) {
  std::vector<std::int64_t> out;
  if (a.degree() < 1 || b.degree() < 1)
    return out;
  const std::int64_t j_max =
      static_cast<std::int64_t>(a.degree()) * static_cast<std::int64_t>(b.degree());
  for (std::int64_t j = start; j <= j_max; ++j)
    if (poly_gcd(a, b.q_shift_n(q, j)).degree() >= 1)
      out.push_back(j);
  return out;
}

// Candidate degrees for f in sigma*f(qx) - tau*f(x) = c. When the degrees of
// sigma and tau agree, the leading terms cancel exactly for the d with
// q^d == lc(tau)/lc(sigma).
std::vector<std::size_t> degree_candidates(const QPoly &sigma, const QPoly &tau,
                                           const Rational &q, std::size_t d_c) {
  std::vector<std::size_t> out;
  const auto d_sigma = static_cast<std::size_t>(sigma.degree());
  const auto d_tau = static_cast<std::size_t>(tau.degree());
  auto add = [&out](std::size_t d) {
    if (std::find(out.begin(), out.end(), d) == out.end())
      out.push_back(d);
  };

  if (d_sigma != d_tau) {
    const std::size_t top = std::max(d_sigma, d_tau);
    if (d_c >= top)
      add(d_c - top);
    if (d_c + 1 >= top)
      add(d_c + 1 - top);
    return out;
  }

  Rational ratio = tau.leading_coeff() / sigma.leading_coeff();
  Rational qd(1);
  bool matched = false;
  for (std::size_t d = 0; d <= d_c; ++d) {
    if (qd == ratio) {
      add(d);
      matched = true;
      break;
    }
    qd *= q;
  }
  if (!matched || d_c >= d_sigma)
    add(d_c >= d_sigma ? d_c - d_sigma : 0);

  const std::vector<std::size_t> base = out;
  for (std::size_t d : base)
    add(d + 1);
  return out;
}

std::optional<QPoly> solve_with_degree(const QPoly &sigma, const QPoly &tau,
                                       const QPoly &c, const Rational &q,
                                       std::size_t deg_f) {
  const std::size_t unknowns = deg_f + 1;
  const std::size_t top =
      static_cast<std::size_t>(std::max({sigma.degree(), tau.degree(), 0})) + deg_f;
  const std::size_t equations =
      std::max(top, static_cast<std::size_t>(std::max(c.degree(), 0))) + 1;

  std::vector<Rational> q_pow(unknowns);
  q_pow[0] = 1;
  for (std::size_t j = 1; j < unknowns; ++j)
    q_pow[j] = q_pow[j - 1] * q;

  // Row k: coefficient of x^k in sigma(x) f(qx) - tau(x) f(x).
  Matrix a(equations, std::vector<Rational>(unknowns));
  std::vector<Rational> b(equations);
  for (std::size_t k = 0; k < equations; ++k) {
    for (std::size_t j = 0; j < unknowns && j <= k; ++j)
      a[k][j] = sigma.coeff(k - j) * q_pow[j] - tau.coeff(k - j);
    b[k] = c.coeff(k);
  }

  auto sol = solve_linear_system(a, b);
  if (!sol)
    return std::nullopt;
  return QPoly(std::move(*sol));
}

} // namespace

std::vector<std::int64_t> q_dispersion(const QPoly &a, const QPoly &b,
                                       const Rational &q) {
  return dispersion_from(a, b, q, 0);
}

std::vector<std::int64_t> q_dispersion_positive(const QPoly &a, const QPoly &b,
                                                const Rational &q) {
  return dispersion_from(a, b, q, 1);
}

GosperNormalForm gosper_normal_form(const QPoly &numer, const QPoly &denom,
                                    const Rational &q) {
  GosperNormalForm nf{numer, denom, QPoly::one()};
  for (;;) {
    auto disp = q_dispersion_positive(nf.sigma, nf.tau, q);
    if (disp.empty())
      break;
    const std::int64_t j = disp.back();

    QPoly g = poly_gcd(nf.sigma, nf.tau.q_shift_n(q, j));
    if (g.is_constant())
      break;

    // c(qx)/c(x) picks up g(x)/g(q^{-j}x).
    nf.sigma = nf.sigma.exact_div(g);
    nf.tau = nf.tau.exact_div(g.q_shift_n(q, -j));
    for (std::int64_t i = 1; i <= j; ++i)
      nf.c = nf.c * g.q_shift_n(q, -i);
  }
  return nf;
}

std::optional<QPoly> solve_key_equation(const QPoly &sigma, const QPoly &tau,
                                        const QPoly &c, const Rational &q) {
  if (c.is_zero())
    return QPoly::zero();
  const auto d_c = static_cast<std::size_t>(c.degree());

  if (sigma.is_zero() && tau.is_zero())
    return std::nullopt;

  if (sigma.is_zero()) {
    // -tau(x) f(x) = c(x)
    auto [quot, rem] = (-c).div_rem(tau);
    if (!rem.is_zero())
      return std::nullopt;
    return quot;
  }

  if (tau.is_zero()) {
    const auto d_sigma = static_cast<std::size_t>(sigma.degree());
    if (d_c < d_sigma)
      return std::nullopt;
    return solve_with_degree(sigma, tau, c, q, d_c - d_sigma);
  }

  for (std::size_t d : degree_candidates(sigma, tau, q, d_c))
    if (auto f = solve_with_degree(sigma, tau, c, q, d))
      return f;
  return std::nullopt;
}

GosperResult q_gosper(const HypergeometricSeries &series, const Rational &q) {
  GosperResult out;
  const RatFunc ratio = term_ratio(series, q);
  const GosperNormalForm nf = gosper_normal_form(ratio.numer(), ratio.denom(), q);

  // y(x) = tau(x/q) f(x) / c(x) turns y(qx) r(x) - y(x) = 1 into
  // sigma(x) f(qx) - tau(x/q) f(x) = c(x).
  const QPoly tau_back = nf.tau.q_shift_n(q, -1);
  auto f = solve_key_equation(nf.sigma, tau_back, nf.c, q);
  if (!f) {
    log::core()->debug("q_gosper: {} is not summable", series.to_string());
    return out;
  }
  out.summable = true;
  out.certificate = RatFunc(tau_back * *f, nf.c);
  log::core()->debug("q_gosper: certificate {}", out.certificate.to_string());
  return out;
}

} // namespace qsym
