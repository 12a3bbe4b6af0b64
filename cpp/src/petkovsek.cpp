// src/petkovsek.cpp
#include "qsym/petkovsek.hpp"

#include <algorithm>
#include <gmp.h>
#include <stdexcept>
#include <string>

#include "qsym/log.hpp"

namespace qsym {
namespace {

// Sorted positive divisors of |n| by trial division up to
// min(sqrt(|n|), trial_cap). Past the cap only the cofactors of the small
// divisors tried so far are found; |n| itself always is.
std::vector<mpz_class> positive_divisors(const mpz_class &n, std::uint64_t trial_cap) {
  std::vector<mpz_class> out;
  mpz_class abs_n = abs(n);
  mpz_class root;
  mpz_sqrt(root.get_mpz_t(), abs_n.get_mpz_t());
  if (mpz_cmp_ui(root.get_mpz_t(), static_cast<unsigned long>(trial_cap)) > 0) {
    log::core()->debug("q_petkovsek: trial division of {} stops at {}", abs_n.get_str(),
                       trial_cap);
    root = static_cast<unsigned long>(trial_cap);
  }

  const unsigned long limit = mpz_get_ui(root.get_mpz_t());
  for (unsigned long i = 1; i <= limit; ++i) {
    if (!mpz_divisible_ui_p(abs_n.get_mpz_t(), i))
      continue;
    mpz_class quot;
    mpz_divexact_ui(quot.get_mpz_t(), abs_n.get_mpz_t(), i);
    out.emplace_back(i);
    if (quot != i)
      out.push_back(quot);
  }
  std::sort(out.begin(), out.end());
  return out;
}

Rational eval_char_poly(const std::vector<Rational> &coeffs, const Rational &r) {
  Rational acc = coeffs.back();
  for (std::size_t j = coeffs.size() - 1; j-- > 0;) {
    acc *= r;
    acc += coeffs[j];
  }
  return acc;
}

// Distinct rational roots of coeffs[0] + coeffs[1] r + ... (degree >= 1,
// nonzero leading coefficient), unsorted.
std::optional<std::vector<Rational>> rational_roots(const std::vector<Rational> &coeffs,
                                                    const SearchBounds &bounds) {
  const std::size_t d = coeffs.size() - 1;
  if (d == 1)
    return std::vector<Rational>{Rational(-coeffs[0] / coeffs[1])};

  if (sgn(coeffs[0]) == 0) {
    auto rest = rational_roots(std::vector<Rational>(coeffs.begin() + 1, coeffs.end()),
                               bounds);
    if (!rest)
      return std::nullopt;
    rest->emplace_back(0);
    return rest;
  }

  mpz_class lcm(1);
  for (const auto &c : coeffs)
    mpz_lcm(lcm.get_mpz_t(), lcm.get_mpz_t(), c.get_den_mpz_t());
  auto scaled = [&lcm](const Rational &c) {
    Rational s = c * Rational(lcm);
    return mpz_class(s.get_num());
  };

  auto p_divs = positive_divisors(scaled(coeffs[0]), bounds.divisor_trial_cap);
  auto s_divs = positive_divisors(scaled(coeffs[d]), bounds.divisor_trial_cap);
  if (p_divs.size() * s_divs.size() > bounds.root_candidate_cap) {
    log::core()->debug("q_petkovsek: {} candidate roots exceed cap {}",
                       p_divs.size() * s_divs.size(), bounds.root_candidate_cap);
    return std::nullopt;
  }

  std::vector<Rational> candidates;
  candidates.reserve(2 * p_divs.size() * s_divs.size());
  for (const auto &p : p_divs)
    for (const auto &s : s_divs) {
      Rational c(p, s);
      c.canonicalize();
      candidates.push_back(c);
      candidates.push_back(-c);
    }
  std::sort(candidates.begin(), candidates.end());
  candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

  std::vector<Rational> roots;
  for (const auto &c : candidates)
    if (sgn(eval_char_poly(coeffs, c)) == 0)
      roots.push_back(c);
  return roots;
}

ClosedForm pochhammer_form(std::vector<std::int64_t> a, std::vector<std::int64_t> b) {
  ClosedForm cf;
  for (auto e : a)
    cf.numer_factors.push_back(QMonomial::q_power(e));
  for (auto e : b)
    cf.denom_factors.push_back(QMonomial::q_power(e));
  return cf;
}

} // namespace

std::optional<ClosedForm> decompose_ratio(const Rational &ratio, const Rational &q,
                                          const SearchBounds &bounds) {
  if (sgn(ratio) == 0 || sgn(q) == 0 || q == 1 || q == -1)
    return std::nullopt;

  const std::int64_t g = bounds.geometric_power_range;
  for (std::int64_t m = -g; m <= g; ++m)
    if (ratio == pow(q, m))
      return std::nullopt;

  // 1 - q^e for e in [-range, range], zero slot at e == 0.
  auto one_minus = [&q](std::int64_t range) {
    std::vector<Rational> v;
    for (std::int64_t e = -range; e <= range; ++e)
      v.push_back(e == 0 ? Rational(0) : Rational(1 - pow(q, e)));
    return v;
  };

  const std::int64_t r1 = bounds.single_factor_range;
  const auto f1 = one_minus(r1);
  for (std::int64_t a = -r1; a <= r1; ++a) {
    const Rational &na = f1[static_cast<std::size_t>(a + r1)];
    if (sgn(na) == 0)
      continue;
    for (std::int64_t b = -r1; b <= r1; ++b) {
      const Rational &db = f1[static_cast<std::size_t>(b + r1)];
      if (sgn(db) == 0)
        continue;
      if (ratio == na / db)
        return pochhammer_form({a}, {b});
    }
  }

  const std::int64_t r2 = bounds.double_factor_range;
  const auto f2 = one_minus(r2);
  auto at = [&f2, r2](std::int64_t e) -> const Rational & {
    return f2[static_cast<std::size_t>(e + r2)];
  };
  for (std::int64_t a1 = -r2; a1 <= r2; ++a1) {
    if (sgn(at(a1)) == 0)
      continue;
    for (std::int64_t a2 = a1; a2 <= r2; ++a2) {
      if (sgn(at(a2)) == 0)
        continue;
      const Rational numer = at(a1) * at(a2);
      for (std::int64_t b1 = -r2; b1 <= r2; ++b1) {
        if (sgn(at(b1)) == 0)
          continue;
        for (std::int64_t b2 = b1; b2 <= r2; ++b2) {
          if (sgn(at(b2)) == 0)
            continue;
          const Rational denom = at(b1) * at(b2);
          if (ratio == numer / denom)
            return pochhammer_form({a1, a2}, {b1, b2});
        }
      }
    }
  }
  return std::nullopt;
}

std::vector<PetkovsekSolution> q_petkovsek(const std::vector<Rational> &coeffs,
                                           const Rational &q,
                                           const SearchBounds &bounds) {
  if (coeffs.size() < 2)
    throw std::invalid_argument("q_petkovsek: need at least 2 coefficients, got " +
                                std::to_string(coeffs.size()));
  if (sgn(coeffs.back()) == 0)
    throw std::invalid_argument("q_petkovsek: leading coefficient must be nonzero");

  std::vector<PetkovsekSolution> out;
  auto roots = rational_roots(coeffs, bounds);
  if (!roots)
    return out;

  std::sort(roots->begin(), roots->end());
  roots->erase(std::unique(roots->begin(), roots->end()), roots->end());
  out.reserve(roots->size());
  for (auto &r : *roots) {
    PetkovsekSolution sol;
    sol.closed_form = decompose_ratio(r, q, bounds);
    sol.ratio = std::move(r);
    out.push_back(std::move(sol));
  }
  return out;
}

} // namespace qsym
