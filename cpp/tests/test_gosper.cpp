#include "qsym/gosper.hpp"
#include "qsym/term_ratio.hpp"
#include <catch2/catch_test_macros.hpp>
#include <vector>

using qsym::make_rational; using qsym::QMonomial; using qsym::QPoly; using qsym::RatFunc;
using qsym::Rational;

TEST_CASE("q-dispersion sets") {
  const Rational q = make_rational(1, 2);
  const QPoly one_minus_x = QPoly::from_ints({1, -1});

  auto self = qsym::q_dispersion(one_minus_x, one_minus_x, q);
  REQUIRE(self == std::vector<std::int64_t>{0});

  // Roots 1 and 2^j/3 never meet.
  REQUIRE(qsym::q_dispersion(one_minus_x, QPoly::from_ints({1, -3}), q).empty());

  // a has root q^-1 = 2, b(q^j x) has root 2^j: shared at j = 1 only.
  const QPoly a = QPoly::from_ints({1, -1}) * QPoly::linear(Rational(1), make_rational(-1, 2));
  const QPoly b = QPoly::from_ints({1, -1}) * QPoly::from_ints({1, -5});
  REQUIRE(qsym::q_dispersion(a, b, q) == std::vector<std::int64_t>{0, 1});
  REQUIRE(qsym::q_dispersion_positive(a, b, q) == std::vector<std::int64_t>{1});

  REQUIRE(qsym::q_dispersion(QPoly::zero(), one_minus_x, q).empty());
  REQUIRE(qsym::q_dispersion(one_minus_x, QPoly::constant(Rational(3)), q).empty());
}

TEST_CASE("q-dispersion at base 1 covers the whole range") {
  const QPoly p = QPoly::from_ints({1, -1}) * QPoly::from_ints({1, -2});
  const QPoly r = QPoly::from_ints({1, -1}) * QPoly::from_ints({1, -7});
  REQUIRE(qsym::q_dispersion(p, r, Rational(1)) == std::vector<std::int64_t>{0, 1, 2, 3, 4});
}

TEST_CASE("Gosper normal form reproduces the ratio with coprime shifts") {
  const Rational q = make_rational(1, 3);
  // q-Vandermonde summand at n = 5
  const qsym::HypergeometricSeries s{{QMonomial::q_power(-5), QMonomial::q_power(2)},
                                     {QMonomial::q_power(3)},
                                     QMonomial::q_power(6)};
  const RatFunc ratio = qsym::term_ratio(s, q);
  const auto nf = qsym::gosper_normal_form(ratio.numer(), ratio.denom(), q);

  REQUIRE(nf.c.degree() >= 1);
  REQUIRE(RatFunc(nf.sigma, nf.tau) * RatFunc(nf.c.q_shift(q), nf.c) == ratio);
  REQUIRE(qsym::q_dispersion_positive(nf.sigma, nf.tau, q).empty());
}

TEST_CASE("Key equation solver") {
  const Rational q = make_rational(1, 2);
  // sigma f(qx) - tau f(x) = c with f = 1 + x known in advance
  const QPoly sigma = QPoly::from_ints({3, 1});
  const QPoly tau = QPoly::from_ints({1, 0, 2});
  const QPoly f = QPoly::from_ints({1, 1});
  const QPoly c = sigma * f.q_shift(q) - tau * f;

  auto solved = qsym::solve_key_equation(sigma, tau, c, q);
  REQUIRE(solved.has_value());
  REQUIRE(sigma * solved->q_shift(q) - tau * *solved == c);

  REQUIRE(qsym::solve_key_equation(sigma, tau, QPoly::zero(), q) == QPoly::zero());
  REQUIRE_FALSE(qsym::solve_key_equation(QPoly::zero(), QPoly::zero(), QPoly::one(), q).has_value());
}

TEST_CASE("q-Gosper: geometric series is summable") {
  const Rational q = make_rational(1, 2);
  // 1phi0(q; ; q, q^2) has t_{k+1}/t_k = q^2
  const qsym::HypergeometricSeries s{{QMonomial::q_power(1)}, {}, QMonomial::q_power(2)};
  const auto res = qsym::q_gosper(s, q);
  REQUIRE(res.summable);
  REQUIRE(res.certificate == RatFunc::from_rational(make_rational(-4, 3)));
}

TEST_CASE("q-Gosper: certificate telescopes the terms") {
  const Rational q = make_rational(1, 2);
  // t_k = q^k (q^2;q)_k / (q;q)_k, proportional to q^k (1 - q^{k+1})
  const qsym::HypergeometricSeries s{{QMonomial::q_power(2)}, {}, QMonomial::q_power(1)};
  const auto res = qsym::q_gosper(s, q);
  REQUIRE(res.summable);

  const RatFunc ratio = qsym::term_ratio(s, q);
  REQUIRE(res.certificate.q_shift(q) * ratio - res.certificate == RatFunc::one());

  const auto t = qsym::term_values(ratio, q, 8);
  Rational qk(1);
  for (std::size_t k = 0; k + 1 < t.size(); ++k) {
    auto yk = res.certificate.eval(qk);
    auto yk1 = res.certificate.eval(Rational(qk * q));
    REQUIRE(yk.has_value());
    REQUIRE(yk1.has_value());
    REQUIRE(Rational(*yk1 * t[k + 1] - *yk * t[k]) == t[k]);
    qk *= q;
  }
}

TEST_CASE("q-Gosper: 1/(q;q)_k is not summable") {
  const qsym::HypergeometricSeries s{{QMonomial::constant(Rational(0))}, {}, QMonomial::q_power(2)};
  const auto res = qsym::q_gosper(s, make_rational(1, 2));
  REQUIRE_FALSE(res.summable);
  REQUIRE(res.certificate.is_zero());
}
