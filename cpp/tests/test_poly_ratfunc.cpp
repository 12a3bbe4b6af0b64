#include "qsym/poly.hpp"
#include "qsym/ratfunc.hpp"
#include "qsym/term_ratio.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

using qsym::make_rational; using qsym::QPoly; using qsym::RatFunc; using qsym::Rational;

TEST_CASE("QPoly: construction and arithmetic") {
  REQUIRE(QPoly::zero().degree() == -1);
  REQUIRE(QPoly::zero().is_zero());
  REQUIRE(QPoly::from_ints({1, 2, 0, 0}).degree() == 1); // trailing zeros trimmed
  REQUIRE(QPoly::constant(Rational(0)).is_zero());

  const QPoly a = QPoly::from_ints({1, -1});   // 1 - x
  const QPoly b = QPoly::from_ints({-2, 0, 1}); // x^2 - 2
  REQUIRE(a + b == QPoly::from_ints({-1, -1, 1}));
  REQUIRE(a - a == QPoly::zero());
  REQUIRE(a * b == QPoly::from_ints({-2, 2, 1, -1}));
  REQUIRE(-a == QPoly::from_ints({-1, 1}));
  REQUIRE(b.leading_coeff() == Rational(1));
  REQUIRE(b.coeff(7) == Rational(0));
  REQUIRE(b.eval(Rational(3)) == Rational(7));
  REQUIRE(a.scalar_mul(make_rational(1, 2)) == QPoly({make_rational(1, 2), make_rational(-1, 2)}));
  REQUIRE(a.make_monic() == QPoly::from_ints({-1, 1}));
  REQUIRE_THROWS_AS(a.scalar_div(Rational(0)), std::invalid_argument);
  REQUIRE(a.to_string() == "-x + 1");
}

TEST_CASE("QPoly: division, gcd, shift") {
  const QPoly p = QPoly::from_ints({-1, 0, 0, 1}); // x^3 - 1
  const QPoly d = QPoly::from_ints({-1, 1});       // x - 1
  auto [quot, rem] = p.div_rem(d);
  REQUIRE(quot == QPoly::from_ints({1, 1, 1}));
  REQUIRE(rem.is_zero());
  REQUIRE(p.exact_div(d) == quot);
  REQUIRE_THROWS_AS(p.exact_div(QPoly::from_ints({1, 1})), std::logic_error);
  REQUIRE_THROWS_AS(p.div_rem(QPoly::zero()), std::invalid_argument);

  const QPoly g = qsym::poly_gcd(QPoly::from_ints({2, -2}) * QPoly::from_ints({3, 1}),
                                 QPoly::from_ints({-1, 1}) * QPoly::from_ints({5, 1}));
  REQUIRE(g == QPoly::from_ints({-1, 1}));
  REQUIRE(qsym::poly_gcd(QPoly::zero(), QPoly::zero()).is_zero());
  REQUIRE(qsym::poly_gcd(QPoly::from_ints({1, 1}), QPoly::from_ints({2, 1})).degree() == 0);

  const Rational q = make_rational(1, 2);
  const QPoly s = QPoly::from_ints({1, 1, 1});
  REQUIRE(s.q_shift(q) == QPoly({Rational(1), q, make_rational(1, 4)}));
  REQUIRE(s.q_shift_n(q, -1) == QPoly::from_ints({1, 2, 4}));
  REQUIRE(s.q_shift_n(q, 3).q_shift_n(q, -3) == s);
}

TEST_CASE("Lagrange interpolation recovers the polynomial") {
  const QPoly p = QPoly({make_rational(1, 3), Rational(-2), Rational(0), make_rational(5, 7)});
  std::vector<std::pair<Rational, Rational>> pts;
  for (long x : {-2L, 0L, 1L, 3L})
    pts.emplace_back(Rational(x), p.eval(Rational(x)));
  REQUIRE(qsym::lagrange_interpolate(pts) == p);

  pts.emplace_back(Rational(1), Rational(9));
  REQUIRE_THROWS_AS(qsym::lagrange_interpolate(pts), std::invalid_argument);
  REQUIRE(qsym::lagrange_interpolate({}).is_zero());
}

TEST_CASE("RatFunc: lowest terms, monic denominator, arithmetic") {
  const QPoly xm1 = QPoly::from_ints({-1, 1});
  const RatFunc f(xm1 * QPoly::from_ints({1, 1}), xm1.scalar_mul(Rational(3)));
  REQUIRE(f.denom() == QPoly::one());
  REQUIRE(f.numer() == QPoly({make_rational(1, 3), make_rational(1, 3)}));
  REQUIRE(f.is_polynomial());

  const RatFunc h(QPoly::one(), QPoly::from_ints({2, -2}));
  REQUIRE(h.denom() == xm1);
  REQUIRE(h.numer() == QPoly::constant(make_rational(-1, 2)));
  REQUIRE_FALSE(h.eval(Rational(1)).has_value());
  REQUIRE(h.eval(Rational(3)) == make_rational(-1, 4));

  REQUIRE(h - h == RatFunc::zero());
  REQUIRE(h / h == RatFunc::one());
  REQUIRE((h + RatFunc::one()) * RatFunc::from_poly(xm1) == RatFunc::from_poly(xm1) + RatFunc::from_rational(make_rational(-1, 2)));
  REQUIRE(-h == RatFunc(QPoly::one(), QPoly::from_ints({-2, 2})));
  REQUIRE_THROWS_AS(h / RatFunc::zero(), std::invalid_argument);
  REQUIRE_THROWS_AS(RatFunc(QPoly::one(), QPoly::zero()), std::invalid_argument);

  const Rational q = make_rational(1, 3);
  REQUIRE(h.q_shift(q).eval(Rational(6)) == h.eval(Rational(2)));
  REQUIRE_FALSE(h.q_shift_n(q, 2).eval(Rational(9)).has_value());
}

TEST_CASE("Term ratio of the q-Vandermonde summand") {
  using qsym::HypergeometricSeries; using qsym::QMonomial;
  const Rational q = make_rational(1, 3);
  const HypergeometricSeries s{{QMonomial::q_power(-3), QMonomial::q_power(2)},
                               {QMonomial::q_power(3)},
                               QMonomial::q_power(4)};

  // (1 - q^-3 x)(1 - q^2 x) q^4 / ((1 - q x)(1 - q^3 x))
  const RatFunc expected(QPoly::linear(Rational(1), Rational(-27)) *
                             QPoly::linear(Rational(1), make_rational(-1, 9)) *
                             QPoly::constant(make_rational(1, 81)),
                         QPoly::linear(Rational(1), make_rational(-1, 3)) *
                             QPoly::linear(Rational(1), make_rational(-1, 27)));
  REQUIRE(qsym::term_ratio(s, q) == expected);

  const auto f = qsym::term_values(qsym::term_ratio(s, q), q, 7);
  REQUIRE(f.size() == 7);
  REQUIRE(f[0] == Rational(1));
  for (std::size_t k = 1; k <= 3; ++k)
    REQUIRE(f[k] != Rational(0));
  for (std::size_t k = 4; k < 7; ++k)
    REQUIRE(f[k] == Rational(0));

  Rational direct(0);
  for (const auto &t : f)
    direct += t;
  REQUIRE(qsym::definite_sum(s, q, 100) == direct);
}

TEST_CASE("Term ratio folds the extra factor by the sign of 1+s-r") {
  using qsym::HypergeometricSeries; using qsym::QMonomial;
  const Rational q = make_rational(1, 2);

  // 0phi1(; b; q, z): e = 2, factor x^2 z
  const HypergeometricSeries up{{}, {QMonomial::q_power(1)}, QMonomial::constant(Rational(3))};
  // 3 * 4^2 / ((1 - q*4)(1 - q*4))
  REQUIRE(qsym::term_ratio(up, q).eval(Rational(4)) == Rational(48));

  // 3phi0(a, b, c; ; q, z): e = -2, factor z / x^2
  const HypergeometricSeries down{{QMonomial::constant(Rational(0)), QMonomial::constant(Rational(0)),
                                   QMonomial::constant(Rational(0))},
                                  {},
                                  QMonomial::constant(Rational(5))};
  const RatFunc r = qsym::term_ratio(down, q);
  REQUIRE(r.eval(Rational(1)) == Rational(Rational(5) / (1 - q)));
  REQUIRE_FALSE(r.eval(Rational(0)).has_value());
}
