#include "qsym/qmonomial.hpp"
#include "qsym/rational.hpp"
#include "qsym/series.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

TEST_CASE("Rational helpers: construction, powers, parsing") {
  using qsym::make_rational; using qsym::parse_rational; using qsym::Rational;

  REQUIRE(make_rational(2, 4) == make_rational(1, 2));
  REQUIRE(make_rational(3, -6) == make_rational(-1, 2));
  REQUIRE_THROWS_AS(make_rational(1, 0), std::invalid_argument);

  REQUIRE(qsym::pow(make_rational(2, 3), 3) == make_rational(8, 27));
  REQUIRE(qsym::pow(make_rational(2, 3), -2) == make_rational(9, 4));
  REQUIRE(qsym::pow(make_rational(-1, 2), -3) == Rational(-8));
  REQUIRE(qsym::pow(Rational(0), 0) == Rational(1));
  REQUIRE_THROWS_AS(qsym::pow(Rational(0), -1), std::invalid_argument);

  REQUIRE(parse_rational("-3/6") == make_rational(-1, 2));
  REQUIRE(parse_rational("42") == Rational(42));
  REQUIRE_THROWS_AS(parse_rational("1/0"), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_rational("abc"), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_rational(""), std::invalid_argument);
  REQUIRE(qsym::to_string(make_rational(-5, 10)) == "-1/2");
}

TEST_CASE("QMonomial algebra") {
  using qsym::make_rational; using qsym::QMonomial; using qsym::Rational;
  const Rational q = make_rational(1, 2);

  REQUIRE(QMonomial::q_power(3).eval(q) == make_rational(1, 8));
  REQUIRE(QMonomial(Rational(3), -2).eval(q) == Rational(12));
  REQUIRE(QMonomial::constant(Rational(5)).eval(q) == Rational(5));

  const QMonomial a(make_rational(2, 3), 4), b(Rational(-3), -1);
  REQUIRE(a * b == QMonomial(Rational(-2), 3));
  REQUIRE(a / b == QMonomial(make_rational(-2, 9), 5));
  REQUIRE(-a == QMonomial(make_rational(-2, 3), 4));
  REQUIRE(a.pow(2) == QMonomial(make_rational(4, 9), 8));
  REQUIRE(a.pow(-1) == QMonomial(make_rational(3, 2), -4));
  REQUIRE_THROWS_AS(QMonomial(Rational(0), 1).pow(-1), std::invalid_argument);
  REQUIRE_THROWS_AS(a / QMonomial(Rational(0), 0), std::invalid_argument);

  auto root = QMonomial(make_rational(4, 9), 6).sqrt();
  REQUIRE(root.has_value());
  REQUIRE(*root == QMonomial(make_rational(2, 3), 3));
  REQUIRE_FALSE(QMonomial::q_power(3).sqrt().has_value());
  REQUIRE_FALSE(QMonomial(Rational(2), 2).sqrt().has_value());
  REQUIRE_FALSE(QMonomial(Rational(-4), 2).sqrt().has_value());
}

TEST_CASE("QMonomial: termination order and parsing") {
  using qsym::make_rational; using qsym::parse_qmonomial; using qsym::QMonomial;
  using qsym::Rational;

  REQUIRE(QMonomial::q_power(-4).neg_power_order() == 4);
  REQUIRE(QMonomial::constant(Rational(1)).neg_power_order() == 0);
  REQUIRE_FALSE(QMonomial(Rational(2), -4).neg_power_order().has_value());
  REQUIRE_FALSE(QMonomial::q_power(2).neg_power_order().has_value());

  REQUIRE(parse_qmonomial("3/2*q^-2") == QMonomial(make_rational(3, 2), -2));
  REQUIRE(parse_qmonomial("q") == QMonomial::q_power(1));
  REQUIRE(parse_qmonomial("-q^5") == QMonomial(Rational(-1), 5));
  REQUIRE(parse_qmonomial("7") == QMonomial::constant(Rational(7)));
  REQUIRE_THROWS_AS(parse_qmonomial("q^x"), std::invalid_argument);
  REQUIRE_THROWS_AS(parse_qmonomial("2q"), std::invalid_argument);

  REQUIRE(QMonomial(make_rational(3, 2), -2).to_string() == "3/2*q^-2");
}

TEST_CASE("Series descriptor: shape, termination, shifting") {
  using qsym::HypergeometricSeries; using qsym::IndexDependence; using qsym::QMonomial;
  using qsym::make_rational;

  const HypergeometricSeries s{{QMonomial::q_power(-5), QMonomial::q_power(2)},
                               {QMonomial::q_power(3)},
                               QMonomial::q_power(6)};
  REQUIRE(s.r() == 2);
  REQUIRE(s.s() == 1);
  REQUIRE(s.extra_exponent() == 0);
  REQUIRE(s.termination_order() == 5);

  const IndexDependence dep{{0}, true};
  const auto t = s.shifted(2, dep);
  REQUIRE(t.upper[0] == QMonomial::q_power(-7));
  REQUIRE(t.upper[1] == QMonomial::q_power(2));
  REQUIRE(t.argument == QMonomial::q_power(8));
  REQUIRE(t.lower == s.lower);
  REQUIRE_THROWS_AS(s.shifted(1, IndexDependence{{2}, false}), std::invalid_argument);

  const auto detected = qsym::detect_index_dependence(s, 5, make_rational(1, 3));
  REQUIRE(detected.upper == std::vector<std::size_t>{0});
  REQUIRE(detected.argument);

  const HypergeometricSeries open{{QMonomial::q_power(2)}, {}, QMonomial::constant(2)};
  REQUIRE_FALSE(open.termination_order().has_value());
  const auto none = qsym::detect_index_dependence(open, 3, make_rational(1, 2));
  REQUIRE(none.upper.empty());
  REQUIRE_FALSE(none.argument);
}
