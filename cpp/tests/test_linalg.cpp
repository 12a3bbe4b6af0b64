#include "qsym/linalg.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using qsym::make_rational; using qsym::Matrix; using qsym::Rational;

namespace {
Matrix ints(std::initializer_list<std::initializer_list<long>> rows) {
  Matrix m;
  for (const auto &r : rows) {
    m.emplace_back();
    for (long v : r)
      m.back().emplace_back(v);
  }
  return m;
}
} // namespace

TEST_CASE("Unique solution of a square system") {
  // 2x + y = 3, x - y = 0  ->  x = y = 1
  auto x = qsym::solve_linear_system(ints({{2, 1}, {1, -1}}), {Rational(3), Rational(0)});
  REQUIRE(x.has_value());
  REQUIRE((*x)[0] == Rational(1));
  REQUIRE((*x)[1] == Rational(1));

  // Needs a row swap and produces fractions.
  auto y = qsym::solve_linear_system(ints({{0, 3}, {2, 1}}), {Rational(1), Rational(0)});
  REQUIRE(y.has_value());
  REQUIRE((*y)[0] == make_rational(-1, 6));
  REQUIRE((*y)[1] == make_rational(1, 3));
}

TEST_CASE("Inconsistent and underdetermined systems") {
  REQUIRE_FALSE(qsym::solve_linear_system(ints({{1, 1}, {2, 2}}), {Rational(1), Rational(3)})
                    .has_value());

  // Overdetermined but consistent.
  auto over = qsym::solve_linear_system(ints({{1}, {2}, {3}}),
                                        {Rational(2), Rational(4), Rational(6)});
  REQUIRE(over.has_value());
  REQUIRE((*over)[0] == Rational(2));

  // x + z = 1 leaves y and z free; free variables are zero.
  auto free = qsym::solve_linear_system(ints({{1, 0, 1}}), {Rational(1)});
  REQUIRE(free.has_value());
  REQUIRE(*free == std::vector<Rational>{Rational(1), Rational(0), Rational(0)});

  auto zero_col = qsym::solve_linear_system(ints({{0, 1}, {0, 2}}), {Rational(1), Rational(2)});
  REQUIRE(zero_col.has_value());
  REQUIRE((*zero_col)[0] == Rational(0));
  REQUIRE((*zero_col)[1] == Rational(1));
}

TEST_CASE("Degenerate shapes") {
  auto empty = qsym::solve_linear_system(Matrix{}, {});
  REQUIRE(empty.has_value());
  REQUIRE(empty->empty());

  REQUIRE_THROWS_AS(qsym::solve_linear_system(ints({{1, 2}}), {Rational(1), Rational(2)}),
                    std::invalid_argument);
  REQUIRE_THROWS_AS(qsym::solve_linear_system(ints({{1, 2}, {1}}), {Rational(1), Rational(2)}),
                    std::invalid_argument);
}
