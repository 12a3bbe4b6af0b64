// src/linalg.cpp
#include "qsym/linalg.hpp"

#include <stdexcept>
#include <utility>

namespace qsym {

std::optional<std::vector<Rational>> solve_linear_system(const Matrix &a,
                                                         const std::vector<Rational> &b) {
  if (a.size() != b.size())
    throw std::invalid_argument("solve_linear_system: row count mismatch");
  const std::size_t m = a.size();
  if (m == 0)
    return std::vector<Rational>{};
  const std::size_t n = a[0].size();
  for (const auto &row : a)
    if (row.size() != n)
      throw std::invalid_argument("solve_linear_system: ragged matrix");

  Matrix aug(m);
  for (std::size_t i = 0; i < m; ++i) {
    aug[i] = a[i];
    aug[i].push_back(b[i]);
  }

  // Reduce to RREF, remembering which column each pivot row owns.
  std::vector<std::size_t> pivot_col;
  std::size_t row = 0;
  for (std::size_t col = 0; col < n && row < m; ++col) {
    std::size_t found = row;
    while (found < m && sgn(aug[found][col]) == 0)
      ++found;
    if (found == m)
      continue; // free column
    if (found != row)
      std::swap(aug[found], aug[row]);

    Rational pivot = aug[row][col];
    for (std::size_t j = col; j <= n; ++j)
      aug[row][j] /= pivot;

    for (std::size_t r = 0; r < m; ++r) {
      if (r == row || sgn(aug[r][col]) == 0)
        continue;
      Rational factor = aug[r][col];
      for (std::size_t j = col; j <= n; ++j)
        aug[r][j] -= factor * aug[row][j];
    }
    pivot_col.push_back(col);
    ++row;
  }

  // Any remaining row is 0 = rhs.
  for (std::size_t r = row; r < m; ++r)
    if (sgn(aug[r][n]) != 0)
      return std::nullopt;

  std::vector<Rational> x(n);
  for (std::size_t r = 0; r < pivot_col.size(); ++r)
    x[pivot_col[r]] = aug[r][n];
  return x;
}

} // namespace qsym
