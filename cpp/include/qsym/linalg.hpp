// include/qsym/linalg.hpp
#pragma once
#include <optional>
#include <vector>

#include "qsym/rational.hpp"

namespace qsym {

using Matrix = std::vector<std::vector<Rational>>;

// Solves A*x = b exactly by Gauss-Jordan elimination on [A | b].
// Returns nullopt when the system is inconsistent; free variables are 0.
// Rows of A must all have the same length and b.size() == A.size(),
// otherwise std::invalid_argument is thrown.
std::optional<std::vector<Rational>> solve_linear_system(const Matrix &a,
                                                         const std::vector<Rational> &b);

} // namespace qsym
