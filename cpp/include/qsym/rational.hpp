// include/qsym/rational.hpp
#pragma once
#include <cstdint>
#include <gmpxx.h>
#include <string>

namespace qsym {

// Exact arbitrary-precision rational; always kept canonical.
using Rational = mpq_class;

// num/den in lowest terms. Throws std::invalid_argument if den == 0.
Rational make_rational(long num, long den = 1);

// Exact integer power. A zero base with a negative exponent throws
// std::invalid_argument.
Rational pow(const Rational &base, std::int64_t exp);

// Parses "p", "-p" or "p/q" (decimal). Throws std::invalid_argument.
Rational parse_rational(const std::string &text);

std::string to_string(const Rational &r);

} // namespace qsym
