// src/rational.cpp
#include "qsym/rational.hpp"

#include <climits>
#include <gmp.h>
#include <stdexcept>
#include <string>

namespace qsym {

Rational make_rational(long num, long den) {
  if (den == 0)
    throw std::invalid_argument("make_rational: zero denominator");
  Rational r{mpz_class(num), mpz_class(den)};
  r.canonicalize();
  return r;
}

Rational pow(const Rational &base, std::int64_t exp) {
  if (exp == 0)
    return Rational(1);
  if (exp < 0 && sgn(base) == 0)
    throw std::invalid_argument("pow: zero base with negative exponent");

  const std::uint64_t e =
      exp > 0 ? static_cast<std::uint64_t>(exp)
              : static_cast<std::uint64_t>(-(exp + 1)) + 1u;
  if (e > static_cast<std::uint64_t>(ULONG_MAX))
    throw std::invalid_argument("pow: exponent out of range");

  // (n/d)^e stays canonical: gcd(n^e, d^e) == 1 and d^e > 0.
  Rational out;
  mpz_pow_ui(mpq_numref(out.get_mpq_t()), mpq_numref(base.get_mpq_t()),
             static_cast<unsigned long>(e));
  mpz_pow_ui(mpq_denref(out.get_mpq_t()), mpq_denref(base.get_mpq_t()),
             static_cast<unsigned long>(e));
  if (exp < 0)
    mpq_inv(out.get_mpq_t(), out.get_mpq_t());
  return out;
}

Rational parse_rational(const std::string &text) {
  if (text.empty())
    throw std::invalid_argument("parse_rational: empty input");
  Rational r;
  // mpq_set_str accepts "p" and "p/q"; it does not reject a zero
  // denominator, so check that before canonicalizing.
  if (mpq_set_str(r.get_mpq_t(), text.c_str(), 10) != 0)
    throw std::invalid_argument("parse_rational: cannot parse '" + text + "'");
  if (mpz_sgn(mpq_denref(r.get_mpq_t())) == 0)
    throw std::invalid_argument("parse_rational: zero denominator in '" +
                                text + "'");
  r.canonicalize();
  return r;
}

std::string to_string(const Rational &r) { return r.get_str(10); }

} // namespace qsym
