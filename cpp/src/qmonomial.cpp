// src/qmonomial.cpp
#include "qsym/qmonomial.hpp"

#include <gmp.h>
#include <stdexcept>
#include <string>

namespace qsym {
namespace {

// Exact square root of a non-negative integer, if one exists.
bool exact_isqrt(const mpz_class &n, mpz_class &root) {
  if (sgn(n) < 0 || !mpz_perfect_square_p(n.get_mpz_t()))
    return false;
  mpz_sqrt(root.get_mpz_t(), n.get_mpz_t());
  return true;
}

std::int64_t parse_exponent(const std::string &text, const std::string &whole) {
  try {
    std::size_t used = 0;
    long long v = std::stoll(text, &used);
    if (used != text.size())
      throw std::invalid_argument("trailing characters");
    return static_cast<std::int64_t>(v);
  } catch (const std::exception &) {
    throw std::invalid_argument("parse_qmonomial: bad exponent in '" + whole +
                                "'");
  }
}

} // namespace

Rational QMonomial::eval(const Rational &q) const {
  if (power == 0)
    return coeff;
  Rational out = coeff * qsym::pow(q, power);
  return out;
}

std::optional<std::int64_t> QMonomial::neg_power_order() const {
  if (coeff == 1 && power <= 0)
    return -power;
  return std::nullopt;
}

QMonomial QMonomial::pow(std::int64_t exp) const {
  if (exp < 0 && sgn(coeff) == 0)
    throw std::invalid_argument("QMonomial::pow: zero coefficient with "
                                "negative exponent");
  return QMonomial(qsym::pow(coeff, exp), power * exp);
}

std::optional<QMonomial> QMonomial::sqrt() const {
  if (power % 2 != 0 || sgn(coeff) < 0)
    return std::nullopt;
  mpz_class num_root, den_root;
  if (!exact_isqrt(coeff.get_num(), num_root) ||
      !exact_isqrt(coeff.get_den(), den_root))
    return std::nullopt;
  Rational root(num_root, den_root);
  root.canonicalize();
  return QMonomial(root, power / 2);
}

std::string QMonomial::to_string() const {
  if (power == 0)
    return qsym::to_string(coeff);
  std::string q = power == 1 ? "q" : "q^" + std::to_string(power);
  if (coeff == 1)
    return q;
  if (coeff == -1)
    return "-" + q;
  return qsym::to_string(coeff) + "*" + q;
}

QMonomial operator*(const QMonomial &a, const QMonomial &b) {
  Rational c = a.coeff * b.coeff;
  return QMonomial(c, a.power + b.power);
}

QMonomial operator/(const QMonomial &a, const QMonomial &b) {
  if (sgn(b.coeff) == 0)
    throw std::invalid_argument("QMonomial: division by a zero monomial");
  Rational c = a.coeff / b.coeff;
  return QMonomial(c, a.power - b.power);
}

QMonomial operator-(const QMonomial &a) {
  Rational c = -a.coeff;
  return QMonomial(c, a.power);
}

bool operator==(const QMonomial &a, const QMonomial &b) {
  return a.coeff == b.coeff && a.power == b.power;
}

bool operator!=(const QMonomial &a, const QMonomial &b) { return !(a == b); }

QMonomial parse_qmonomial(const std::string &text) {
  const auto qpos = text.find('q');
  if (qpos == std::string::npos)
    return QMonomial::constant(parse_rational(text));

  // Coefficient part: "", "-", or "c*".
  std::string head = text.substr(0, qpos);
  Rational coeff(1);
  if (head == "-") {
    coeff = -1;
  } else if (!head.empty()) {
    if (head.back() != '*')
      throw std::invalid_argument("parse_qmonomial: expected '*' in '" + text +
                                  "'");
    coeff = parse_rational(head.substr(0, head.size() - 1));
  }

  std::string tail = text.substr(qpos + 1);
  std::int64_t power = 1;
  if (!tail.empty()) {
    if (tail[0] != '^')
      throw std::invalid_argument("parse_qmonomial: expected '^' in '" + text +
                                  "'");
    power = parse_exponent(tail.substr(1), text);
  }
  return QMonomial(coeff, power);
}

} // namespace qsym
