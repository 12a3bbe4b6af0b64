// src/series.cpp
#include "qsym/series.hpp"

#include <stdexcept>
#include <string>

namespace qsym {

std::optional<std::int64_t> HypergeometricSeries::termination_order() const {
  std::optional<std::int64_t> best;
  for (const auto &a : upper) {
    auto n = a.neg_power_order();
    if (n && (!best || *n < *best))
      best = n;
  }
  return best;
}

HypergeometricSeries HypergeometricSeries::shifted(std::int64_t j,
                                                   const IndexDependence &dep) const {
  HypergeometricSeries out = *this;
  for (std::size_t idx : dep.upper) {
    if (idx >= out.upper.size())
      throw std::invalid_argument("HypergeometricSeries::shifted: upper index " +
                                  std::to_string(idx) + " out of range");
    out.upper[idx].power -= j;
  }
  if (dep.argument)
    out.argument.power += j;
  return out;
}

std::string HypergeometricSeries::to_string() const {
  auto join = [](const std::vector<QMonomial> &v) {
    std::string s;
    for (std::size_t i = 0; i < v.size(); ++i) {
      if (i)
        s += ", ";
      s += v[i].to_string();
    }
    return s;
  };
  return std::to_string(r()) + "phi" + std::to_string(s()) + "(" + join(upper) +
         "; " + join(lower) + "; q, " + argument.to_string() + ")";
}

IndexDependence detect_index_dependence(const HypergeometricSeries &series,
                                        std::int64_t n, const Rational &q) {
  IndexDependence dep;
  const Rational target = qsym::pow(q, -n);
  for (std::size_t i = 0; i < series.upper.size(); ++i)
    if (series.upper[i].eval(q) == target)
      dep.upper.push_back(i);

  // Shifting n only changes z when z carries a q-power and q is not a root
  // of unity; z*q^1 != z is the direct test.
  const Rational z = series.argument.eval(q);
  const Rational z_next = z * q;
  dep.argument = series.argument.power != 0 && z != z_next;
  return dep;
}

} // namespace qsym
