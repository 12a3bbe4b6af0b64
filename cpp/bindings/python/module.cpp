#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/pytypes.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "qsym/qsym.hpp"

namespace py = pybind11;

// Monomials cross the boundary as (num, den, power) with Python ints in both
// directions: num/den * q^power.
using MonoTuple = std::tuple<py::int_, py::int_, std::int64_t>;

static mpz_class to_mpz(const py::int_ &v) {
  return mpz_class(py::str(v).cast<std::string>());
}

static py::int_ from_mpz(const mpz_class &v) {
  return py::int_(py::str(v.get_str()));
}

static qsym::QMonomial to_mono(const MonoTuple &t) {
  const mpz_class den = to_mpz(std::get<1>(t));
  if (den == 0)
    throw std::invalid_argument("monomial with zero denominator");
  qsym::Rational coeff{to_mpz(std::get<0>(t)), den};
  coeff.canonicalize();
  return qsym::QMonomial(coeff, std::get<2>(t));
}

static py::tuple from_mono(const qsym::QMonomial &m) {
  return py::make_tuple(from_mpz(m.coeff.get_num()), from_mpz(m.coeff.get_den()), m.power);
}

static qsym::HypergeometricSeries to_series(const std::vector<MonoTuple> &upper,
                                            const std::vector<MonoTuple> &lower,
                                            const MonoTuple &argument) {
  qsym::HypergeometricSeries s;
  for (const auto &u : upper)
    s.upper.push_back(to_mono(u));
  for (const auto &l : lower)
    s.lower.push_back(to_mono(l));
  s.argument = to_mono(argument);
  return s;
}

static std::vector<qsym::Rational> to_rationals(const std::vector<std::string> &v) {
  std::vector<qsym::Rational> out;
  for (const auto &s : v)
    out.push_back(qsym::parse_rational(s));
  return out;
}

static std::vector<std::string> from_rationals(const std::vector<qsym::Rational> &v) {
  std::vector<std::string> out;
  for (const auto &r : v)
    out.push_back(qsym::to_string(r));
  return out;
}

static py::dict from_ratfunc(const qsym::RatFunc &f) {
  py::dict out;
  out["numer"] = from_rationals(f.numer().coeffs());
  out["denom"] = from_rationals(f.denom().coeffs());
  return out;
}

static qsym::SearchBounds make_bounds(std::size_t max_order, std::size_t max_k) {
  qsym::SearchBounds b;
  b.max_order = max_order;
  b.max_k = max_k;
  return b;
}

static qsym::IndexDependence dependence_for(const qsym::HypergeometricSeries &s,
                                            std::int64_t n, const qsym::Rational &q,
                                            const std::optional<std::vector<std::size_t>> &upper,
                                            std::optional<bool> argument) {
  if (!upper && !argument)
    return qsym::detect_index_dependence(s, n, q);
  qsym::IndexDependence dep;
  dep.upper = upper.value_or(std::vector<std::size_t>{});
  dep.argument = argument.value_or(false);
  return dep;
}

static py::dict q_gosper_py(const std::vector<MonoTuple> &upper,
                            const std::vector<MonoTuple> &lower, const MonoTuple &argument,
                            const std::string &q) {
  const auto res = qsym::q_gosper(to_series(upper, lower, argument), qsym::parse_rational(q));
  py::dict out;
  out["summable"] = res.summable;
  out["certificate"] = from_ratfunc(res.certificate);
  return out;
}

static py::dict q_zeilberger_py(const std::vector<MonoTuple> &upper,
                                const std::vector<MonoTuple> &lower,
                                const MonoTuple &argument, const std::string &q,
                                std::int64_t n, std::size_t max_order, std::size_t max_k,
                                std::optional<std::vector<std::size_t>> n_upper,
                                std::optional<bool> n_in_argument,
                                std::optional<py::function> callback) {
  const auto s = to_series(upper, lower, argument);
  const auto qv = qsym::parse_rational(q);
  const auto dep = dependence_for(s, n, qv, n_upper, n_in_argument);

  // The callback reacquires the GIL when invoked.
  qsym::OrderCb cb;
  if (callback.has_value()) {
    py::function fn = *callback;
    cb = [fn = std::move(fn)](std::size_t order, bool solved) {
      py::gil_scoped_acquire gil;
      fn(order, solved);
    };
  }

  qsym::ZeilbergerResult res;
  {
    py::gil_scoped_release nogil;
    res = qsym::q_zeilberger(s, qv, dep, make_bounds(max_order, max_k), cb);
  }

  py::dict out;
  out["found"] = res.found;
  out["order"] = res.order;
  out["coefficients"] = from_rationals(res.coefficients);
  out["certificate"] = from_ratfunc(res.certificate);
  out["fingerprint"] = qsym::to_hex(qsym::digest(res));
  return out;
}

static bool verify_wz_py(const std::vector<MonoTuple> &upper,
                         const std::vector<MonoTuple> &lower, const MonoTuple &argument,
                         const std::string &q, std::int64_t n,
                         const std::vector<std::string> &coefficients,
                         const std::vector<std::string> &cert_numer,
                         const std::vector<std::string> &cert_denom, std::size_t max_k) {
  const auto s = to_series(upper, lower, argument);
  const auto qv = qsym::parse_rational(q);
  const qsym::RatFunc cert(qsym::QPoly(to_rationals(cert_numer)),
                           qsym::QPoly(to_rationals(cert_denom)));
  return qsym::verify_wz_certificate(s, qv, qsym::detect_index_dependence(s, n, qv),
                                     to_rationals(coefficients), cert, max_k);
}

static py::list q_petkovsek_py(const std::vector<std::string> &coefficients,
                               const std::string &q) {
  py::list out;
  for (const auto &sol :
       qsym::q_petkovsek(to_rationals(coefficients), qsym::parse_rational(q))) {
    py::dict d;
    d["ratio"] = qsym::to_string(sol.ratio);
    if (sol.closed_form) {
      py::dict cf;
      cf["scalar"] = qsym::to_string(sol.closed_form->scalar);
      cf["q_power_coeff"] = sol.closed_form->q_power_coeff;
      py::list num, den;
      for (const auto &m : sol.closed_form->numer_factors)
        num.append(from_mono(m));
      for (const auto &m : sol.closed_form->denom_factors)
        den.append(from_mono(m));
      cf["numer_factors"] = num;
      cf["denom_factors"] = den;
      d["closed_form"] = cf;
    } else {
      d["closed_form"] = py::none();
    }
    out.append(d);
  }
  return out;
}

// Builders are Python callables, so the GIL stays held for the whole proof.
static py::dict prove_nonterminating_py(const py::function &lhs, const py::function &rhs,
                                        const std::string &q, std::int64_t n_test,
                                        std::size_t max_order) {
  qsym::SeriesBuilder lhs_cpp = [lhs](std::int64_t n) {
    auto t = lhs(n).cast<std::tuple<std::vector<MonoTuple>, std::vector<MonoTuple>, MonoTuple>>();
    return to_series(std::get<0>(t), std::get<1>(t), std::get<2>(t));
  };
  qsym::ValueBuilder rhs_cpp = [rhs](std::int64_t n) {
    return qsym::parse_rational(py::str(rhs(n)).cast<std::string>());
  };

  qsym::SearchBounds bounds;
  bounds.max_order = max_order;
  const auto res = qsym::prove_nonterminating(lhs_cpp, rhs_cpp, qsym::parse_rational(q),
                                              n_test, bounds);
  py::dict out;
  out["proved"] = res.proved;
  out["order"] = res.order;
  out["coefficients"] = from_rationals(res.coefficients);
  out["initial_conditions_checked"] = res.initial_conditions_checked;
  out["failure"] = qsym::to_string(res.failure);
  out["failed_at"] = res.failed_at;
  out["reason"] = res.reason;
  return out;
}

PYBIND11_MODULE(qsym, m) {
  m.doc() = "q-hypergeometric creative telescoping (pybind11)";
  m.attr("__version__") = qsym::QSYM_VERSION;

  m.def("q_gosper", &q_gosper_py, py::arg("upper"), py::arg("lower"), py::arg("argument"),
        py::arg("q"),
        R"pbdoc(
q-Gosper indefinite summation.

Monomials are (num, den, power) tuples of ints; q is a "p/q" string.
Returns dict { summable, certificate: {numer, denom} }.
)pbdoc");

  m.def("q_zeilberger", &q_zeilberger_py, py::arg("upper"), py::arg("lower"),
        py::arg("argument"), py::arg("q"), py::arg("n"), py::arg("max_order") = 3,
        py::arg("max_k") = 50, py::arg("n_upper") = py::none(),
        py::arg("n_in_argument") = py::none(), py::arg("callback") = py::none(),
        R"pbdoc(
Find a recurrence for the definite sum at test index n.

n_upper / n_in_argument override the index-dependence heuristic.
callback (callable): optional function (order:int, solved:bool) -> None.

Returns dict { found, order, coefficients, certificate, fingerprint }.
)pbdoc");

  m.def("verify_wz", &verify_wz_py, py::arg("upper"), py::arg("lower"), py::arg("argument"),
        py::arg("q"), py::arg("n"), py::arg("coefficients"), py::arg("cert_numer"),
        py::arg("cert_denom"), py::arg("max_k") = 50,
        R"pbdoc(Check a recurrence and WZ certificate on k = 0..max_k.)pbdoc");

  m.def("q_petkovsek", &q_petkovsek_py, py::arg("coefficients"), py::arg("q"),
        R"pbdoc(Rational q-hypergeometric solutions of a constant-coefficient recurrence.)pbdoc");

  m.def("prove_nonterminating", &prove_nonterminating_py, py::arg("lhs"), py::arg("rhs"),
        py::arg("q"), py::arg("n_test"), py::arg("max_order") = 3,
        R"pbdoc(
Prove sum lhs(n) == rhs(n) for all n.

lhs(n) returns (upper, lower, argument); rhs(n) returns a value whose str() is "p/q".
Returns dict { proved, order, coefficients, initial_conditions_checked, failure, failed_at, reason }.
)pbdoc");
}
