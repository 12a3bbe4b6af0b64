#include "qsym/log.hpp"
#include "qsym/qsym.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char *kUsage =
    "usage: qsym_cli <gosper|zeilberger|verify|petkovsek|prove-vandermonde> [flags]\n"
    "  --upper=q^-5,q^2 --lower=q^3 --arg=q^6   series parameters\n"
    "  --coeffs=1/6,-5/6,1                       recurrence c_0..c_d\n"
    "  --cert-num=.. --cert-den=..               certificate coefficients (verify)\n"
    "  --b=q^2 --c=q^3                           prove-vandermonde parameters\n"
    "  --q=1/3 --n=5                             base and test index\n"
    "  --max-order=N --max-k=N --max-terms=N --candidate-cap=N\n"
    "  --bench=N --verbose --version\n";

struct Options {
  std::string command;
  std::vector<qsym::QMonomial> upper, lower;
  qsym::QMonomial argument = qsym::QMonomial::q_power(1);
  qsym::QMonomial b = qsym::QMonomial::q_power(2);
  qsym::QMonomial c = qsym::QMonomial::q_power(3);
  std::vector<qsym::Rational> coeffs, cert_num, cert_den{qsym::Rational(1)};
  qsym::Rational q = qsym::make_rational(1, 2);
  std::int64_t n = 5;
  qsym::SearchBounds bounds;
  unsigned repeats = 1;
};

std::vector<std::string> split(const std::string &s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    const std::size_t comma = s.find(',', start);
    const std::size_t end = comma == std::string::npos ? s.size() : comma;
    if (end > start)
      out.push_back(s.substr(start, end - start));
    if (comma == std::string::npos)
      break;
    start = comma + 1;
  }
  return out;
}

std::vector<qsym::QMonomial> monomials(const std::string &s) {
  std::vector<qsym::QMonomial> out;
  for (const auto &part : split(s))
    out.push_back(qsym::parse_qmonomial(part));
  return out;
}

std::vector<qsym::Rational> rationals(const std::string &s) {
  std::vector<qsym::Rational> out;
  for (const auto &part : split(s))
    out.push_back(qsym::parse_rational(part));
  return out;
}

std::string join(const std::vector<qsym::Rational> &v) {
  std::string s;
  for (std::size_t i = 0; i < v.size(); ++i)
    s += (i ? ", " : "") + qsym::to_string(v[i]);
  return "[" + s + "]";
}

// (a;q)_n
qsym::Rational pochhammer(const qsym::Rational &a, const qsym::Rational &q,
                          std::int64_t n) {
  qsym::Rational acc(1), aq = a;
  for (std::int64_t i = 0; i < n; ++i) {
    acc *= 1 - aq;
    aq *= q;
  }
  return acc;
}

qsym::HypergeometricSeries series_of(const Options &o) {
  return qsym::HypergeometricSeries{o.upper, o.lower, o.argument};
}

int run_gosper(const Options &o) {
  const auto s = series_of(o);
  const auto res = qsym::q_gosper(s, o.q);
  if (!res.summable) {
    std::cout << s.to_string() << " → not q-Gosper summable\n";
    return 0;
  }
  std::cout << s.to_string() << " → summable | certificate=" << res.certificate.to_string()
            << "\n";
  return 0;
}

int run_zeilberger(const Options &o) {
  const auto s = series_of(o);
  const auto dep = qsym::detect_index_dependence(s, o.n, o.q);
  auto on_order = [](std::size_t d, bool solved) {
    qsym::log::core()->info("order {}: {}", d, solved ? "solved" : "no solution");
  };
  const auto res = qsym::q_zeilberger(s, o.q, dep, o.bounds, on_order);
  if (!res.found) {
    std::cout << s.to_string() << " → no recurrence up to order " << o.bounds.max_order
              << "\n";
    return 0;
  }
  std::cout << s.to_string() << " → order=" << res.order
            << " | coeffs=" << join(res.coefficients)
            << " | certificate=" << res.certificate.to_string()
            << " | fingerprint=" << qsym::to_hex(qsym::digest(res)) << "\n";
  return 0;
}

int run_verify(const Options &o) {
  const auto s = series_of(o);
  const auto dep = qsym::detect_index_dependence(s, o.n, o.q);
  std::vector<qsym::Rational> coeffs = o.coeffs;
  qsym::RatFunc cert(qsym::QPoly(o.cert_num), qsym::QPoly(o.cert_den));
  if (coeffs.empty()) {
    const auto zr = qsym::q_zeilberger(s, o.q, dep, o.bounds);
    if (!zr.found) {
      std::cout << "no recurrence to verify\n";
      return 1;
    }
    coeffs = zr.coefficients;
    cert = zr.certificate;
  }
  const bool ok = qsym::verify_wz_certificate(s, o.q, dep, coeffs, cert, o.bounds.max_k);
  std::cout << "coeffs=" << join(coeffs) << " | certificate=" << cert.to_string() << " → "
            << (ok ? "VERIFIED" : "REJECTED") << "\n";
  return ok ? 0 : 1;
}

int run_petkovsek(const Options &o) {
  const auto sols = qsym::q_petkovsek(o.coeffs, o.q, o.bounds);
  if (sols.empty())
    std::cout << "no rational solutions\n";
  for (const auto &sol : sols) {
    std::cout << "ratio=" << qsym::to_string(sol.ratio);
    if (sol.closed_form) {
      std::cout << " | closed form: prod";
      for (const auto &f : sol.closed_form->numer_factors)
        std::cout << " (" << f.to_string() << ";q)_n";
      std::cout << " /";
      for (const auto &f : sol.closed_form->denom_factors)
        std::cout << " (" << f.to_string() << ";q)_n";
    }
    std::cout << "\n";
  }
  return 0;
}

// 2phi1(q^-n, b; c; q, c q^n / b) == (c/b;q)_n / (c;q)_n
int run_prove_vandermonde(const Options &o) {
  const qsym::QMonomial b = o.b, c = o.c;
  const qsym::Rational q = o.q;
  qsym::SeriesBuilder lhs = [b, c](std::int64_t n) {
    return qsym::HypergeometricSeries{
        {qsym::QMonomial::q_power(-n), b}, {c}, (c / b) * qsym::QMonomial::q_power(n)};
  };
  qsym::ValueBuilder rhs = [b, c, q](std::int64_t n) {
    qsym::Rational num = pochhammer((c / b).eval(q), q, n);
    return qsym::Rational(num / pochhammer(c.eval(q), q, n));
  };
  const auto res = qsym::prove_nonterminating(lhs, rhs, q, o.n, o.bounds);
  if (!res.proved) {
    std::cout << "FAILED (" << qsym::to_string(res.failure) << " at n=" << res.failed_at
              << "): " << res.reason << "\n";
    return 1;
  }
  std::cout << "PROVED | order=" << res.order << " | coeffs=" << join(res.coefficients)
            << " | initial conditions=" << res.initial_conditions_checked << "\n";
  return 0;
}

Options parse(int argc, char **argv) {
  Options o;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto value = [&a](std::size_t prefix) { return a.substr(prefix); };
    if (a.rfind("--upper=", 0) == 0) {
      o.upper = monomials(value(8));
    } else if (a.rfind("--lower=", 0) == 0) {
      o.lower = monomials(value(8));
    } else if (a.rfind("--arg=", 0) == 0) {
      o.argument = qsym::parse_qmonomial(value(6));
    } else if (a.rfind("--b=", 0) == 0) {
      o.b = qsym::parse_qmonomial(value(4));
    } else if (a.rfind("--c=", 0) == 0) {
      o.c = qsym::parse_qmonomial(value(4));
    } else if (a.rfind("--coeffs=", 0) == 0) {
      o.coeffs = rationals(value(9));
    } else if (a.rfind("--cert-num=", 0) == 0) {
      o.cert_num = rationals(value(11));
    } else if (a.rfind("--cert-den=", 0) == 0) {
      o.cert_den = rationals(value(11));
    } else if (a.rfind("--q=", 0) == 0) {
      o.q = qsym::parse_rational(value(4));
    } else if (a.rfind("--n=", 0) == 0) {
      o.n = std::stoll(value(4));
    } else if (a.rfind("--max-order=", 0) == 0) {
      o.bounds.max_order = std::stoul(value(12));
    } else if (a.rfind("--max-k=", 0) == 0) {
      o.bounds.max_k = std::stoul(value(8));
    } else if (a.rfind("--max-terms=", 0) == 0) {
      o.bounds.max_terms = std::stoul(value(12));
    } else if (a.rfind("--candidate-cap=", 0) == 0) {
      o.bounds.root_candidate_cap = std::stoul(value(16));
    } else if (a.rfind("--bench=", 0) == 0) {
      o.repeats = static_cast<unsigned>(std::stoul(value(8)));
    } else if (a == "--verbose") {
      qsym::log::set_level(spdlog::level::debug);
    } else if (a.rfind("--", 0) == 0) {
      throw std::invalid_argument("unknown flag '" + a + "'");
    } else if (o.command.empty()) {
      o.command = a;
    } else {
      throw std::invalid_argument("unexpected argument '" + a + "'");
    }
  }
  return o;
}

} // namespace

int main(int argc, char **argv) {
  for (int i = 1; i < argc; ++i) {
    if (std::string(argv[i]) == "--version") {
      std::cout << "qsym " << qsym::QSYM_VERSION << " | " << qsym::engine_info() << "\n";
      return 0;
    }
  }

  try {
    const Options o = parse(argc, argv);
    std::function<int(const Options &)> run;
    if (o.command == "gosper")
      run = run_gosper;
    else if (o.command == "zeilberger")
      run = run_zeilberger;
    else if (o.command == "verify")
      run = run_verify;
    else if (o.command == "petkovsek")
      run = run_petkovsek;
    else if (o.command == "prove-vandermonde")
      run = run_prove_vandermonde;
    else {
      std::cerr << kUsage;
      return 2;
    }

    if (o.repeats <= 1)
      return run(o);

    std::uint64_t best = UINT64_MAX, sum = 0;
    int rc = 0;
    for (unsigned r = 0; r < o.repeats; ++r) {
      auto t0 = std::chrono::steady_clock::now();
      rc = run(o);
      auto t1 = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
      sum += ns;
      if ((std::uint64_t)ns < best)
        best = ns;
    }
    std::cout << o.command << " bench repeats=" << o.repeats << " | best(ns)=" << best
              << " | avg(ns)=" << (sum / o.repeats) << "\n";
    return rc;
  } catch (const std::exception &e) {
    qsym::log::core()->error("{}", e.what());
    return 1;
  }
}
