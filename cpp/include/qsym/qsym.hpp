// include/qsym/qsym.hpp
#pragma once
#include <string>

#include "qsym/config.hpp"
#include "qsym/gosper.hpp"
#include "qsym/hash.hpp"
#include "qsym/nonterminating.hpp"
#include "qsym/petkovsek.hpp"
#include "qsym/series.hpp"
#include "qsym/term_ratio.hpp"
#include "qsym/zeilberger.hpp"

namespace qsym {

inline constexpr const char *QSYM_VERSION = "0.1.0";

// e.g. "gmp:6.3.0; gcc:13.2.0"
std::string engine_info();

} // namespace qsym
