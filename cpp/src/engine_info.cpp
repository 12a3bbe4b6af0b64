// src/engine_info.cpp
#include "qsym/qsym.hpp"

#include <gmp.h>
#include <string>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}
} // namespace

namespace qsym {

std::string engine_info() {
  return std::string("gmp:") + (::gmp_version ? ::gmp_version : "?") + "; " +
         compiler_info();
}

} // namespace qsym
