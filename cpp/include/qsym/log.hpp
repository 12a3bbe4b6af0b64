// include/qsym/log.hpp
#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace qsym::log {

// Shared "qsym" logger writing to stderr. Starts at warn, so the core is
// silent unless a caller lowers the level.
std::shared_ptr<spdlog::logger> core();

void set_level(spdlog::level::level_enum level);

} // namespace qsym::log
