// src/log.cpp
#include "qsym/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace qsym::log {

std::shared_ptr<spdlog::logger> core() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto l = std::make_shared<spdlog::logger>("qsym", sink);
    l->set_level(spdlog::level::warn);
    l->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return l;
  }();
  return logger;
}

void set_level(spdlog::level::level_enum level) { core()->set_level(level); }

} // namespace qsym::log
