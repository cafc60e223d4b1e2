#pragma once

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pulljson {

// Library-wide logger named "pulljson" on stderr. Quiet (warn) unless raised.
inline const std::shared_ptr<spdlog::logger>& logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get("pulljson")) return existing;
    auto created = spdlog::stderr_color_mt("pulljson");
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

inline void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace pulljson
