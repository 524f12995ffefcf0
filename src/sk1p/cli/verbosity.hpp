#pragma once

#include "utils/env_config.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace sk1p::cli {

// 0 = info, each step enables the next more detailed level up to pedantic
inline redlog::level level_from_verbosity(int count) {
  static constexpr redlog::level levels[] = {
      redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug, redlog::level::pedantic,
  };
  constexpr int last = static_cast<int>(sizeof(levels) / sizeof(levels[0])) - 1;
  return levels[std::clamp(count, 0, last)];
}

// SK1P_VERBOSE sets the baseline, repeated -v flags raise it
inline int resolve_verbosity(int flag_count) {
  utils::env_config config("SK1P");
  return config.get<int>("VERBOSE", 0) + flag_count;
}

inline void apply_verbosity(int flag_count) { redlog::set_level(level_from_verbosity(resolve_verbosity(flag_count))); }

} // namespace sk1p::cli
