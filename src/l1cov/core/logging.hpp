#pragma once

#include <array>
#include <cstddef>

#include <redlog.hpp>

namespace l1cov {

// 0 is the default info level, every extra step shows more detail
inline redlog::level log_level_for_verbosity(int verbose) {
  static constexpr std::array<redlog::level, 5> levels = {
      redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug,
      redlog::level::pedantic,
  };
  if (verbose <= 0) {
    return levels.front();
  }
  const size_t index = static_cast<size_t>(verbose);
  return index < levels.size() ? levels[index] : levels.back();
}

inline void configure_logging(int verbose) { redlog::set_level(log_level_for_verbosity(verbose)); }

} // namespace l1cov
