#pragma once

#include <cstdlib>
#include <string>

#include <redlog.hpp>

namespace machdap::cli {

inline redlog::level level_from_verbosity(int count) {
  if (count <= 0) {
    return redlog::level::info;
  }
  if (count == 1) {
    return redlog::level::verbose;
  }
  if (count == 2) {
    return redlog::level::trace;
  }
  if (count == 3) {
    return redlog::level::debug;
  }
  return redlog::level::pedantic;
}

// MACHDAP_VERBOSE holds a count, used when an editor launches the adapter without flags
inline int verbosity_from_env() {
  const char* value = std::getenv("MACHDAP_VERBOSE");
  if (!value || *value == '\0') {
    return 0;
  }
  char* end = nullptr;
  long parsed = std::strtol(value, &end, 10);
  if (end == value || parsed < 0) {
    return 0;
  }
  return static_cast<int>(parsed);
}

inline void apply_verbosity(int count) { redlog::set_level(level_from_verbosity(count)); }

} // namespace machdap::cli
