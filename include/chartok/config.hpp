#pragma once

namespace chartok {

struct FitConfig {
  bool include_specials = true;
  int min_freq = 1;
  bool verbose = false;
};

// Defaults overridden by CHARTOK_INCLUDE_SPECIALS, CHARTOK_MIN_FREQ and
// CHARTOK_VERBOSE.
FitConfig fit_config_from_env();

}  // namespace chartok
