#include "chartok/config.hpp"

#include "chartok/utils.hpp"

namespace chartok {

FitConfig fit_config_from_env() {
  FitConfig config;
  config.include_specials =
      getenv_bool("CHARTOK_INCLUDE_SPECIALS", config.include_specials);
  const int min_freq = getenv_int("CHARTOK_MIN_FREQ", config.min_freq);
  if (min_freq >= 0) config.min_freq = min_freq;
  config.verbose = getenv_bool("CHARTOK_VERBOSE", config.verbose);
  return config;
}

}  // namespace chartok
