#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace hyperpga::core {

/**
 * \brief Parse a boolean switch from the environment.
 * \param name Variable name.
 * \return `true` for `1`, `true`, `yes` or `on` (case-insensitive).
 */
inline bool env_flag(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr) {
    return false;
  }

  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

/// \brief Whether `HYPERPGA_VERBOSE` requests diagnostic output.
inline bool verbose_enabled() { return env_flag("HYPERPGA_VERBOSE"); }

} // namespace hyperpga::core
