#pragma once

#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

namespace objid::apps {

// apply_log_level sets the default spdlog logger level from a name
// (trace, debug, info, warn, error, critical, off).
// Returns false and reports to stderr for any other name.
inline bool apply_log_level(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off.
  if (level == spdlog::level::off && name != "off") {
    std::cerr << "Invalid --log-level: " << name
              << " (valid: trace, debug, info, warn, error, critical, off)\n";
    return false;
  }
  spdlog::set_level(level);
  return true;
}

}  // namespace objid::apps
