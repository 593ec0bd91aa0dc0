#include "objid/core/clock.h"

namespace objid::core {

TimePoint SystemClock::now() {
  return std::chrono::system_clock::now();
}

TimePoint FixedClock::now() {
  return fixed_time_;
}

std::uint32_t to_epoch_seconds32(const TimePoint tp) {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  // Truncation to the low 32 bits is the storage format, not an overflow.
  return static_cast<std::uint32_t>(secs);
}

TimePoint from_epoch_seconds32(const std::uint32_t seconds) {
  return TimePoint{std::chrono::seconds{seconds}};
}

}  // namespace objid::core
