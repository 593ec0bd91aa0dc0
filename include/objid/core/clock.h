#pragma once

#include <chrono>
#include <cstdint>

namespace objid::core {

using TimePoint = std::chrono::system_clock::time_point;

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return the current wall-clock time.
  virtual TimePoint now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  TimePoint now() override;
};

// Fixed clock: returns a constant time point for deterministic tests.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(TimePoint fixed_time) : fixed_time_(fixed_time) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  TimePoint now() override;

 private:
  TimePoint fixed_time_;
};

// Seconds since the Unix epoch, truncated to 32 bits (wraps in 2106).
[[nodiscard]] std::uint32_t to_epoch_seconds32(TimePoint tp);

// Inverse of to_epoch_seconds32 for values below the wrap point.
[[nodiscard]] TimePoint from_epoch_seconds32(std::uint32_t seconds);

}  // namespace objid::core
