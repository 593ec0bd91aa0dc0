#pragma once

#include "objid/core/clock.h"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>

namespace objid::id {

class ObjectIdGenerator;

// ObjectId is a 12-byte identifier made of three unsigned 32-bit fields:
//
//   bytes [0, 4)   time     seconds since the Unix epoch, truncated to 32 bits
//   bytes [4, 8)   machine  process-wide fingerprint (machine piece | process piece)
//   bytes [8, 12)  counter  process-local counter, wraps on overflow
//
// Values are immutable. The only mutable state is the transient "fresh" flag,
// which is set for values minted by ObjectIdGenerator::generate() and is
// ignored by equality, ordering, hashing and every encoding.
class ObjectId {
 public:
  static constexpr std::size_t kByteLength = 12;
  static constexpr std::size_t kHexLength = 24;

  constexpr ObjectId() = default;
  constexpr ObjectId(std::uint32_t time, std::uint32_t machine, std::uint32_t counter)
      : time_(time), machine_(machine), counter_(counter) {}

  [[nodiscard]] constexpr std::uint32_t time() const { return time_; }
  [[nodiscard]] constexpr std::uint32_t machine() const { return machine_; }
  [[nodiscard]] constexpr std::uint32_t counter() const { return counter_; }

  // Creation time in milliseconds (second resolution).
  [[nodiscard]] constexpr std::int64_t time_millis() const {
    return static_cast<std::int64_t>(time_) * 1000;
  }
  [[nodiscard]] core::TimePoint time_point() const;

  [[nodiscard]] bool is_fresh() const { return fresh_; }
  void clear_fresh() { fresh_ = false; }

  // Field-wise comparison of unsigned values; the fresh flag never participates.
  [[nodiscard]] constexpr bool operator==(const ObjectId& other) const {
    return time_ == other.time_ && machine_ == other.machine_ && counter_ == other.counter_;
  }
  [[nodiscard]] constexpr std::strong_ordering operator<=>(const ObjectId& other) const {
    if (const auto c = time_ <=> other.time_; c != 0) {
      return c;
    }
    if (const auto c = machine_ <=> other.machine_; c != 0) {
      return c;
    }
    return counter_ <=> other.counter_;
  }

 private:
  friend class ObjectIdGenerator;

  std::uint32_t time_{0};
  std::uint32_t machine_{0};
  std::uint32_t counter_{0};
  bool fresh_{false};
};

// Canonical (lowercase, big-endian) hex form.
[[nodiscard]] std::string to_string(const ObjectId& id);
std::ostream& operator<<(std::ostream& os, const ObjectId& id);

// Reverse the byte order of a 32-bit value.
[[nodiscard]] constexpr std::uint32_t flip_bytes(const std::uint32_t x) {
  return ((x << 24) & 0xFF000000u) | ((x << 8) & 0x00FF0000u) | ((x >> 8) & 0x0000FF00u) |
         ((x >> 24) & 0x000000FFu);
}

}  // namespace objid::id

namespace std {

template <>
struct hash<objid::id::ObjectId> {
  std::size_t operator()(const objid::id::ObjectId& id) const noexcept {
    // Wrapping 32-bit mix: time + machine * 111 + counter * 17.
    std::uint32_t x = id.time();
    x += id.machine() * 111u;
    x += id.counter() * 17u;
    return static_cast<std::size_t>(x);
  }
};

}  // namespace std
