#include "objid/core/hashing.h"

#include <iomanip>
#include <sstream>

namespace objid::core {

std::uint32_t stable_hash32(const std::string_view input) {
  constexpr std::uint32_t kOffset = 2166136261u;
  constexpr std::uint32_t kPrime = 16777619u;

  std::uint32_t hash = kOffset;
  for (const char ch : input) {
    // Explicit cast to unsigned char to avoid sign-extension (ES.46: avoid narrowing conversions).
    const auto c = static_cast<unsigned char>(ch);
    hash ^= static_cast<std::uint32_t>(c);
    hash *= kPrime;
  }
  return hash;
}

std::string hex_u32(const std::uint32_t value) {
  std::ostringstream oss;
  oss << std::hex << value;
  return oss.str();
}

}  // namespace objid::core
