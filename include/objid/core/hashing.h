#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace objid::core {

// FNV-1a 32-bit hash. Stable across platforms and compilers; not cryptographic.
std::uint32_t stable_hash32(std::string_view input);

// Lowercase hex rendering without zero padding ("0" for zero, "1f" for 31).
std::string hex_u32(std::uint32_t value);

}  // namespace objid::core
