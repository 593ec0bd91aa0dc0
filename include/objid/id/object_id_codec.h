#pragma once

#include "objid/core/result.h"
#include "objid/id/object_id.h"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace objid::id {

using ObjectIdBytes = std::array<std::uint8_t, ObjectId::kByteLength>;

// HexOrder selects how a 24-character string is laid out.
// kCanonical — hex of the big-endian raw bytes (time, machine, counter).
// kLegacy    — canonical byte groups emitted in order 7,6,5,4,3,2,1,0,11,10,9,8.
enum class HexOrder {
  kCanonical,  // NOLINT(readability-identifier-naming)
  kLegacy,     // NOLINT(readability-identifier-naming)
};

// Encoders are pure functions of the three fields and cannot fail.
[[nodiscard]] ObjectIdBytes encode_bytes(const ObjectId& id);
[[nodiscard]] std::string encode_hex(const ObjectId& id);
[[nodiscard]] std::string encode_legacy_hex(const ObjectId& id);

// decode_bytes reads three big-endian 32-bit fields.
// Returns kWrongByteLength unless bytes.size() == 12.
[[nodiscard]] core::Result<ObjectId, core::FormatError> decode_bytes(
    std::span<const std::uint8_t> bytes);

// decode_hex validates the shape (24 hex digits, any case) and reads three
// big-endian 8-digit groups. With HexOrder::kLegacy the legacy reorder is
// undone first. The result is never fresh.
[[nodiscard]] core::Result<ObjectId, core::FormatError> decode_hex(
    std::string_view text, HexOrder order = HexOrder::kCanonical);

// legacy_reorder converts between the canonical and legacy layouts. The
// transform is its own inverse. Case of the input digits is preserved.
[[nodiscard]] core::Result<std::string, core::FormatError> legacy_reorder(std::string_view text);

}  // namespace objid::id
