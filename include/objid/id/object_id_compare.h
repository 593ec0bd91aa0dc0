#pragma once

#include "objid/id/object_id.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace objid::id {

// CoercibleValue is the closed set of inputs accepted by try_coerce/equals:
// no value, an already-decoded ObjectId, or text that may hold a canonical id.
using CoercibleValue = std::variant<std::monostate, ObjectId, std::string>;

// is_valid returns true iff text is exactly 24 ASCII hex digits (0-9, a-f, A-F).
[[nodiscard]] bool is_valid(std::string_view text);

// try_coerce returns the ObjectId held by (or canonically encoded in) value,
// or nullopt when value is empty or text that fails is_valid().
[[nodiscard]] std::optional<ObjectId> try_coerce(const CoercibleValue& value);

// compare orders by (time, machine, counter) as unsigned values.
// Returns -1, 0 or 1. An absent rhs sorts first, so any present lhs is greater.
[[nodiscard]] int compare(const ObjectId& lhs, const std::optional<ObjectId>& rhs);

// equals coerces rhs and compares all three fields.
[[nodiscard]] bool equals(const ObjectId& lhs, const CoercibleValue& rhs);

}  // namespace objid::id
