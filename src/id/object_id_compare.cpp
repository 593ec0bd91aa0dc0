#include "objid/id/object_id_compare.h"

#include "objid/id/object_id_codec.h"

#include <type_traits>

namespace objid::id {

bool is_valid(const std::string_view text) {
  if (text.size() != ObjectId::kHexLength) {
    return false;
  }

  for (const char ch : text) {
    if (ch >= '0' && ch <= '9') {
      continue;
    }
    if (ch >= 'a' && ch <= 'f') {
      continue;
    }
    if (ch >= 'A' && ch <= 'F') {
      continue;
    }
    return false;
  }

  return true;
}

std::optional<ObjectId> try_coerce(const CoercibleValue& value) {
  return std::visit(
      [](const auto& v) -> std::optional<ObjectId> {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, ObjectId>) {
          return v;
        } else if constexpr (std::is_same_v<V, std::string>) {
          auto decoded = decode_hex(v);
          if (!decoded.has_value()) {
            return std::nullopt;
          }
          return decoded.value();
        } else {
          return std::nullopt;
        }
      },
      value);
}

int compare(const ObjectId& lhs, const std::optional<ObjectId>& rhs) {
  if (!rhs.has_value()) {
    return 1;
  }

  const auto order = lhs <=> *rhs;
  if (order < 0) {
    return -1;
  }
  if (order > 0) {
    return 1;
  }
  return 0;
}

bool equals(const ObjectId& lhs, const CoercibleValue& rhs) {
  const auto other = try_coerce(rhs);
  return other.has_value() && lhs == *other;
}

}  // namespace objid::id
