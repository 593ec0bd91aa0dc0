#include "objid/id/object_id_json.h"

#include "objid/id/object_id_codec.h"

#include <stdexcept>
#include <string>

namespace objid::id {

namespace {
constexpr const char* kOidKey = "$oid";
}  // namespace

nlohmann::json object_id_to_json(const ObjectId& id) {
  nlohmann::json j;
  j[kOidKey] = encode_hex(id);
  return j;
}

core::Result<ObjectId, core::FormatError> object_id_from_json(const nlohmann::json& j) {
  if (j.is_string()) {
    return decode_hex(j.get<std::string>());
  }
  if (j.is_object() && j.size() == 1 && j.contains(kOidKey) && j.at(kOidKey).is_string()) {
    return decode_hex(j.at(kOidKey).get<std::string>());
  }
  return core::Result<ObjectId, core::FormatError>::err(core::FormatError::kUnsupportedShape);
}

void to_json(nlohmann::json& j, const ObjectId& id) {
  j = object_id_to_json(id);
}

void from_json(const nlohmann::json& j, ObjectId& id) {
  const auto decoded = object_id_from_json(j);
  if (!decoded.has_value()) {
    throw std::invalid_argument(core::format_error_message(decoded.error()));
  }
  id = decoded.value();
}

}  // namespace objid::id
