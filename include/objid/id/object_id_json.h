#pragma once

#include "objid/core/result.h"
#include "objid/id/object_id.h"

#include <nlohmann/json.hpp>

namespace objid::id {

/// Serialize to the extended-JSON shape {"$oid": "<canonical hex>"}
[[nodiscard]] nlohmann::json object_id_to_json(const ObjectId& id);

/// Deserialize from {"$oid": "<hex>"} or a bare 24-hex string
[[nodiscard]] core::Result<ObjectId, core::FormatError> object_id_from_json(
    const nlohmann::json& j);

/// nlohmann ADL hooks; from_json throws std::invalid_argument on bad input
void to_json(nlohmann::json& j, const ObjectId& id);
void from_json(const nlohmann::json& j, ObjectId& id);

}  // namespace objid::id
