#include "objid/id/object_id.h"

#include "objid/id/object_id_codec.h"

#include <ostream>

namespace objid::id {

core::TimePoint ObjectId::time_point() const {
  return core::from_epoch_seconds32(time_);
}

std::string to_string(const ObjectId& id) {
  return encode_hex(id);
}

std::ostream& operator<<(std::ostream& os, const ObjectId& id) {
  return os << encode_hex(id);
}

}  // namespace objid::id
