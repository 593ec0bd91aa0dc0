#include "objid/id/object_id.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <functional>
#include <sstream>
#include <unordered_set>

using namespace objid::id;

TEST_CASE("ObjectId: accessors return constructor fields", "[object_id]") {
  const ObjectId oid{0x5F000000u, 0xCAFEBABEu, 42};
  CHECK(oid.time() == 0x5F000000u);
  CHECK(oid.machine() == 0xCAFEBABEu);
  CHECK(oid.counter() == 42);
  CHECK_FALSE(oid.is_fresh());
}

TEST_CASE("ObjectId: default value is all zero", "[object_id]") {
  const ObjectId oid;
  CHECK(oid == ObjectId{0, 0, 0});
  CHECK(to_string(oid) == "000000000000000000000000");
}

TEST_CASE("ObjectId: time_millis and time_point use second resolution", "[object_id]") {
  const ObjectId oid{1700000000u, 0, 0};
  CHECK(oid.time_millis() == 1700000000000LL);

  const auto secs =
      std::chrono::duration_cast<std::chrono::seconds>(oid.time_point().time_since_epoch());
  CHECK(secs.count() == 1700000000LL);

  // Above the signed 32-bit range the value stays positive.
  CHECK(ObjectId{0xFFFFFFFFu, 0, 0}.time_millis() == 4294967295000LL);
}

TEST_CASE("ObjectId: streaming and to_string emit the canonical form", "[object_id]") {
  const ObjectId oid{1, 2, 3};
  std::ostringstream oss;
  oss << oid;
  CHECK(oss.str() == "000000010000000200000003");
  CHECK(to_string(oid) == oss.str());
}

TEST_CASE("ObjectId: hash mixes fields as time + machine*111 + counter*17", "[object_id]") {
  const std::hash<ObjectId> hasher;
  CHECK(hasher(ObjectId{1, 2, 3}) == static_cast<std::size_t>(1u + 2u * 111u + 3u * 17u));

  // 32-bit wraparound.
  const std::uint32_t wrapped = 0xFFFFFFFFu + 0xFFFFFFFFu * 111u + 0xFFFFFFFFu * 17u;
  CHECK(hasher(ObjectId{0xFFFFFFFFu, 0xFFFFFFFFu, 0xFFFFFFFFu}) ==
        static_cast<std::size_t>(wrapped));
}

TEST_CASE("ObjectId: usable as an unordered_set key", "[object_id]") {
  std::unordered_set<ObjectId> ids;
  ids.insert(ObjectId{1, 2, 3});
  ids.insert(ObjectId{1, 2, 3});
  ids.insert(ObjectId{1, 2, 4});
  CHECK(ids.size() == 2);
}

TEST_CASE("flip_bytes reverses byte order", "[object_id]") {
  CHECK(flip_bytes(0x01020304u) == 0x04030201u);
  CHECK(flip_bytes(0xFF000000u) == 0x000000FFu);
  CHECK(flip_bytes(flip_bytes(0xDEADBEEFu)) == 0xDEADBEEFu);
  static_assert(flip_bytes(0x11223344u) == 0x44332211u);
}
