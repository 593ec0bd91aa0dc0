#include "objid/core/clock.h"
#include "objid/id/generator.h"
#include "objid/id/object_id_codec.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace objid;
using id::GeneratorContext;
using id::ObjectId;
using id::ObjectIdGenerator;

namespace {

core::TimePoint at_seconds(std::int64_t secs) {
  return core::TimePoint{std::chrono::seconds{secs}};
}

}  // namespace

TEST_CASE("ObjectIdGenerator: generate() uses clock, fingerprint and counter", "[generator]") {
  GeneratorContext context(0xCAFEBABEu, 100);
  core::FixedClock clock(at_seconds(1700000000));
  ObjectIdGenerator gen(context, clock);

  const auto first = gen.generate();
  const auto second = gen.generate();

  CHECK(first.time() == 1700000000u);
  CHECK(first.machine() == 0xCAFEBABEu);
  CHECK(first.counter() == 100);
  CHECK(second.counter() == 101);
  CHECK(context.current_counter() == 102);
  CHECK(first < second);
}

TEST_CASE("ObjectIdGenerator: sub-second precision is truncated", "[generator]") {
  GeneratorContext context(1, 0);
  core::FixedClock clock(at_seconds(1700000000) + std::chrono::milliseconds{999});
  ObjectIdGenerator gen(context, clock);

  CHECK(gen.generate().time() == 1700000000u);
}

TEST_CASE("ObjectIdGenerator: time beyond 32 bits wraps", "[generator]") {
  GeneratorContext context(1, 0);
  core::FixedClock clock(at_seconds(0x100000005LL));
  ObjectIdGenerator gen(context, clock);

  CHECK(gen.generate().time() == 5u);
}

TEST_CASE("ObjectIdGenerator: fresh flag", "[generator][fresh]") {
  GeneratorContext context(7, 0);
  core::FixedClock clock(at_seconds(1));
  ObjectIdGenerator gen(context, clock);

  SECTION("generated values are fresh") {
    const auto oid = gen.generate();
    CHECK(oid.is_fresh());
  }

  SECTION("clear_fresh is idempotent") {
    auto oid = gen.generate();
    oid.clear_fresh();
    CHECK_FALSE(oid.is_fresh());
    oid.clear_fresh();
    CHECK_FALSE(oid.is_fresh());
  }

  SECTION("round-tripping through text drops the flag but keeps equality") {
    const auto oid = gen.generate();
    const auto decoded = id::decode_hex(id::encode_hex(oid));
    REQUIRE(decoded.has_value());
    CHECK_FALSE(decoded.value().is_fresh());
    CHECK(decoded.value() == oid);
  }

  SECTION("explicit-field overloads are not fresh") {
    CHECK_FALSE(gen.generate(1u, 2u).is_fresh());
    CHECK_FALSE(gen.generate(1u, 2u, 3u).is_fresh());
    CHECK_FALSE(gen.generate(at_seconds(1)).is_fresh());
  }
}

TEST_CASE("ObjectIdGenerator: explicit-field overloads", "[generator]") {
  GeneratorContext context(0xAAAA5555u, 10);
  core::FixedClock clock(at_seconds(0));
  ObjectIdGenerator gen(context, clock);

  const auto with_counter = gen.generate(123u, 456u);
  CHECK(with_counter == ObjectId{123u, 0xAAAA5555u, 456u});

  const auto all_fields = gen.generate(1u, 2u, 3u);
  CHECK(all_fields == ObjectId{1u, 2u, 3u});

  const auto from_time = gen.generate(at_seconds(1234) + std::chrono::milliseconds{500}, 9u);
  CHECK(from_time == ObjectId{1234u, 0xAAAA5555u, 9u});

  const auto from_time_machine = gen.generate(at_seconds(99), 0x01020304u, 5u);
  CHECK(from_time_machine == ObjectId{99u, 0x01020304u, 5u});

  // None of the above consumed a counter value.
  CHECK(context.current_counter() == 10);

  const auto from_time_only = gen.generate(at_seconds(42));
  CHECK(from_time_only == ObjectId{42u, 0xAAAA5555u, 10u});
  CHECK(context.current_counter() == 11);
}

TEST_CASE("GeneratorContext: counter wraps from max to zero", "[generator]") {
  GeneratorContext context(1, 0xFFFFFFFFu);
  CHECK(context.next_counter() == 0xFFFFFFFFu);
  CHECK(context.next_counter() == 0u);
  CHECK(context.current_counter() == 1u);
}

TEST_CASE("ObjectIdGenerator: concurrent generation never repeats a counter",
          "[generator][concurrency]") {
  constexpr std::size_t kThreads = 8;
  constexpr std::size_t kPerThread = 12500;  // 100,000 ids in total

  GeneratorContext context(0x12345678u, 0xFFFF0000u);  // crosses the wrap point
  core::SystemClock clock;

  std::vector<std::vector<ObjectId>> produced(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (std::size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      ObjectIdGenerator gen(context, clock);
      produced[t].reserve(kPerThread);
      for (std::size_t i = 0; i < kPerThread; ++i) {
        produced[t].push_back(gen.generate());
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  std::unordered_set<std::uint32_t> counters;
  bool same_fingerprint = true;
  for (const auto& batch : produced) {
    for (const auto& oid : batch) {
      counters.insert(oid.counter());
      same_fingerprint = same_fingerprint && oid.machine() == 0x12345678u;
    }
  }

  CHECK(counters.size() == kThreads * kPerThread);
  CHECK(same_fingerprint);
  CHECK(context.current_counter() ==
        static_cast<std::uint32_t>(0xFFFF0000u + kThreads * kPerThread));
}

TEST_CASE("Process context: shared fingerprint and advancing counter", "[generator][process]") {
  const auto fingerprint = id::current_fingerprint();
  const auto before = id::current_counter_value();

  const auto first = id::generate();
  const auto second = id::generate();

  CHECK(first.is_fresh());
  CHECK(first.machine() == fingerprint);
  CHECK(second.machine() == fingerprint);
  CHECK(first.counter() == before);
  CHECK(second.counter() == static_cast<std::uint32_t>(before + 1));
  CHECK(&GeneratorContext::process() == &GeneratorContext::process());
}

TEST_CASE("Process context: concurrent first use yields one fingerprint",
          "[generator][process][concurrency]") {
  constexpr std::size_t kThreads = 16;
  std::vector<std::uint32_t> seen(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (std::size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&seen, t] { seen[t] = id::generate().machine(); });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  CHECK(std::all_of(seen.begin(), seen.end(),
                    [&](std::uint32_t m) { return m == id::current_fingerprint(); }));
}
