#pragma once

#include "objid/core/clock.h"
#include "objid/id/fingerprint.h"
#include "objid/id/object_id.h"

#include <atomic>
#include <cstdint>

namespace objid::id {

// GeneratorContext owns the state shared by every generation in a process:
// the fingerprint (fixed for the context's lifetime) and the counter.
// Thread-safe: the counter is a lock-free atomic, the fingerprint is immutable.
class GeneratorContext {
 public:
  GeneratorContext(std::uint32_t fingerprint, std::uint32_t initial_counter)
      : fingerprint_(fingerprint), counter_(initial_counter) {}
  ~GeneratorContext() = default;

  // Not copyable or movable (contains atomic counter)
  GeneratorContext(const GeneratorContext&) = delete;
  GeneratorContext& operator=(const GeneratorContext&) = delete;
  GeneratorContext(GeneratorContext&&) = delete;
  GeneratorContext& operator=(GeneratorContext&&) = delete;

  // Derives the fingerprint from sources and seeds the counter from
  // sources.random. Throws FingerprintInitializationError on failure.
  [[nodiscard]] static GeneratorContext create(const FingerprintSources& sources);

  // The process-wide context, built from the system sources on first use.
  // Concurrent first callers wait for the single initialization; if it throws,
  // the next call tries again.
  [[nodiscard]] static GeneratorContext& process();

  [[nodiscard]] std::uint32_t fingerprint() const { return fingerprint_; }

  // Atomic fetch-and-increment; wraps from 0xFFFFFFFF to 0.
  [[nodiscard]] std::uint32_t next_counter() {
    return counter_.fetch_add(1, std::memory_order_relaxed);
  }

  // Snapshot of the value the next generation will use.
  [[nodiscard]] std::uint32_t current_counter() const {
    return counter_.load(std::memory_order_relaxed);
  }

 private:
  const std::uint32_t fingerprint_;
  std::atomic<std::uint32_t> counter_;
};

// ObjectIdGenerator builds ObjectIds from a context and a clock.
// Holds references (not ownership); both must outlive the generator.
class ObjectIdGenerator {
 public:
  ObjectIdGenerator(GeneratorContext& context, core::IClock& clock)
      : context_(context), clock_(clock) {}

  // Current time, context fingerprint, next counter value. The result is fresh.
  [[nodiscard]] ObjectId generate();

  // Given time, context fingerprint, next counter value.
  [[nodiscard]] ObjectId generate(core::TimePoint time);

  // Explicit fields; the counter is not advanced.
  [[nodiscard]] ObjectId generate(core::TimePoint time, std::uint32_t counter) const;
  [[nodiscard]] ObjectId generate(core::TimePoint time, std::uint32_t machine,
                                  std::uint32_t counter) const;
  [[nodiscard]] ObjectId generate(std::uint32_t time, std::uint32_t counter) const;
  [[nodiscard]] ObjectId generate(std::uint32_t time, std::uint32_t machine,
                                  std::uint32_t counter) const;

 private:
  GeneratorContext& context_;
  core::IClock& clock_;
};

// Process-wide shorthands backed by GeneratorContext::process() and the system clock.
[[nodiscard]] ObjectId generate();
[[nodiscard]] std::uint32_t current_fingerprint();
[[nodiscard]] std::uint32_t current_counter_value();

}  // namespace objid::id
