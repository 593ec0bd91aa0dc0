#include "objid/id/generator.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace objid::id {

GeneratorContext GeneratorContext::create(const FingerprintSources& sources) {
  const auto fingerprint = derive_fingerprint(sources);
  if (!fingerprint.has_value()) {
    spdlog::error("Object id fingerprint initialization failed: {}", fingerprint.error());
    throw FingerprintInitializationError("fingerprint initialization failed: " +
                                         fingerprint.error());
  }

  std::uint32_t initial_counter = 0;
  try {
    initial_counter = sources.random.next_u32();
  } catch (const std::exception& e) {
    spdlog::error("Object id counter seeding failed: {}", e.what());
    throw FingerprintInitializationError(std::string("counter seeding failed: ") + e.what());
  }

  return GeneratorContext{fingerprint.value().value, initial_counter};
}

GeneratorContext& GeneratorContext::process() {
  // Magic static: initialized once, later reads take no lock.
  static GeneratorContext context = [] {
    SystemNetworkInterfaceSource interfaces;
    SystemProcessIdentitySource process_identity;
    SystemRandomSource random;
    return create(FingerprintSources{interfaces, process_identity, random});
  }();
  return context;
}

ObjectId ObjectIdGenerator::generate() {
  ObjectId id{core::to_epoch_seconds32(clock_.now()), context_.fingerprint(),
              context_.next_counter()};
  id.fresh_ = true;
  return id;
}

ObjectId ObjectIdGenerator::generate(const core::TimePoint time) {
  return ObjectId{core::to_epoch_seconds32(time), context_.fingerprint(), context_.next_counter()};
}

ObjectId ObjectIdGenerator::generate(const core::TimePoint time,
                                     const std::uint32_t counter) const {
  return ObjectId{core::to_epoch_seconds32(time), context_.fingerprint(), counter};
}

ObjectId ObjectIdGenerator::generate(const core::TimePoint time, const std::uint32_t machine,
                                     const std::uint32_t counter) const {
  return ObjectId{core::to_epoch_seconds32(time), machine, counter};
}

ObjectId ObjectIdGenerator::generate(const std::uint32_t time, const std::uint32_t counter) const {
  return ObjectId{time, context_.fingerprint(), counter};
}

ObjectId ObjectIdGenerator::generate(const std::uint32_t time, const std::uint32_t machine,
                                     const std::uint32_t counter) const {
  return ObjectId{time, machine, counter};
}

ObjectId generate() {
  static core::SystemClock clock;
  ObjectIdGenerator generator(GeneratorContext::process(), clock);
  return generator.generate();
}

std::uint32_t current_fingerprint() {
  return GeneratorContext::process().fingerprint();
}

std::uint32_t current_counter_value() {
  return GeneratorContext::process().current_counter();
}

}  // namespace objid::id
