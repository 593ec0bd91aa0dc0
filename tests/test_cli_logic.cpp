#include "commands/id_logic.h"

#include "objid/core/clock.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

using namespace objid;

namespace {

core::TimePoint at_seconds(std::int64_t secs) {
  return core::TimePoint{std::chrono::seconds{secs}};
}

}  // namespace

TEST_CASE("execute_generate: prints one canonical id per line", "[cli]") {
  id::GeneratorContext context(0x00000002u, 3);
  core::FixedClock clock(at_seconds(1));
  id::ObjectIdGenerator gen(context, clock);

  std::ostringstream out;
  GenerateOptions options;
  options.count = 2;
  CHECK(execute_generate(options, gen, out) == 0);
  CHECK(out.str() == "000000010000000200000003\n000000010000000200000004\n");
}

TEST_CASE("execute_generate: --legacy and --json forms", "[cli]") {
  id::GeneratorContext context(0x00000002u, 3);
  core::FixedClock clock(at_seconds(1));
  id::ObjectIdGenerator gen(context, clock);

  SECTION("legacy") {
    std::ostringstream out;
    GenerateOptions options;
    options.legacy = true;
    CHECK(execute_generate(options, gen, out) == 0);
    CHECK(out.str() == "020000000100000003000000\n");
  }

  SECTION("json") {
    std::ostringstream out;
    GenerateOptions options;
    options.json = true;
    CHECK(execute_generate(options, gen, out) == 0);
    const auto j = nlohmann::json::parse(out.str());
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    CHECK(j[0]["$oid"] == "000000010000000200000003");
  }
}

TEST_CASE("execute_inspect: prints decoded fields", "[cli]") {
  std::ostringstream out;
  std::ostringstream err;
  CHECK(execute_inspect("5f5e100000000002000000ff", id::HexOrder::kCanonical, out, err) == 0);
  CHECK(err.str().empty());

  const auto j = nlohmann::json::parse(out.str());
  CHECK(j["oid"] == "5f5e100000000002000000ff");
  CHECK(j["time"] == 0x5f5e1000u);
  CHECK(j["time_iso8601"] == "2020-09-13T12:26:40Z");
  CHECK(j["machine"] == "00000002");
  CHECK(j["counter"] == 255);
  CHECK(j["legacy"] == "0200000000105e5fff000000");
}

TEST_CASE("execute_inspect: legacy input and invalid input", "[cli]") {
  std::ostringstream out;
  std::ostringstream err;

  CHECK(execute_inspect("020000000100000003000000", id::HexOrder::kLegacy, out, err) == 0);
  CHECK(nlohmann::json::parse(out.str())["oid"] == "000000010000000200000003");

  std::ostringstream bad_out;
  CHECK(execute_inspect("xyz", id::HexOrder::kCanonical, bad_out, err) == 1);
  CHECK(bad_out.str().empty());
  CHECK(err.str().find("xyz") != std::string::npos);
}

TEST_CASE("execute_convert: canonical, legacy and bytes output", "[cli]") {
  std::ostringstream err;

  std::ostringstream legacy;
  CHECK(execute_convert("000000010000000200000003", id::HexOrder::kCanonical, OutputForm::kLegacy,
                        legacy, err) == 0);
  CHECK(legacy.str() == "020000000100000003000000\n");

  std::ostringstream canonical;
  CHECK(execute_convert("020000000100000003000000", id::HexOrder::kLegacy,
                        OutputForm::kCanonical, canonical, err) == 0);
  CHECK(canonical.str() == "000000010000000200000003\n");

  std::ostringstream bytes;
  CHECK(execute_convert("000000010000000200000003", id::HexOrder::kCanonical, OutputForm::kBytes,
                        bytes, err) == 0);
  CHECK(bytes.str() == "00 00 00 01 00 00 00 02 00 00 00 03\n");

  CHECK(err.str().empty());
}

TEST_CASE("execute_fingerprint: prints fingerprint and counter", "[cli]") {
  id::GeneratorContext context(0x00ABCDEFu, 77);
  std::ostringstream out;
  CHECK(execute_fingerprint(context, out) == 0);

  const auto j = nlohmann::json::parse(out.str());
  CHECK(j["fingerprint"] == "00abcdef");
  CHECK(j["counter"] == 77);
}
