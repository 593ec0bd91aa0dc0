#include "generate.h"

#include "objid/core/clock.h"
#include "objid/id/fingerprint.h"
#include "objid/id/generator.h"

#include "id_logic.h"
#include "shared/arg_parser.h"
#include "shared/log_level.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  GenerateOptions options;
};

struct FingerprintCliConfig {};

bool parse_count(GenerateCliConfig& c, const std::string& v) {
  if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos || v.size() > 9) {
    std::cerr << "Invalid --count: " << v << " (expected 1-999999999)\n";
    return false;
  }
  c.options.count = std::stoul(v);
  if (c.options.count == 0) {
    std::cerr << "Invalid --count: 0 (expected 1-999999999)\n";
    return false;
  }
  return true;
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<objid::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of ids to generate (default 1)", parse_count},
      {"--legacy", false, "Print the legacy byte-reordered form",
       [](GenerateCliConfig& c, const std::string&) {
         c.options.legacy = true;
         return true;
       }},
      {"--json", false, "Print a JSON array of {\"$oid\": ...} objects",
       [](GenerateCliConfig& c, const std::string&) {
         c.options.json = true;
         return true;
       }},
      {"--log-level", true, "spdlog level (trace|debug|info|warn|error|critical|off)",
       [](GenerateCliConfig&, const std::string& v) { return objid::apps::apply_log_level(v); }},
  };
  const auto parsed = objid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }

  try {
    objid::core::SystemClock clock;
    objid::id::ObjectIdGenerator generator(objid::id::GeneratorContext::process(), clock);
    return execute_generate(parsed.config.options, generator, std::cout);
  } catch (const objid::id::FingerprintInitializationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}

int cmd_fingerprint(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<objid::apps::Option<FingerprintCliConfig>> options = {
      {"--log-level", true, "spdlog level (trace|debug|info|warn|error|critical|off)",
       [](FingerprintCliConfig&, const std::string& v) {
         return objid::apps::apply_log_level(v);
       }},
  };
  const auto parsed = objid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }

  try {
    return execute_fingerprint(objid::id::GeneratorContext::process(), std::cout);
  } catch (const objid::id::FingerprintInitializationError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
