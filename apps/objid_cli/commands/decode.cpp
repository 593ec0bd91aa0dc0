#include "decode.h"

#include "objid/id/object_id_codec.h"

#include "id_logic.h"
#include "shared/arg_parser.h"
#include "shared/log_level.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct DecodeCliConfig {
  objid::id::HexOrder from{objid::id::HexOrder::kCanonical};
  OutputForm to{OutputForm::kCanonical};
};

bool parse_from(DecodeCliConfig& c, const std::string& v) {
  if (v == "canonical") {
    c.from = objid::id::HexOrder::kCanonical;
    return true;
  }
  if (v == "legacy") {
    c.from = objid::id::HexOrder::kLegacy;
    return true;
  }
  std::cerr << "Invalid --from: " << v << " (valid: canonical, legacy)\n";
  return false;
}

bool parse_to(DecodeCliConfig& c, const std::string& v) {
  if (v == "canonical") {
    c.to = OutputForm::kCanonical;
    return true;
  }
  if (v == "legacy") {
    c.to = OutputForm::kLegacy;
    return true;
  }
  if (v == "bytes") {
    c.to = OutputForm::kBytes;
    return true;
  }
  std::cerr << "Invalid --to: " << v << " (valid: canonical, legacy, bytes)\n";
  return false;
}

bool set_log_level(DecodeCliConfig&, const std::string& v) {
  return objid::apps::apply_log_level(v);
}

// Exactly one positional (the id text) is accepted.
bool require_single_positional(const std::vector<std::string>& positionals, const char* usage) {
  if (positionals.size() != 1) {
    std::cerr << "Usage: " << usage << "\n";
    return false;
  }
  return true;
}

}  // namespace

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<objid::apps::Option<DecodeCliConfig>> options = {
      {"--legacy", false, "Input is in the legacy byte-reordered form",
       [](DecodeCliConfig& c, const std::string&) {
         c.from = objid::id::HexOrder::kLegacy;
         return true;
       }},
      {"--log-level", true, "spdlog level (trace|debug|info|warn|error|critical|off)",
       set_log_level},
  };
  const auto parsed = objid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok ||
      !require_single_positional(parsed.positionals, "objid_cli inspect <hex> [--legacy]")) {
    return 1;
  }

  return execute_inspect(parsed.positionals.front(), parsed.config.from, std::cout, std::cerr);
}

int cmd_convert(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<objid::apps::Option<DecodeCliConfig>> options = {
      {"--from", true, "Input form (canonical|legacy, default canonical)", parse_from},
      {"--to", true, "Output form (canonical|legacy|bytes, default canonical)", parse_to},
      {"--log-level", true, "spdlog level (trace|debug|info|warn|error|critical|off)",
       set_log_level},
  };
  const auto parsed = objid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok ||
      !require_single_positional(parsed.positionals,
                                 "objid_cli convert <hex> [--from F] [--to canonical|legacy|bytes]")) {
    return 1;
  }

  return execute_convert(parsed.positionals.front(), parsed.config.from, parsed.config.to,
                         std::cout, std::cerr);
}
