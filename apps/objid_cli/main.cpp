#include "objid/core/version.h"

#include "commands/decode.h"
#include "commands/generate.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "objid_cli v" << objid::core::kBuildVersion << "\n"
            << "Usage:\n"
            << "  objid_cli generate [--count N] [--legacy] [--json] [--log-level L]\n"
            << "  objid_cli inspect <hex> [--legacy] [--log-level L]\n"
            << "  objid_cli convert <hex> [--from canonical|legacy] "
               "[--to canonical|legacy|bytes]\n"
            << "  objid_cli fingerprint [--log-level L]\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "convert") {
    return cmd_convert(argc, argv);
  }
  if (subcommand == "fingerprint") {
    return cmd_fingerprint(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage();
  return 1;
}
