#pragma once

#include "objid/id/generator.h"
#include "objid/id/object_id_codec.h"

#include <cstddef>
#include <iosfwd>
#include <string>

// OutputForm selects what `convert` prints.
enum class OutputForm {
  kCanonical,  // NOLINT(readability-identifier-naming)
  kLegacy,     // NOLINT(readability-identifier-naming)
  kBytes,      // NOLINT(readability-identifier-naming)
};

struct GenerateOptions {
  std::size_t count{1};  // NOLINT(readability-identifier-naming)
  bool legacy{false};    // NOLINT(readability-identifier-naming)
  bool json{false};      // NOLINT(readability-identifier-naming)
};

// execute_generate: mint options.count ids and print one per line (or a JSON array).
// execute_inspect: decode text and print its fields as JSON.
// execute_convert: decode text and print it in another representation.
// execute_fingerprint: print the context fingerprint and counter snapshot as JSON.
// All return a process exit code; decode failures go to err.
int execute_generate(const GenerateOptions& options, objid::id::ObjectIdGenerator& generator,
                     std::ostream& out);
int execute_inspect(const std::string& text, objid::id::HexOrder order, std::ostream& out,
                    std::ostream& err);
int execute_convert(const std::string& text, objid::id::HexOrder from, OutputForm to,
                    std::ostream& out, std::ostream& err);
int execute_fingerprint(const objid::id::GeneratorContext& context, std::ostream& out);
