#include "id_logic.h"

#include "objid/id/object_id_json.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace {

std::string format_iso8601(const objid::id::ObjectId& id) {
  const auto seconds = static_cast<std::time_t>(id.time());
  std::tm tm_utc{};
  gmtime_r(&seconds, &tm_utc);

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string format_hex32(const std::uint32_t value) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(8) << value;
  return oss.str();
}

std::string format_bytes(const objid::id::ObjectIdBytes& bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i != 0) {
      oss << ' ';
    }
    oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
  }
  return oss.str();
}

}  // namespace

int execute_generate(const GenerateOptions& options, objid::id::ObjectIdGenerator& generator,
                     std::ostream& out) {
  nlohmann::json ids = nlohmann::json::array();

  for (std::size_t i = 0; i < options.count; ++i) {
    const auto id = generator.generate();
    if (options.json) {
      ids.push_back(objid::id::object_id_to_json(id));
    } else {
      out << (options.legacy ? objid::id::encode_legacy_hex(id) : objid::id::encode_hex(id))
          << "\n";
    }
  }

  if (options.json) {
    out << ids.dump(2) << "\n";
  }
  return 0;
}

int execute_inspect(const std::string& text, const objid::id::HexOrder order, std::ostream& out,
                    std::ostream& err) {
  const auto decoded = objid::id::decode_hex(text, order);
  if (!decoded.has_value()) {
    err << "Invalid object id '" << text
        << "': " << objid::core::format_error_message(decoded.error()) << "\n";
    return 1;
  }

  const auto& id = decoded.value();
  nlohmann::json j;
  j["oid"] = objid::id::encode_hex(id);
  j["legacy"] = objid::id::encode_legacy_hex(id);
  j["time"] = id.time();
  j["time_iso8601"] = format_iso8601(id);
  j["machine"] = format_hex32(id.machine());
  j["counter"] = id.counter();

  out << j.dump(2) << "\n";
  return 0;
}

int execute_convert(const std::string& text, const objid::id::HexOrder from, const OutputForm to,
                    std::ostream& out, std::ostream& err) {
  const auto decoded = objid::id::decode_hex(text, from);
  if (!decoded.has_value()) {
    err << "Invalid object id '" << text
        << "': " << objid::core::format_error_message(decoded.error()) << "\n";
    return 1;
  }

  const auto& id = decoded.value();
  switch (to) {
    case OutputForm::kCanonical:
      out << objid::id::encode_hex(id) << "\n";
      break;
    case OutputForm::kLegacy:
      out << objid::id::encode_legacy_hex(id) << "\n";
      break;
    case OutputForm::kBytes:
      out << format_bytes(objid::id::encode_bytes(id)) << "\n";
      break;
  }
  return 0;
}

int execute_fingerprint(const objid::id::GeneratorContext& context, std::ostream& out) {
  nlohmann::json j;
  j["fingerprint"] = format_hex32(context.fingerprint());
  j["counter"] = context.current_counter();
  out << j.dump(2) << "\n";
  return 0;
}
