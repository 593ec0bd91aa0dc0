#include "objid/id/object_id_codec.h"

#include "objid/id/object_id_compare.h"

namespace objid::id {

namespace {

constexpr std::array<char, 16> kHexDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                             '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

// Byte-group order of the legacy layout: first 8 bytes reversed, last 4 reversed.
constexpr std::array<std::size_t, ObjectId::kByteLength> kLegacyGroupOrder = {7, 6, 5,  4,  3, 2,
                                                                              1, 0, 11, 10, 9, 8};

void write_u32_be(ObjectIdBytes& out, const std::size_t offset, const std::uint32_t v) {
  out[offset] = static_cast<std::uint8_t>(v >> 24);
  out[offset + 1] = static_cast<std::uint8_t>(v >> 16);
  out[offset + 2] = static_cast<std::uint8_t>(v >> 8);
  out[offset + 3] = static_cast<std::uint8_t>(v);
}

std::uint32_t read_u32_be(const std::span<const std::uint8_t> in, const std::size_t offset) {
  return (static_cast<std::uint32_t>(in[offset]) << 24) |
         (static_cast<std::uint32_t>(in[offset + 1]) << 16) |
         (static_cast<std::uint32_t>(in[offset + 2]) << 8) |
         static_cast<std::uint32_t>(in[offset + 3]);
}

// Caller guarantees ch is a hex digit.
std::uint32_t hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return static_cast<std::uint32_t>(ch - '0');
  }
  if (ch >= 'a' && ch <= 'f') {
    return static_cast<std::uint32_t>(ch - 'a' + 10);
  }
  return static_cast<std::uint32_t>(ch - 'A' + 10);
}

std::uint32_t read_u32_hex(const std::string_view text, const std::size_t offset) {
  std::uint32_t x = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    x = (x << 4) | hex_value(text[offset + i]);
  }
  return x;
}

core::FormatError shape_error(const std::string_view text) {
  return text.size() != ObjectId::kHexLength ? core::FormatError::kWrongHexLength
                                             : core::FormatError::kInvalidHexDigit;
}

std::string reorder_groups(const std::string_view text) {
  std::string out;
  out.reserve(ObjectId::kHexLength);
  for (const std::size_t group : kLegacyGroupOrder) {
    out.append(text.substr(group * 2, 2));
  }
  return out;
}

}  // namespace

ObjectIdBytes encode_bytes(const ObjectId& id) {
  ObjectIdBytes out{};
  write_u32_be(out, 0, id.time());
  write_u32_be(out, 4, id.machine());
  write_u32_be(out, 8, id.counter());
  return out;
}

std::string encode_hex(const ObjectId& id) {
  const auto bytes = encode_bytes(id);
  std::string out(ObjectId::kHexLength, '0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[i * 2] = kHexDigits[(bytes[i] >> 4) & 0x0F];
    out[i * 2 + 1] = kHexDigits[bytes[i] & 0x0F];
  }
  return out;
}

std::string encode_legacy_hex(const ObjectId& id) {
  return reorder_groups(encode_hex(id));
}

core::Result<ObjectId, core::FormatError> decode_bytes(const std::span<const std::uint8_t> bytes) {
  if (bytes.size() != ObjectId::kByteLength) {
    return core::Result<ObjectId, core::FormatError>::err(core::FormatError::kWrongByteLength);
  }
  return core::Result<ObjectId, core::FormatError>::ok(
      ObjectId{read_u32_be(bytes, 0), read_u32_be(bytes, 4), read_u32_be(bytes, 8)});
}

core::Result<ObjectId, core::FormatError> decode_hex(const std::string_view text,
                                                      const HexOrder order) {
  if (!is_valid(text)) {
    return core::Result<ObjectId, core::FormatError>::err(shape_error(text));
  }

  std::string canonical{text};
  if (order == HexOrder::kLegacy) {
    canonical = reorder_groups(text);
  }

  return core::Result<ObjectId, core::FormatError>::ok(ObjectId{
      read_u32_hex(canonical, 0), read_u32_hex(canonical, 8), read_u32_hex(canonical, 16)});
}

core::Result<std::string, core::FormatError> legacy_reorder(const std::string_view text) {
  if (!is_valid(text)) {
    return core::Result<std::string, core::FormatError>::err(shape_error(text));
  }
  return core::Result<std::string, core::FormatError>::ok(reorder_groups(text));
}

}  // namespace objid::id
