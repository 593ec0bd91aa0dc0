#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace objid::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// FormatError is the only error a decode boundary can report.
enum class FormatError {
  kWrongByteLength,   // raw input is not exactly 12 bytes
  kWrongHexLength,    // text input is not exactly 24 characters
  kInvalidHexDigit,   // text input contains a character outside 0-9a-fA-F
  kUnsupportedShape,  // structured input (JSON) is neither a string nor an {"$oid": ...} object
};

// format_error_message returns a short, stable description of a FormatError.
[[nodiscard]] inline std::string format_error_message(const FormatError error) {
  switch (error) {
    case FormatError::kWrongByteLength:
      return "object id requires exactly 12 bytes";
    case FormatError::kWrongHexLength:
      return "object id requires exactly 24 hex characters";
    case FormatError::kInvalidHexDigit:
      return "object id contains a non-hex character";
    case FormatError::kUnsupportedShape:
      return "value cannot represent an object id";
  }
  return "unknown format error";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace objid::core
