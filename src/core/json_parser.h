// Minimal recursive JSON parser for record and config input (no external
// dependencies).
//
// Produces a small DOM of JsonValue nodes. Objects keep keys sorted
// (std::map); duplicate keys keep the last value.

#ifndef DIRSTAT_CORE_JSON_PARSER_H
#define DIRSTAT_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dirstat {

/// @brief A single JSON value of any type.
struct JsonValue {
  enum Type { Null, Bool, Number, String, Array, Object };
  Type type = Null;
  bool bool_val = false;
  double number_val = 0.0;
  std::string string_val;
  std::vector<JsonValue> array_val;
  std::map<std::string, JsonValue> object_val;

  bool isNull() const { return type == Null; }
  bool isBool() const { return type == Bool; }
  bool isNumber() const { return type == Number; }
  bool isString() const { return type == String; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Look up an object member.
  /// @return Pointer to the member, or nullptr if absent or not an object.
  const JsonValue* find(const std::string& name) const;
};

/// @brief Parse a complete JSON document.
///
/// Trailing non-whitespace after the top-level value is an error.
///
/// @param text JSON text.
/// @param out Receives the parsed document on success.
/// @param error Receives "offset N: message" on failure (may be null).
/// @return True on success.
bool parseJson(std::string_view text, JsonValue& out, std::string* error);

}  // namespace dirstat

#endif  // DIRSTAT_CORE_JSON_PARSER_H
