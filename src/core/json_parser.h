// Minimal flat-object JSON parser for request input (no external dependencies).
//
// Handles a top-level object whose values are strings, numbers, booleans or
// null. Nested objects and arrays are skipped but their presence is recorded
// so that callers can reject a wrongly typed field.

#ifndef CODESONIFY_CORE_JSON_PARSER_H
#define CODESONIFY_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace codesonify {

/// @brief A single top-level JSON value.
struct JsonValue {
  enum Type { String, Number, Bool, Null, Object, Array };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Lowercase type name for diagnostics ("string", "array", ...).
  const char* typeName() const;
};

using JsonObject = std::map<std::string, JsonValue>;

/// @brief Parse a flat JSON object.
/// @param json JSON text.
/// @param length Length of the text.
/// @param out Receives the key/value pairs (cleared first).
/// @param error Receives a description of the first syntax error.
/// @return False on malformed input.
bool parseJsonObject(const char* json, size_t length, JsonObject& out,
                     std::string& error);

/// @brief Lenient variant: returns an empty map on parse error.
JsonObject parseJsonObject(const char* json, size_t length);

}  // namespace codesonify

#endif  // CODESONIFY_CORE_JSON_PARSER_H
