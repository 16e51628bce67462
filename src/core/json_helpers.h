// Minimal JSON serialization writer (no external dependencies).
//
// Builds compositions and analyses as JSON text for presentation layers.
// Does not parse JSON; see core/json_parser.h for request input.

#ifndef CODESONIFY_CORE_JSON_HELPERS_H
#define CODESONIFY_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codesonify {

/// @brief Incremental JSON writer with automatic comma placement.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("pitch");
///   writer.value("C4");
///   writer.key("velocity");
///   writer.value(0.7);
///   writer.endObject();
///   // -> {"pitch":"C4","velocity":0.7}
/// @endcode
///
/// Callers are responsible for balancing begin/end calls.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key; the next call must write its value.
  void key(std::string_view name);

  /// @brief Write a JSON-escaped string value.
  void value(std::string_view val);

  /// @brief Overload so string literals do not decay to bool.
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(uint32_t val);
  void value(uint64_t val);

  /// @brief Write a number. NaN and infinity are written as null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Compact JSON text written so far.
  std::string toString() const { return buffer_; }

  /// @brief Re-indent the compact text.
  /// @param indent_size Spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Emit a separating comma when the current container already has an element.
  void beforeElement();

  /// Mark that the current container now holds an element.
  void afterElement();

  static std::string escape(std::string_view input);

  std::string buffer_;
  std::vector<bool> has_element_;  // One entry per open container.
};

}  // namespace codesonify

#endif  // CODESONIFY_CORE_JSON_HELPERS_H
