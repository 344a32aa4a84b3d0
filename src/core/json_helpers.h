// Minimal JSON serialization writer (no external dependencies).
//
// Builds JSON output via a string-builder approach. Used for rollup and
// validation reports. Parsing lives in core/json_parser.h.

#ifndef DIRSTAT_CORE_JSON_HELPERS_H
#define DIRSTAT_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dirstat {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("path");
///   writer.value("src/lib");
///   writer.key("file_count");
///   writer.value(uint64_t{3});
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"path":"src/lib","file_count":3}
/// @endcode
///
/// Supports nested objects and arrays. Tracks comma insertion automatically.
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Overload so string literals do not decay to bool.
  void value(const char* val) { value(std::string_view(val)); }

  void value(int val);
  void value(int64_t val);
  void value(uint64_t val);

  /// @brief Write a floating-point value.
  ///
  /// NaN and infinities have no JSON representation and are written as null.
  void value(double val);

  void value(bool val);
  void valueNull();

  /// @brief Get the accumulated JSON string.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Write a comma if needed before the next value/key.
  void maybeComma();

  /// Record that a complete value was written at the current level.
  void markValueWritten();

  void closeContainer(char closer);

  /// Escape special characters in a string for JSON output.
  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: whether the next element needs a comma.
  std::vector<bool> needs_comma_;
};

}  // namespace dirstat

#endif  // DIRSTAT_CORE_JSON_HELPERS_H
