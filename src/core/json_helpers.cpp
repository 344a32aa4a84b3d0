/// @file
/// @brief Implementation of the minimal JSON writer for structured output.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <locale>
#include <sstream>

namespace dirstat {

namespace {

/// Significant digits for doubles: integral counts print exactly and short
/// fractions stay short.
constexpr int kDoublePrecision = 15;

}  // namespace

void JsonWriter::beginObject() {
  maybeComma();
  buffer_ += '{';
  needs_comma_.push_back(false);
}

void JsonWriter::endObject() { closeContainer('}'); }

void JsonWriter::beginArray() {
  maybeComma();
  buffer_ += '[';
  needs_comma_.push_back(false);
}

void JsonWriter::endArray() { closeContainer(']'); }

void JsonWriter::closeContainer(char closer) {
  buffer_ += closer;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  markValueWritten();
}

void JsonWriter::key(std::string_view name) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value that follows belongs to this key: no comma before it.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = false;
  }
}

void JsonWriter::value(std::string_view val) {
  maybeComma();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
  markValueWritten();
}

void JsonWriter::value(int val) {
  value(static_cast<int64_t>(val));
}

void JsonWriter::value(int64_t val) {
  maybeComma();
  buffer_ += std::to_string(val);
  markValueWritten();
}

void JsonWriter::value(uint64_t val) {
  maybeComma();
  buffer_ += std::to_string(val);
  markValueWritten();
}

void JsonWriter::value(double val) {
  maybeComma();
  if (!std::isfinite(val)) {
    buffer_ += "null";
  } else if (val == 0.0) {
    // Collapse -0.0 so identical reports compare equal byte for byte.
    buffer_ += '0';
  } else {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss.precision(kDoublePrecision);
    oss << val;
    buffer_ += oss.str();
  }
  markValueWritten();
}

void JsonWriter::value(bool val) {
  maybeComma();
  buffer_ += val ? "true" : "false";
  markValueWritten();
}

void JsonWriter::valueNull() {
  maybeComma();
  buffer_ += "null";
  markValueWritten();
}

std::string JsonWriter::toString() const {
  return buffer_;
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string result;
  result.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    result += '\n';
    result.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      result += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        result += chr;
        break;

      case '{':
      case '[': {
        result += chr;
        ++depth;
        bool empty_container = pos + 1 < buffer_.size() &&
                               (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']');
        if (!empty_container) newline();
        break;
      }

      case '}':
      case ']':
        --depth;
        if (result.back() != '{' && result.back() != '[') newline();
        result += chr;
        break;

      case ',':
        result += chr;
        newline();
        break;

      case ':':
        result += ": ";
        break;

      default:
        result += chr;
        break;
    }
  }

  return result;
}

void JsonWriter::maybeComma() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
    needs_comma_.back() = false;
  }
}

void JsonWriter::markValueWritten() {
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace dirstat
