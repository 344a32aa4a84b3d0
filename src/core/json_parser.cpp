// Implementation of the minimal recursive JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>

namespace dirstat {

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

const JsonValue* JsonValue::find(const std::string& name) const {
  if (type != Object) return nullptr;
  auto iter = object_val.find(name);
  return iter != object_val.end() ? &iter->second : nullptr;
}

namespace {

/// Nesting limit guarding the recursive descent against stack exhaustion.
constexpr int kMaxDepth = 256;

/// @brief Recursive-descent parser over a string view.
class Parser {
 public:
  explicit Parser(std::string_view text) : text_(text) {}

  bool parseDocument(JsonValue& out) {
    skipWhitespace();
    if (!parseValue(out, 0)) return false;
    skipWhitespace();
    if (pos_ != text_.size()) return fail("unexpected trailing characters");
    return true;
  }

  const std::string& error() const { return error_; }

 private:
  bool fail(const char* message) {
    if (error_.empty()) {
      error_ = "offset " + std::to_string(pos_) + ": " + message;
    }
    return false;
  }

  void skipWhitespace() {
    while (pos_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool consumeLiteral(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) {
      return fail("invalid literal");
    }
    pos_ += literal.size();
    return true;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("nesting too deep");
    if (pos_ >= text_.size()) return fail("unexpected end of input");

    char chr = text_[pos_];
    switch (chr) {
      case '{':
        return parseObject(out, depth);
      case '[':
        return parseArray(out, depth);
      case '"':
        out.type = JsonValue::String;
        return parseString(out.string_val);
      case 't':
        out.type = JsonValue::Bool;
        out.bool_val = true;
        return consumeLiteral("true");
      case 'f':
        out.type = JsonValue::Bool;
        out.bool_val = false;
        return consumeLiteral("false");
      case 'n':
        out.type = JsonValue::Null;
        return consumeLiteral("null");
      default:
        if (chr == '-' || std::isdigit(static_cast<unsigned char>(chr))) {
          return parseNumber(out);
        }
        return fail("unexpected character");
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    out.type = JsonValue::Object;
    ++pos_;  // '{'
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return fail("expected object key");
      }
      std::string key;
      if (!parseString(key)) return false;

      skipWhitespace();
      if (pos_ >= text_.size() || text_[pos_] != ':') return fail("expected ':'");
      ++pos_;
      skipWhitespace();

      JsonValue member;
      if (!parseValue(member, depth + 1)) return false;
      out.object_val[key] = std::move(member);

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated object");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  bool parseArray(JsonValue& out, int depth) {
    out.type = JsonValue::Array;
    ++pos_;  // '['
    skipWhitespace();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }

    while (true) {
      skipWhitespace();
      JsonValue element;
      if (!parseValue(element, depth + 1)) return false;
      out.array_val.push_back(std::move(element));

      skipWhitespace();
      if (pos_ >= text_.size()) return fail("unterminated array");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  /// Append a code point as UTF-8.
  static void appendUtf8(std::string& out, uint32_t code) {
    if (code < 0x80) {
      out += static_cast<char>(code);
    } else if (code < 0x800) {
      out += static_cast<char>(0xC0 | (code >> 6));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
      out += static_cast<char>(0xE0 | (code >> 12));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (code >> 18));
      out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (code & 0x3F));
    }
  }

  bool parseHex4(uint32_t& code) {
    if (pos_ + 4 > text_.size()) return fail("truncated \\u escape");
    code = 0;
    for (int idx = 0; idx < 4; ++idx) {
      char hex = text_[pos_++];
      code <<= 4;
      if (hex >= '0' && hex <= '9') {
        code |= static_cast<uint32_t>(hex - '0');
      } else if (hex >= 'a' && hex <= 'f') {
        code |= static_cast<uint32_t>(hex - 'a' + 10);
      } else if (hex >= 'A' && hex <= 'F') {
        code |= static_cast<uint32_t>(hex - 'A' + 10);
      } else {
        return fail("invalid \\u escape");
      }
    }
    return true;
  }

  bool parseString(std::string& out) {
    ++pos_;  // opening quote
    out.clear();
    while (pos_ < text_.size()) {
      char chr = text_[pos_++];
      if (chr == '"') return true;
      if (static_cast<unsigned char>(chr) < 0x20) {
        return fail("control character in string");
      }
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (pos_ >= text_.size()) break;
      char esc = text_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 'r':  out += '\r'; break;
        case 't':  out += '\t'; break;
        case 'u': {
          uint32_t code = 0;
          if (!parseHex4(code)) return false;
          // Combine a surrogate pair when the low half follows.
          if (code >= 0xD800 && code <= 0xDBFF &&
              text_.substr(pos_, 2) == "\\u") {
            pos_ += 2;
            uint32_t low = 0;
            if (!parseHex4(low)) return false;
            if (low < 0xDC00 || low > 0xDFFF) return fail("invalid surrogate pair");
            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
          }
          appendUtf8(out, code);
          break;
        }
        default:
          return fail("invalid escape");
      }
    }
    return fail("unterminated string");
  }

  bool parseNumber(JsonValue& out) {
    size_t start = pos_;
    auto digits = [this]() {
      size_t first = pos_;
      while (pos_ < text_.size() &&
             std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
        ++pos_;
      }
      return pos_ > first;
    };

    if (text_[pos_] == '-') ++pos_;
    if (!digits()) return fail("invalid number");
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (!digits()) return fail("invalid fraction");
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (!digits()) return fail("invalid exponent");
    }

    std::string num_str(text_.substr(start, pos_ - start));
    char* end = nullptr;
    double parsed = std::strtod(num_str.c_str(), &end);
    if (end != num_str.c_str() + num_str.size()) {
      pos_ = start;
      return fail("invalid number");
    }
    out.type = JsonValue::Number;
    out.number_val = parsed;
    return true;
  }

  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

bool parseJson(std::string_view text, JsonValue& out, std::string* error) {
  Parser parser(text);
  JsonValue parsed;
  if (!parser.parseDocument(parsed)) {
    if (error) *error = parser.error();
    return false;
  }
  out = std::move(parsed);
  return true;
}

}  // namespace dirstat
