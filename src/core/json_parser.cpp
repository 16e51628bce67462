// Implementation of minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

namespace codesonify {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
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

const char* JsonValue::typeName() const {
  switch (type) {
    case String: return "string";
    case Number: return "number";
    case Bool:   return "boolean";
    case Null:   return "null";
    case Object: return "object";
    case Array:  return "array";
  }
  return "null";
}

namespace {

/// Cursor over the input with error reporting.
struct Reader {
  const char* json;
  size_t length;
  size_t pos = 0;
  std::string error;

  bool atEnd() const { return pos >= length; }
  char peek() const { return json[pos]; }

  void skipWhitespace() {
    while (pos < length && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
  }

  bool fail(const char* what) {
    if (error.empty()) {
      error = std::string(what) + " at offset " + std::to_string(pos);
    }
    return false;
  }
};

/// @brief Append a code point as UTF-8.
void appendUtf8(std::string& out, uint32_t code_point) {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

/// @brief Read four hex digits of a \u escape.
bool readHex4(Reader& rd, uint32_t& out) {
  if (rd.pos + 4 > rd.length) return rd.fail("truncated \\u escape");
  out = 0;
  for (int idx = 0; idx < 4; ++idx) {
    char chr = rd.json[rd.pos++];
    out <<= 4;
    if (chr >= '0' && chr <= '9') {
      out |= static_cast<uint32_t>(chr - '0');
    } else if (chr >= 'a' && chr <= 'f') {
      out |= static_cast<uint32_t>(chr - 'a' + 10);
    } else if (chr >= 'A' && chr <= 'F') {
      out |= static_cast<uint32_t>(chr - 'A' + 10);
    } else {
      return rd.fail("invalid \\u escape");
    }
  }
  return true;
}

/// @brief Parse a string literal (pos at opening quote).
bool parseString(Reader& rd, std::string& out) {
  if (rd.atEnd() || rd.peek() != '"') return rd.fail("expected string");
  ++rd.pos;
  out.clear();

  while (!rd.atEnd()) {
    char chr = rd.json[rd.pos++];
    if (chr == '"') return true;
    if (chr != '\\') {
      out += chr;
      continue;
    }
    if (rd.atEnd()) break;
    char esc = rd.json[rd.pos++];
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
        uint32_t code_point = 0;
        if (!readHex4(rd, code_point)) return false;
        // Combine a surrogate pair when the low half follows.
        if (code_point >= 0xD800 && code_point <= 0xDBFF &&
            rd.pos + 6 <= rd.length && rd.json[rd.pos] == '\\' &&
            rd.json[rd.pos + 1] == 'u') {
          rd.pos += 2;
          uint32_t low = 0;
          if (!readHex4(rd, low)) return false;
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
        }
        appendUtf8(out, code_point);
        break;
      }
      default:
        return rd.fail("invalid escape");
    }
  }
  return rd.fail("unterminated string");
}

/// @brief Parse a number literal.
bool parseNumber(Reader& rd, double& out) {
  size_t start = rd.pos;
  if (!rd.atEnd() && (rd.peek() == '-' || rd.peek() == '+')) ++rd.pos;
  while (!rd.atEnd() &&
         (std::isdigit(static_cast<unsigned char>(rd.peek())) || rd.peek() == '.' ||
          rd.peek() == 'e' || rd.peek() == 'E' || rd.peek() == '-' || rd.peek() == '+')) {
    ++rd.pos;
  }
  std::string num_str(rd.json + start, rd.pos - start);
  if (num_str.empty()) return rd.fail("expected value");

  char* end = nullptr;
  out = std::strtod(num_str.c_str(), &end);
  if (end == num_str.c_str() || *end != '\0') return rd.fail("malformed number");
  return true;
}

/// @brief Match a literal keyword such as "true".
bool parseLiteral(Reader& rd, const char* word) {
  size_t len = std::strlen(word);
  if (rd.pos + len > rd.length || std::strncmp(rd.json + rd.pos, word, len) != 0) {
    return rd.fail("invalid literal");
  }
  rd.pos += len;
  return true;
}

/// @brief Skip a nested object or array, honoring strings.
bool skipContainer(Reader& rd) {
  int depth = 0;
  std::string scratch;
  while (!rd.atEnd()) {
    char chr = rd.peek();
    if (chr == '"') {
      if (!parseString(rd, scratch)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++rd.pos;
    if (depth == 0) return true;
  }
  return rd.fail("unterminated container");
}

bool parseValue(Reader& rd, JsonValue& val) {
  rd.skipWhitespace();
  if (rd.atEnd()) return rd.fail("expected value");

  char chr = rd.peek();
  if (chr == '"') {
    val.type = JsonValue::String;
    return parseString(rd, val.string_val);
  }
  if (chr == 't') {
    val.type = JsonValue::Bool;
    val.bool_val = true;
    return parseLiteral(rd, "true");
  }
  if (chr == 'f') {
    val.type = JsonValue::Bool;
    val.bool_val = false;
    return parseLiteral(rd, "false");
  }
  if (chr == 'n') {
    val.type = JsonValue::Null;
    return parseLiteral(rd, "null");
  }
  if (chr == '{' || chr == '[') {
    val.type = (chr == '{') ? JsonValue::Object : JsonValue::Array;
    return skipContainer(rd);
  }
  val.type = JsonValue::Number;
  return parseNumber(rd, val.number_val);
}

}  // namespace

bool parseJsonObject(const char* json, size_t length, JsonObject& out,
                     std::string& error) {
  out.clear();
  error.clear();
  if (!json || length == 0) {
    error = "empty JSON input";
    return false;
  }

  Reader rd{json, length};
  rd.skipWhitespace();
  if (rd.atEnd() || rd.peek() != '{') {
    error = "expected '{' at offset " + std::to_string(rd.pos);
    return false;
  }
  ++rd.pos;

  rd.skipWhitespace();
  if (!rd.atEnd() && rd.peek() == '}') {
    ++rd.pos;
    return true;
  }

  while (true) {
    rd.skipWhitespace();
    std::string key;
    if (!parseString(rd, key)) break;

    rd.skipWhitespace();
    if (rd.atEnd() || rd.peek() != ':') {
      rd.fail("expected ':'");
      break;
    }
    ++rd.pos;

    JsonValue val;
    if (!parseValue(rd, val)) break;
    out[key] = val;

    rd.skipWhitespace();
    if (rd.atEnd()) {
      rd.fail("unterminated object");
      break;
    }
    if (rd.peek() == ',') {
      ++rd.pos;
      continue;
    }
    if (rd.peek() == '}') {
      ++rd.pos;
      return true;
    }
    rd.fail("expected ',' or '}'");
    break;
  }

  error = rd.error;
  out.clear();
  return false;
}

JsonObject parseJsonObject(const char* json, size_t length) {
  JsonObject result;
  std::string error;
  if (!parseJsonObject(json, length, result, error)) {
    result.clear();
  }
  return result;
}

}  // namespace codesonify
