/// @file
/// @brief JsonWriter implementation.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <locale>
#include <sstream>

namespace codesonify {

void JsonWriter::beforeElement() {
  if (!has_element_.empty() && has_element_.back()) {
    buffer_ += ',';
  }
}

void JsonWriter::afterElement() {
  if (!has_element_.empty()) {
    has_element_.back() = true;
  }
}

void JsonWriter::beginObject() {
  beforeElement();
  buffer_ += '{';
  has_element_.push_back(false);
}

void JsonWriter::endObject() {
  buffer_ += '}';
  if (!has_element_.empty()) has_element_.pop_back();
  afterElement();
}

void JsonWriter::beginArray() {
  beforeElement();
  buffer_ += '[';
  has_element_.push_back(false);
}

void JsonWriter::endArray() {
  buffer_ += ']';
  if (!has_element_.empty()) has_element_.pop_back();
  afterElement();
}

void JsonWriter::key(std::string_view name) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escape(name);
  buffer_ += "\":";
  // The value that follows belongs to this key and must not get a comma.
  if (!has_element_.empty()) has_element_.back() = false;
}

void JsonWriter::value(std::string_view val) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escape(val);
  buffer_ += '"';
  afterElement();
}

void JsonWriter::value(int val) {
  beforeElement();
  buffer_ += std::to_string(val);
  afterElement();
}

void JsonWriter::value(uint32_t val) {
  beforeElement();
  buffer_ += std::to_string(val);
  afterElement();
}

void JsonWriter::value(uint64_t val) {
  beforeElement();
  buffer_ += std::to_string(val);
  afterElement();
}

void JsonWriter::value(double val) {
  beforeElement();
  if (std::isnan(val) || std::isinf(val)) {
    buffer_ += "null";
  } else {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << val;
    buffer_ += oss.str();
  }
  afterElement();
}

void JsonWriter::value(bool val) {
  beforeElement();
  buffer_ += val ? "true" : "false";
  afterElement();
}

void JsonWriter::valueNull() {
  beforeElement();
  buffer_ += "null";
  afterElement();
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string out;
  out.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    out += '\n';
    out.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    char chr = buffer_[pos];

    if (in_string) {
      out += chr;
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
        out += chr;
        break;
      case '{':
      case '[': {
        out += chr;
        ++depth;
        bool empty_container = pos + 1 < buffer_.size() &&
                               (buffer_[pos + 1] == '}' || buffer_[pos + 1] == ']');
        if (!empty_container) newline();
        break;
      }
      case '}':
      case ']':
        --depth;
        if (!out.empty() && out.back() != '{' && out.back() != '[') newline();
        out += chr;
        break;
      case ',':
        out += chr;
        newline();
        break;
      case ':':
        out += ": ";
        break;
      default:
        out += chr;
        break;
    }
  }

  return out;
}

std::string JsonWriter::escape(std::string_view input) {
  std::string out;
  out.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          out += hex_buf;
        } else {
          out += chr;
        }
        break;
    }
  }

  return out;
}

}  // namespace codesonify
