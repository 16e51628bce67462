/// @file
/// @brief Line splitting, trimming, content hash and base64 implementations.

#include "core/text_utils.h"

#include <cstdio>

namespace codesonify {

std::vector<std::string> splitLines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  for (size_t idx = 0; idx < text.size(); ++idx) {
    if (text[idx] == '\n') {
      lines.emplace_back(text.substr(start, idx - start));
      start = idx + 1;
    }
  }
  lines.emplace_back(text.substr(start));
  return lines;
}

bool isBlankChar(char chr) {
  return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\v' ||
         chr == '\f' || chr == '\r';
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && isBlankChar(text[begin])) ++begin;
  while (end > begin && isBlankChar(text[end - 1])) --end;
  return std::string(text.substr(begin, end - begin));
}

size_t leadingBlankCount(std::string_view text) {
  size_t count = 0;
  while (count < text.size() && isBlankChar(text[count])) ++count;
  return count;
}

std::string contentHash(std::string_view text) {
  // Unsigned arithmetic wraps the same way a signed 32-bit accumulator would.
  uint32_t hash = 0;
  for (char chr : text) {
    hash = (hash << 5) - hash + static_cast<uint32_t>(static_cast<unsigned char>(chr));
  }

  int64_t signed_hash = static_cast<int32_t>(hash);
  if (signed_hash < 0) signed_hash = -signed_hash;

  char buf[24];
  std::snprintf(buf, sizeof(buf), "%08llx", static_cast<unsigned long long>(signed_hash));
  return std::string(buf);
}

std::string encodeBase64(const std::vector<uint8_t>& bytes) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

  std::string out;
  out.reserve(((bytes.size() + 2) / 3) * 4);

  size_t idx = 0;
  while (idx + 3 <= bytes.size()) {
    uint32_t triple = (static_cast<uint32_t>(bytes[idx]) << 16) |
                      (static_cast<uint32_t>(bytes[idx + 1]) << 8) |
                       static_cast<uint32_t>(bytes[idx + 2]);
    out += kAlphabet[(triple >> 18) & 0x3F];
    out += kAlphabet[(triple >> 12) & 0x3F];
    out += kAlphabet[(triple >> 6) & 0x3F];
    out += kAlphabet[triple & 0x3F];
    idx += 3;
  }

  size_t remaining = bytes.size() - idx;
  if (remaining == 1) {
    uint32_t triple = static_cast<uint32_t>(bytes[idx]) << 16;
    out += kAlphabet[(triple >> 18) & 0x3F];
    out += kAlphabet[(triple >> 12) & 0x3F];
    out += "==";
  } else if (remaining == 2) {
    uint32_t triple = (static_cast<uint32_t>(bytes[idx]) << 16) |
                      (static_cast<uint32_t>(bytes[idx + 1]) << 8);
    out += kAlphabet[(triple >> 18) & 0x3F];
    out += kAlphabet[(triple >> 12) & 0x3F];
    out += kAlphabet[(triple >> 6) & 0x3F];
    out += '=';
  }

  return out;
}

}  // namespace codesonify
