// Text helpers shared by the analyzers: line splitting, trimming, hashing,
// base64.

#ifndef CODESONIFY_CORE_TEXT_UTILS_H
#define CODESONIFY_CORE_TEXT_UTILS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codesonify {

/// @brief Split text on '\n'.
///
/// Every separator produces a boundary, so "a\n" yields {"a", ""} and the
/// empty string yields a single empty line. A trailing '\r' stays part of
/// its line.
///
/// @param text Input text.
/// @return Lines in order (never empty).
std::vector<std::string> splitLines(std::string_view text);

/// @brief True for ASCII whitespace (space, \t, \n, \v, \f, \r).
bool isBlankChar(char chr);

/// @brief Strip leading and trailing whitespace.
std::string trim(std::string_view text);

/// @brief Count leading whitespace characters.
size_t leadingBlankCount(std::string_view text);

/// @brief Compute the 32-bit rolling content hash of text.
///
/// h = h * 31 + byte over the signed 32-bit range; the absolute value is
/// rendered as lowercase hex, zero-padded to at least 8 digits.
///
/// @param text Input text.
/// @return Hex digest.
std::string contentHash(std::string_view text);

/// @brief Encode bytes as standard base64 with '=' padding.
/// @param bytes Raw bytes.
/// @return Base64 text.
std::string encodeBase64(const std::vector<uint8_t>& bytes);

}  // namespace codesonify

#endif  // CODESONIFY_CORE_TEXT_UTILS_H
