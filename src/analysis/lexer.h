// Line-oriented lexical scanner: raw text -> flat token stream with depth.

#ifndef CODESONIFY_ANALYSIS_LEXER_H
#define CODESONIFY_ANALYSIS_LEXER_H

#include <string>
#include <string_view>
#include <vector>

#include "analysis/code_analysis.h"
#include "core/basic_types.h"

namespace codesonify {

/// @brief Look up a word in the fixed keyword table.
/// @param word Candidate keyword (case-sensitive).
/// @param out Receives the mapped kind on success.
/// @return True if word is a keyword.
bool lookupKeyword(const std::string& word, TokenKind& out);

/// @brief True for characters that split a line into fragments and are
///        themselves emitted as single-character fragments.
bool isPunctuationChar(char chr);

/// @brief Split a trimmed line into fragments.
///
/// Whitespace separates fragments and is discarded. Each punctuation
/// character ({}()[];,.:=<>+-*/!&|^~?@#$%) is a fragment of its own. Empty
/// fragments are dropped.
///
/// @param line Trimmed line text.
/// @return Fragments in order.
std::vector<std::string> splitFragments(std::string_view line);

/// @brief Classify a single fragment.
///
/// Priority: quoted-string prefix, number, operator characters, single
/// opening bracket, single closing bracket, keyword (raise and panic are
/// error-marker keywords), call-site identifier (the identifier is
/// immediately followed by '(' somewhere on the line), otherwise Unknown.
///
/// @param fragment Fragment text.
/// @param line Full (untrimmed) source line, for call-site detection.
/// @return Token kind.
TokenKind classifyFragment(const std::string& fragment, std::string_view line);

/// @brief Scan source text into tokens.
///
/// Lines are processed in order. Blank lines produce one Whitespace token.
/// Lines whose trimmed form starts with a comment marker (//, #, --, /*, *)
/// produce one Comment token holding the trimmed line. Other lines are split
/// into fragments and classified. A declaration keyword (function, def, fn,
/// func) followed by a plain identifier folds into one Function token named
/// after the identifier.
///
/// All tokens of a line carry the depth in effect before that line; the
/// depth then moves by (opening - closing) brackets on the line and is
/// floored at zero.
///
/// @param lines Source lines (see splitLines()).
/// @return Tokens in source order.
std::vector<Token> tokenize(const std::vector<std::string>& lines);

}  // namespace codesonify

#endif  // CODESONIFY_ANALYSIS_LEXER_H
