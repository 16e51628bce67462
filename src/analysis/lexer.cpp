/// @file
/// @brief Fragment splitting, classification and line-by-line tokenization.

#include "analysis/lexer.h"

#include <cctype>
#include <map>
#include <string>

#include "core/text_utils.h"

namespace codesonify {

namespace {

/// @brief Fixed keyword -> kind table shared by all languages.
const std::map<std::string, TokenKind>& keywordTable() {
  static const std::map<std::string, TokenKind> kTable = {
      // Functions
      {"function", TokenKind::Function}, {"def", TokenKind::Function},
      {"fn", TokenKind::Function}, {"func", TokenKind::Function},
      {"async", TokenKind::Function}, {"await", TokenKind::Function},
      {"lambda", TokenKind::Function},
      // Loops
      {"for", TokenKind::Loop}, {"while", TokenKind::Loop}, {"do", TokenKind::Loop},
      {"foreach", TokenKind::Loop}, {"loop", TokenKind::Loop}, {"each", TokenKind::Loop},
      {"map", TokenKind::Loop}, {"filter", TokenKind::Loop}, {"reduce", TokenKind::Loop},
      {"forEach", TokenKind::Loop},
      // Conditionals
      {"if", TokenKind::Conditional}, {"else", TokenKind::Conditional},
      {"elif", TokenKind::Conditional}, {"switch", TokenKind::Conditional},
      {"case", TokenKind::Conditional}, {"match", TokenKind::Conditional},
      {"when", TokenKind::Conditional}, {"unless", TokenKind::Conditional},
      {"ternary", TokenKind::Conditional},
      // Variables
      {"var", TokenKind::Variable}, {"let", TokenKind::Variable},
      {"const", TokenKind::Variable}, {"val", TokenKind::Variable},
      {"mut", TokenKind::Variable}, {"static", TokenKind::Variable},
      // Classes
      {"class", TokenKind::Class}, {"struct", TokenKind::Class},
      {"interface", TokenKind::Class}, {"enum", TokenKind::Class},
      {"trait", TokenKind::Class}, {"type", TokenKind::Class},
      // Imports
      {"import", TokenKind::Import}, {"require", TokenKind::Import},
      {"use", TokenKind::Import}, {"using", TokenKind::Import},
      {"include", TokenKind::Import}, {"from", TokenKind::Import},
      // Return
      {"return", TokenKind::ReturnStmt}, {"yield", TokenKind::ReturnStmt},
      {"throw", TokenKind::ReturnStmt},
      // Errors
      {"raise", TokenKind::ErrorMarker}, {"panic", TokenKind::ErrorMarker},
      // Other keywords
      {"new", TokenKind::Keyword}, {"this", TokenKind::Keyword},
      {"self", TokenKind::Keyword}, {"super", TokenKind::Keyword},
      {"null", TokenKind::Keyword}, {"nil", TokenKind::Keyword},
      {"true", TokenKind::Keyword}, {"false", TokenKind::Keyword},
      {"undefined", TokenKind::Keyword}, {"try", TokenKind::Keyword},
      {"catch", TokenKind::Keyword}, {"finally", TokenKind::Keyword},
      {"public", TokenKind::Keyword}, {"private", TokenKind::Keyword},
      {"protected", TokenKind::Keyword}, {"export", TokenKind::Keyword},
      {"default", TokenKind::Keyword}, {"extends", TokenKind::Keyword},
      {"implements", TokenKind::Keyword}, {"abstract", TokenKind::Keyword},
      {"override", TokenKind::Keyword},
  };
  return kTable;
}

bool isWordChar(char chr) {
  return std::isalnum(static_cast<unsigned char>(chr)) || chr == '_';
}

bool isOperatorChar(char chr) {
  switch (chr) {
    case '=': case '+': case '-': case '*': case '/': case '%':
    case '<': case '>': case '!': case '&': case '|': case '^':
    case '~': case '?':
      return true;
    default:
      return false;
  }
}

bool isQuotedString(const std::string& fragment) {
  char first = fragment[0];
  return first == '\'' || first == '"' || first == '`';
}

/// Integer or decimal: \d+(\.\d+)?
bool isNumberLiteral(const std::string& fragment) {
  size_t pos = 0;
  size_t int_digits = 0;
  while (pos < fragment.size() && std::isdigit(static_cast<unsigned char>(fragment[pos]))) {
    ++pos;
    ++int_digits;
  }
  if (int_digits == 0) return false;
  if (pos == fragment.size()) return true;
  if (fragment[pos] != '.') return false;
  ++pos;
  size_t frac_digits = 0;
  while (pos < fragment.size() && std::isdigit(static_cast<unsigned char>(fragment[pos]))) {
    ++pos;
    ++frac_digits;
  }
  return frac_digits > 0 && pos == fragment.size();
}

bool isOperatorRun(const std::string& fragment) {
  for (char chr : fragment) {
    if (!isOperatorChar(chr)) return false;
  }
  return true;
}

/// Plain identifier: [A-Za-z_]\w*
bool isIdentifier(const std::string& fragment) {
  if (fragment.empty()) return false;
  if (!std::isalpha(static_cast<unsigned char>(fragment[0])) && fragment[0] != '_') {
    return false;
  }
  for (char chr : fragment) {
    if (!isWordChar(chr)) return false;
  }
  return true;
}

/// True if `fragment(` occurs in line at a word boundary.
bool appearsAsCall(const std::string& fragment, std::string_view line) {
  if (fragment.empty() || !isWordChar(fragment.back())) return false;

  std::string needle = fragment + "(";
  size_t pos = line.find(needle);
  while (pos != std::string_view::npos) {
    if (pos == 0 || !isWordChar(line[pos - 1])) return true;
    pos = line.find(needle, pos + 1);
  }
  return false;
}

bool isDeclarationKeyword(const std::string& fragment) {
  return fragment == "function" || fragment == "def" || fragment == "fn" ||
         fragment == "func";
}

bool isCommentLine(const std::string& trimmed) {
  auto starts = [&](const char* prefix) { return trimmed.rfind(prefix, 0) == 0; };
  return starts("//") || starts("#") || starts("--") || starts("/*") || starts("*");
}

}  // namespace

bool lookupKeyword(const std::string& word, TokenKind& out) {
  const auto& table = keywordTable();
  auto iter = table.find(word);
  if (iter == table.end()) return false;
  out = iter->second;
  return true;
}

bool isPunctuationChar(char chr) {
  switch (chr) {
    case '{': case '}': case '(': case ')': case '[': case ']':
    case ';': case ',': case '.': case ':': case '=': case '<':
    case '>': case '+': case '-': case '*': case '/': case '!':
    case '&': case '|': case '^': case '~': case '?': case '@':
    case '#': case '$': case '%':
      return true;
    default:
      return false;
  }
}

std::vector<std::string> splitFragments(std::string_view line) {
  std::vector<std::string> fragments;
  std::string current;

  auto flush = [&]() {
    if (!current.empty()) {
      fragments.push_back(current);
      current.clear();
    }
  };

  for (char chr : line) {
    if (isBlankChar(chr)) {
      flush();
    } else if (isPunctuationChar(chr)) {
      flush();
      fragments.emplace_back(1, chr);
    } else {
      current += chr;
    }
  }
  flush();

  return fragments;
}

TokenKind classifyFragment(const std::string& fragment, std::string_view line) {
  if (fragment.empty()) return TokenKind::Unknown;
  if (isQuotedString(fragment)) return TokenKind::String;
  if (isNumberLiteral(fragment)) return TokenKind::Number;
  if (isOperatorRun(fragment)) return TokenKind::Operator;
  if (fragment == "{" || fragment == "(" || fragment == "[") return TokenKind::BracketOpen;
  if (fragment == "}" || fragment == ")" || fragment == "]") return TokenKind::BracketClose;

  TokenKind keyword_kind = TokenKind::Unknown;
  if (lookupKeyword(fragment, keyword_kind)) return keyword_kind;

  if (appearsAsCall(fragment, line)) return TokenKind::Function;
  return TokenKind::Unknown;
}

std::vector<Token> tokenize(const std::vector<std::string>& lines) {
  std::vector<Token> tokens;
  int current_depth = 0;

  for (size_t line_idx = 0; line_idx < lines.size(); ++line_idx) {
    const std::string& line = lines[line_idx];
    const int line_no = static_cast<int>(line_idx) + 1;
    const std::string trimmed = trim(line);
    const int indent = static_cast<int>(leadingBlankCount(line));

    if (trimmed.empty()) {
      tokens.push_back({TokenKind::Whitespace, "", line_no, 0, current_depth});
      continue;
    }

    if (isCommentLine(trimmed)) {
      tokens.push_back({TokenKind::Comment, trimmed, line_no, indent, current_depth});
      continue;
    }

    int opens = 0;
    int closes = 0;
    for (char chr : trimmed) {
      if (chr == '{' || chr == '(' || chr == '[') ++opens;
      if (chr == '}' || chr == ')' || chr == ']') ++closes;
    }

    std::vector<std::string> fragments = splitFragments(trimmed);
    int column = indent;

    for (size_t idx = 0; idx < fragments.size(); ++idx) {
      const std::string& fragment = fragments[idx];

      // "function add(" -> one Function token named "add".
      TokenKind next_kind = TokenKind::Unknown;
      if (isDeclarationKeyword(fragment) && idx + 1 < fragments.size() &&
          isIdentifier(fragments[idx + 1]) &&
          !lookupKeyword(fragments[idx + 1], next_kind)) {
        column += static_cast<int>(fragment.size()) + 1;
        const std::string& name = fragments[++idx];
        tokens.push_back({TokenKind::Function, name, line_no, column, current_depth});
        column += static_cast<int>(name.size()) + 1;
        continue;
      }

      TokenKind kind = classifyFragment(fragment, line);
      tokens.push_back({kind, fragment, line_no, column, current_depth});
      column += static_cast<int>(fragment.size()) + 1;
    }

    current_depth += opens - closes;
    if (current_depth < 0) current_depth = 0;
  }

  return tokens;
}

}  // namespace codesonify
