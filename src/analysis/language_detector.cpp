/// @file
/// @brief Per-language source signatures and the detection vote.

#include "analysis/language_detector.h"

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace codesonify {

namespace {

// Signatures are matched anywhere in the whole text. Every scan below is
// iterative and linear in the input, so a single very long line (minified
// bundles) cannot exhaust the stack.

bool isSpace(char chr) {
  return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\v' || chr == '\f' ||
         chr == '\r';
}

bool isWord(char chr) {
  return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') ||
         (chr >= '0' && chr <= '9') || chr == '_';
}

bool isLineBreak(char chr) { return chr == '\n' || chr == '\r'; }

size_t skipSpaces(std::string_view text, size_t pos) {
  while (pos < text.size() && isSpace(text[pos])) ++pos;
  return pos;
}

size_t skipWord(std::string_view text, size_t pos) {
  while (pos < text.size() && isWord(text[pos])) ++pos;
  return pos;
}

/// One element of a signature form.
enum class Step : uint8_t {
  Literal,    ///< Exact text.
  Spaces,     ///< One or more whitespace characters.
  OptSpaces,  ///< Any run of whitespace, possibly empty.
  Word,       ///< One or more of [A-Za-z0-9_].
};

struct Piece {
  Step step;
  std::string_view text;
};

Piece lit(std::string_view text) { return {Step::Literal, text}; }
const Piece kSp{Step::Spaces, {}};
const Piece kOptSp{Step::OptSpaces, {}};
const Piece kWord{Step::Word, {}};

/// Adjacent steps never share characters, so consuming each run greedily
/// decides the match without backtracking.
bool formMatchesAt(std::string_view text, size_t pos, const std::vector<Piece>& form) {
  for (const Piece& piece : form) {
    switch (piece.step) {
      case Step::Literal:
        if (text.compare(pos, piece.text.size(), piece.text) != 0) return false;
        pos += piece.text.size();
        break;
      case Step::Spaces:
        if (pos >= text.size() || !isSpace(text[pos])) return false;
        pos = skipSpaces(text, pos);
        break;
      case Step::OptSpaces:
        pos = skipSpaces(text, pos);
        break;
      case Step::Word:
        if (pos >= text.size() || !isWord(text[pos])) return false;
        pos = skipWord(text, pos);
        break;
    }
  }
  return true;
}

/// Forms always open with a literal; only its occurrences are tried.
bool containsForm(std::string_view text, const std::vector<Piece>& form) {
  const std::string_view head = form.front().text;
  for (size_t pos = text.find(head); pos != std::string_view::npos;
       pos = text.find(head, pos + 1)) {
    if (formMatchesAt(text, pos, form)) return true;
  }
  return false;
}

/// `import <ws> ... from <ws> '` where the part between the whitespace run
/// and `from` stays on one line.
bool hasImportFrom(std::string_view text) {
  size_t scanned_end = 0;  // a failed line scan covers everything up to here
  for (size_t pos = text.find("import"); pos != std::string_view::npos;
       pos = text.find("import", pos + 1)) {
    size_t after = pos + 6;
    if (after >= text.size() || !isSpace(text[after])) continue;
    size_t cur = skipSpaces(text, after);
    if (cur < scanned_end) continue;

    for (; cur < text.size() && !isLineBreak(text[cur]); ++cur) {
      if (text.compare(cur, 4, "from") != 0) continue;
      size_t gap = cur + 4;
      if (gap >= text.size() || !isSpace(text[gap])) continue;
      size_t quote = skipSpaces(text, gap);
      if (quote < text.size() && (text[quote] == '\'' || text[quote] == '"')) return true;
    }
    scanned_end = cur;
  }
  return false;
}

/// `if <ws> ... :` ending the whole text, the part after the whitespace run
/// on the final line.
bool hasTrailingIfColon(std::string_view text) {
  if (text.empty() || text.back() != ':') return false;
  const size_t colon = text.size() - 1;
  size_t last_line = 0;
  for (size_t pos = colon; pos-- > 0;) {
    if (isLineBreak(text[pos])) {
      last_line = pos + 1;
      break;
    }
  }

  for (size_t pos = text.find("if"); pos != std::string_view::npos;
       pos = text.find("if", pos + 1)) {
    size_t after = pos + 2;
    if (after >= text.size() || !isSpace(text[after])) continue;
    if (skipSpaces(text, after) >= last_line) return true;
  }
  return false;
}

/// `[ ... ]` closing the text (trailing whitespace allowed), both brackets
/// on one line.
bool hasTrailingAttribute(std::string_view text) {
  size_t end = text.size();
  while (end > 0 && isSpace(text[end - 1])) --end;
  if (end == 0 || text[end - 1] != ']') return false;
  for (size_t pos = end - 1; pos-- > 0;) {
    if (isLineBreak(text[pos])) return false;
    if (text[pos] == '[') return true;
  }
  return false;
}

/// A signature holds when any of its forms occurs, or its scan succeeds.
struct Signature {
  std::vector<std::vector<Piece>> forms;
  bool (*scan)(std::string_view) = nullptr;

  bool matches(std::string_view text) const {
    if (scan != nullptr) return scan(text);
    for (const auto& form : forms) {
      if (containsForm(text, form)) return true;
    }
    return false;
  }
};

Signature forms(std::vector<std::vector<Piece>> alternatives) {
  Signature sig;
  sig.forms = std::move(alternatives);
  return sig;
}

Signature scanner(bool (*scan)(std::string_view)) {
  Signature sig;
  sig.scan = scan;
  return sig;
}

struct LanguageSignatures {
  Language language;
  std::vector<Signature> signatures;
};

/// @brief Signature table, in Language declaration order. Built once.
const std::vector<LanguageSignatures>& signatureTable() {
  static const std::vector<LanguageSignatures> kTable = {
      {Language::TypeScript,
       {
           // : string | number | boolean | any | void | never
           forms({{lit(":"), kOptSp, lit("string")},
                  {lit(":"), kOptSp, lit("number")},
                  {lit(":"), kOptSp, lit("boolean")},
                  {lit(":"), kOptSp, lit("any")},
                  {lit(":"), kOptSp, lit("void")},
                  {lit(":"), kOptSp, lit("never")}}),
           forms({{lit("interface"), kSp, kWord}}),
           scanner(hasImportFrom),
           forms({{lit("?."), kWord}}),
           forms({{lit("<"), kWord, lit(">")}}),
       }},
      {Language::JavaScript,
       {
           forms({{lit("const"), kSp, kWord, kOptSp, lit("=")}}),
           forms({{lit("let"), kSp, kWord}}),
           forms({{lit("=>")}}),
           forms({{lit("require(")}}),
           forms({{lit("module.exports")}}),
       }},
      {Language::Python,
       {
           forms({{lit("def"), kSp, kWord, lit("(")}}),
           forms({{lit("import"), kSp, kWord}}),
           forms({{lit("class"), kSp, kWord, lit(":")}}),
           scanner(hasTrailingIfColon),
           forms({{lit("print(")}}),
       }},
      {Language::Java,
       {
           forms({{lit("public"), kSp, lit("class")},
                  {lit("public"), kSp, lit("static"), kSp, lit("class")}}),
           forms({{lit("System.out")}}),
           forms({{lit("void"), kSp, lit("main")}}),
           forms({{lit("private"), kSp, kWord}}),
           forms({{lit("import"), kSp, lit("java.")}}),
       }},
      {Language::CSharp,
       {
           forms({{lit("using"), kSp, lit("System")}}),
           forms({{lit("namespace"), kSp, kWord}}),
           forms({{lit("public"), kSp, lit("class")}}),
           forms({{lit("Console.Write")}}),
           scanner(hasTrailingAttribute),
       }},
      {Language::Go,
       {
           forms({{lit("func"), kSp, kWord, lit("(")}}),
           forms({{lit("package"), kSp, kWord}}),
           forms({{lit("import"), kSp, lit("(")}}),
           forms({{lit("fmt.Print")}}),
           forms({{lit(":=")}}),
       }},
      {Language::Rust,
       {
           forms({{lit("fn"), kSp, kWord, lit("(")}}),
           forms({{lit("let"), kSp, lit("mut"), kSp}}),
           forms({{lit("impl"), kSp, kWord}}),
           forms({{lit("pub"), kSp, lit("fn")}}),
           forms({{lit("use"), kSp, kWord, lit("::")}}),
       }},
  };
  return kTable;
}

}  // namespace

int languageSignatureScore(const std::string& text, Language language) {
  for (const auto& entry : signatureTable()) {
    if (entry.language != language) continue;
    int score = 0;
    for (const auto& signature : entry.signatures) {
      if (signature.matches(text)) ++score;
    }
    return score;
  }
  return 0;
}

Language detectLanguage(const std::string& text) {
  Language best = Language::Unknown;
  int best_score = 0;

  for (const auto& entry : signatureTable()) {
    int score = languageSignatureScore(text, entry.language);
    // Strictly greater: earlier languages keep ties.
    if (score > best_score) {
      best_score = score;
      best = entry.language;
    }
  }

  return best;
}

}  // namespace codesonify
