// Result types of lexical code analysis: tokens, metrics, structure tree.

#ifndef CODESONIFY_ANALYSIS_CODE_ANALYSIS_H
#define CODESONIFY_ANALYSIS_CODE_ANALYSIS_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace codesonify {

/// @brief A scanned source fragment. Immutable once created; source order
/// drives time progression in the mappers.
struct Token {
  TokenKind kind = TokenKind::Unknown;
  std::string text;
  int line = 1;    ///< 1-based source line.
  int column = 0;  ///< 0-based column estimate.
  int depth = 0;   ///< Bracket nesting depth before the line's brackets (>= 0).
};

/// @brief Aggregate counts over one analysis.
struct CodeMetrics {
  int total_lines = 0;
  int code_lines = 0;
  int comment_lines = 0;
  int empty_lines = 0;
  int function_count = 0;
  int loop_count = 0;
  int conditional_count = 0;
  int variable_count = 0;
  int class_count = 0;
  int import_count = 0;
  int error_count = 0;
  int max_nesting_depth = 0;
  int complexity = 0;  ///< 0-100.
};

/// @brief A structural region (function, class, loop, conditional).
/// Each node owns its children; the tree is only read top-down.
struct CodeStructure {
  TokenKind kind = TokenKind::Function;
  std::string name;
  int start_line = 1;
  int end_line = 1;
  int depth = 0;
  std::vector<CodeStructure> children;
};

/// @brief Complete result of analyze().
struct CodeAnalysis {
  Language language = Language::Unknown;
  std::vector<Token> tokens;
  CodeMetrics metrics;
  std::vector<CodeStructure> structures;  ///< Root structures.
};

}  // namespace codesonify

#endif  // CODESONIFY_ANALYSIS_CODE_ANALYSIS_H
