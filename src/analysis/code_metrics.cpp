/// @file
/// @brief Metric counting and complexity scoring.

#include "analysis/code_metrics.h"

#include <algorithm>
#include <cmath>

#include "core/text_utils.h"

namespace codesonify {

int computeComplexity(int max_depth, int branch_count, int code_lines, int function_count) {
  double nesting = std::min(max_depth * 10.0, complexity_cap::kNesting);
  double branching = std::min(branch_count * 5.0, complexity_cap::kBranching);
  double size = std::min(std::max(code_lines, 0) * 0.5, complexity_cap::kSize);
  double functions = std::min(function_count * 3.0, complexity_cap::kFunctions);

  double total = std::min(complexity_cap::kTotal, nesting + branching + size + functions);
  int score = static_cast<int>(std::floor(total + 0.5));
  return std::clamp(score, 0, 100);
}

CodeMetrics computeMetrics(const std::vector<std::string>& lines,
                           const std::vector<Token>& tokens) {
  CodeMetrics metrics;
  metrics.total_lines = static_cast<int>(lines.size());

  for (const auto& line : lines) {
    if (trim(line).empty()) ++metrics.empty_lines;
  }

  for (const auto& token : tokens) {
    switch (token.kind) {
      case TokenKind::Comment:     ++metrics.comment_lines; break;
      case TokenKind::Function:    ++metrics.function_count; break;
      case TokenKind::Loop:        ++metrics.loop_count; break;
      case TokenKind::Conditional: ++metrics.conditional_count; break;
      case TokenKind::Variable:    ++metrics.variable_count; break;
      case TokenKind::Class:       ++metrics.class_count; break;
      case TokenKind::Import:      ++metrics.import_count; break;
      case TokenKind::ErrorMarker: ++metrics.error_count; break;
      default: break;
    }
    metrics.max_nesting_depth = std::max(metrics.max_nesting_depth, token.depth);
  }

  metrics.code_lines = metrics.total_lines - metrics.empty_lines - metrics.comment_lines;

  metrics.complexity = computeComplexity(
      metrics.max_nesting_depth, metrics.conditional_count + metrics.loop_count,
      metrics.code_lines, metrics.function_count);

  return metrics;
}

}  // namespace codesonify
