// Aggregate code metrics and the complexity score.

#ifndef CODESONIFY_ANALYSIS_CODE_METRICS_H
#define CODESONIFY_ANALYSIS_CODE_METRICS_H

#include <string>
#include <vector>

#include "analysis/code_analysis.h"

namespace codesonify {

/// Caps applied to each complexity component before summation.
namespace complexity_cap {

constexpr double kNesting = 30.0;
constexpr double kBranching = 30.0;
constexpr double kSize = 20.0;
constexpr double kFunctions = 20.0;
constexpr double kTotal = 100.0;

}  // namespace complexity_cap

/// @brief Complexity score from its inputs.
///
/// min(depth*10, 30) + min((conditionals+loops)*5, 30) + min(code_lines*0.5, 20)
/// + min(functions*3, 20), clamped to 100 and rounded to the nearest integer.
///
/// @return Score in [0, 100].
int computeComplexity(int max_depth, int branch_count, int code_lines, int function_count);

/// @brief Derive all metrics from lines and tokens.
/// @param lines Source lines (see splitLines()); empty for empty input.
/// @param tokens Tokens of those lines.
/// @return Metrics. All zero for empty input.
CodeMetrics computeMetrics(const std::vector<std::string>& lines,
                           const std::vector<Token>& tokens);

}  // namespace codesonify

#endif  // CODESONIFY_ANALYSIS_CODE_METRICS_H
