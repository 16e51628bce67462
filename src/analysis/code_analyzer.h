// Lexical code analyzer: language detection, tokens, metrics, structures.

#ifndef CODESONIFY_ANALYSIS_CODE_ANALYZER_H
#define CODESONIFY_ANALYSIS_CODE_ANALYZER_H

#include <optional>
#include <string>

#include "analysis/code_analysis.h"

namespace codesonify {

/// @brief Analyze source text.
///
/// Total function: any text, including the empty string, yields a result.
/// Empty text gives zero tokens and all-zero metrics.
///
/// @param source Raw source text.
/// @param language_hint Language to report; detected from the text when absent.
/// @return Analysis with tokens in source order and the structure tree.
CodeAnalysis analyze(const std::string& source,
                     std::optional<Language> language_hint = std::nullopt);

}  // namespace codesonify

#endif  // CODESONIFY_ANALYSIS_CODE_ANALYZER_H
