/// @file
/// @brief analyze(): wires detection, tokenization, structures and metrics.

#include "analysis/code_analyzer.h"

#include <vector>

#include "analysis/code_metrics.h"
#include "analysis/language_detector.h"
#include "analysis/lexer.h"
#include "analysis/structure_builder.h"
#include "core/text_utils.h"

namespace codesonify {

CodeAnalysis analyze(const std::string& source, std::optional<Language> language_hint) {
  CodeAnalysis analysis;
  analysis.language = language_hint ? *language_hint : detectLanguage(source);

  if (source.empty()) {
    return analysis;
  }

  std::vector<std::string> lines = splitLines(source);
  analysis.tokens = tokenize(lines);
  analysis.structures = buildStructures(analysis.tokens);
  analysis.metrics = computeMetrics(lines, analysis.tokens);

  return analysis;
}

}  // namespace codesonify
