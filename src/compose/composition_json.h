// JSON export of analyses, diff statistics and compositions.

#ifndef CODESONIFY_COMPOSE_COMPOSITION_JSON_H
#define CODESONIFY_COMPOSE_COMPOSITION_JSON_H

#include <string>

#include "analysis/code_analysis.h"
#include "compose/composition.h"
#include "core/json_helpers.h"
#include "diff/diff_parser.h"

namespace codesonify {

/// @brief Append a composition object to an open writer.
void writeCompositionJson(JsonWriter& writer, const Composition& composition);

/// @brief Append an analysis object (language, metrics, structures, tokens).
void writeAnalysisJson(JsonWriter& writer, const CodeAnalysis& analysis);

/// @brief Append a diff statistics object.
void writeDiffStatsJson(JsonWriter& writer, const DiffStats& stats);

/// @brief Serialize a composition.
/// @param composition Composition to export.
/// @param pretty Indent the output.
std::string compositionToJson(const Composition& composition, bool pretty = true);

/// @brief Serialize an analysis.
std::string analysisToJson(const CodeAnalysis& analysis, bool pretty = true);

}  // namespace codesonify

#endif  // CODESONIFY_COMPOSE_COMPOSITION_JSON_H
