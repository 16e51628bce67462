// Structure extraction: structural tokens -> nested region tree.

#ifndef CODESONIFY_ANALYSIS_STRUCTURE_BUILDER_H
#define CODESONIFY_ANALYSIS_STRUCTURE_BUILDER_H

#include <vector>

#include "analysis/code_analysis.h"

namespace codesonify {

/// @brief True for kinds that open a structure (function, class, loop,
///        conditional).
bool isStructuralKind(TokenKind kind);

/// @brief Build the flat list of structures in token order.
///
/// Each structural token starts a structure named by its own text, or by the
/// immediately following token when that token is Unknown. The end line is
/// the line of the first later token whose depth is strictly smaller, or the
/// line of the last token when there is none.
///
/// @param tokens Token stream from tokenize().
/// @return Structures with empty children lists.
std::vector<CodeStructure> extractFlatStructures(const std::vector<Token>& tokens);

/// @brief True if child lies inside parent's line range:
///        child.start > parent.start && child.end <= parent.end.
bool isInsideStructure(const CodeStructure& child, const CodeStructure& parent);

/// @brief Nest flat structures by containment.
///
/// Each structure is tested against the already-placed roots from the most
/// recent backwards; the first root that contains it adopts it as a child.
/// Otherwise it becomes a new root.
///
/// @param flat Structures in token order.
/// @return Root structures.
std::vector<CodeStructure> nestStructures(std::vector<CodeStructure> flat);

/// @brief extractFlatStructures() followed by nestStructures().
std::vector<CodeStructure> buildStructures(const std::vector<Token>& tokens);

}  // namespace codesonify

#endif  // CODESONIFY_ANALYSIS_STRUCTURE_BUILDER_H
