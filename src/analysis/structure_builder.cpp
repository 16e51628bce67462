/// @file
/// @brief Structure extraction and containment nesting.

#include "analysis/structure_builder.h"

#include <utility>

namespace codesonify {

bool isStructuralKind(TokenKind kind) {
  return kind == TokenKind::Function || kind == TokenKind::Class ||
         kind == TokenKind::Loop || kind == TokenKind::Conditional;
}

std::vector<CodeStructure> extractFlatStructures(const std::vector<Token>& tokens) {
  std::vector<CodeStructure> flat;

  for (size_t idx = 0; idx < tokens.size(); ++idx) {
    const Token& token = tokens[idx];
    if (!isStructuralKind(token.kind)) continue;

    CodeStructure structure;
    structure.kind = token.kind;
    structure.name = token.text;
    if (idx + 1 < tokens.size() && tokens[idx + 1].kind == TokenKind::Unknown) {
      structure.name = tokens[idx + 1].text;
    }
    structure.start_line = token.line;
    structure.depth = token.depth;
    structure.end_line = tokens.back().line;

    for (size_t later = idx + 1; later < tokens.size(); ++later) {
      if (tokens[later].depth < token.depth) {
        structure.end_line = tokens[later].line;
        break;
      }
    }

    flat.push_back(std::move(structure));
  }

  return flat;
}

bool isInsideStructure(const CodeStructure& child, const CodeStructure& parent) {
  return child.start_line > parent.start_line && child.end_line <= parent.end_line;
}

std::vector<CodeStructure> nestStructures(std::vector<CodeStructure> flat) {
  std::vector<CodeStructure> roots;

  for (auto& structure : flat) {
    bool placed = false;
    for (size_t idx = roots.size(); idx-- > 0;) {
      if (isInsideStructure(structure, roots[idx])) {
        roots[idx].children.push_back(std::move(structure));
        placed = true;
        break;
      }
    }
    if (!placed) {
      roots.push_back(std::move(structure));
    }
  }

  return roots;
}

std::vector<CodeStructure> buildStructures(const std::vector<Token>& tokens) {
  return nestStructures(extractFlatStructures(tokens));
}

}  // namespace codesonify
