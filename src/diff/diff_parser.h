// Unified diff parsing and change statistics.

#ifndef CODESONIFY_DIFF_DIFF_PARSER_H
#define CODESONIFY_DIFF_DIFF_PARSER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace codesonify {

/// Classification of one diff line.
enum class DiffLineType : uint8_t {
  Header,   // +++, ---, diff, index, @@
  Added,    // '+' prefix
  Removed,  // '-' prefix
  Context   // anything else
};

/// @brief Convert DiffLineType to lowercase name.
const char* diffLineTypeToString(DiffLineType type);

/// @brief One classified line of a unified diff.
struct DiffLine {
  DiffLineType type = DiffLineType::Context;
  std::string content;  ///< Prefix stripped for added/removed lines.
  int line_number = 1;  ///< 1-based position in the diff text.
};

/// @brief Summary statistics of a parsed diff.
struct DiffStats {
  int added_lines = 0;
  int removed_lines = 0;
  int context_lines = 0;
  int total_changes = 0;      ///< added + removed.
  double change_ratio = 0.5;  ///< added / total_changes; 0.5 when nothing changed.
  std::vector<std::string> files;
};

/// @brief Classify every line of a unified diff.
///
/// Header prefixes are checked before the single-character '+'/'-' rule, so
/// "+++ b/file" is a header and "+x" is an addition.
///
/// @param diff_text Diff text; split on '\n'.
/// @return One DiffLine per input line.
std::vector<DiffLine> parseDiff(std::string_view diff_text);

/// @brief Count line classes and collect target file names.
///
/// File names come from "+++ b/<name>" or "+++ <name>" headers; "/dev/null"
/// is ignored.
DiffStats computeDiffStats(const std::vector<DiffLine>& lines);

/// @brief Build a line-by-index pseudo-diff between two texts.
///
/// Lines are compared pairwise by position (no alignment). A differing pair
/// yields "-old" then "+new"; equal lines yield " line"; lines past the end
/// of the shorter text yield a lone "+" or "-" line.
///
/// @param old_text Previous version.
/// @param new_text Current version.
/// @return Diff text starting with a fixed three-line header.
std::string buildPseudoDiff(std::string_view old_text, std::string_view new_text);

}  // namespace codesonify

#endif  // CODESONIFY_DIFF_DIFF_PARSER_H
