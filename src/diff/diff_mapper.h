// Diff mapper: sonifies unified diffs and pairs of text versions.

#ifndef CODESONIFY_DIFF_DIFF_MAPPER_H
#define CODESONIFY_DIFF_DIFF_MAPPER_H

#include <string>
#include <string_view>
#include <vector>

#include "compose/composition.h"
#include "diff/diff_parser.h"

namespace codesonify {

/// Tempo range of diff compositions.
constexpr int kDiffMinTempo = 70;
constexpr int kDiffMaxTempo = 160;

/// @brief Key, scale and tempo derived from diff statistics.
struct DiffMusicParams {
  int key = 2;
  ScaleType scale = ScaleType::Dorian;
  int tempo_bpm = 80;
};

/// @brief Choose key/scale from the change ratio and tempo from the change count.
///
/// Ratio above 0.6 gives C major, below 0.4 gives A minor, anything else
/// D dorian. Tempo is clamp(80 + 2 * total_changes, 70, 160).
DiffMusicParams diffMusicParams(const DiffStats& stats);

/// @brief Map classified diff lines to notes with a single time cursor.
/// @param lines Output of parseDiff().
/// @param params Key and tempo to render with.
/// @return Notes in emission order.
std::vector<Note> mapDiffToNotes(const std::vector<DiffLine>& lines, const DiffMusicParams& params);

/// @brief Human-readable description of a diff composition.
std::string buildDiffInterpretation(const DiffStats& stats, MusicStyle style);

/// @brief Plain-text multi-line report of a diff composition.
std::string buildDiffSummary(const DiffStats& stats, const Composition& composition);

/// @brief Result of sonifying one diff.
struct DiffSonification {
  Composition composition;
  DiffStats stats;
  std::string summary;
};

/// @brief Result of sonifying two versions of a text.
struct VersionPairSonification {
  Composition composition;  ///< Composition of the synthesized diff.
  DiffStats stats;
  std::string summary;
  Composition old_composition;  ///< Stand-alone composition of the old text.
  Composition new_composition;  ///< Stand-alone composition of the new text.
};

/// @brief Sonify a unified diff.
/// @param diff_text Diff text.
/// @param style Style named in the interpretation.
/// @return Composition, statistics and summary.
DiffSonification sonifyDiff(std::string_view diff_text, MusicStyle style = MusicStyle::Classical);

/// @brief Sonify the line-by-index difference between two texts.
/// @param old_text Previous version.
/// @param new_text Current version.
/// @param style Style for both the diff and the stand-alone compositions.
/// @return Diff result plus both stand-alone compositions.
VersionPairSonification sonifyTwoVersions(const std::string& old_text,
                                          const std::string& new_text,
                                          MusicStyle style = MusicStyle::Classical);

}  // namespace codesonify

#endif  // CODESONIFY_DIFF_DIFF_MAPPER_H
