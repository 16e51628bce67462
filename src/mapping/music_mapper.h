// Music mapper: token stream -> time-ordered note events.

#ifndef CODESONIFY_MAPPING_MUSIC_MAPPER_H
#define CODESONIFY_MAPPING_MUSIC_MAPPER_H

#include <vector>

#include "analysis/code_analysis.h"
#include "compose/composition.h"
#include "mapping/style_preset.h"

namespace codesonify {

// ---------------------------------------------------------------------------
// Mapping constants
// ---------------------------------------------------------------------------

namespace mapping {

/// Complexity -> tempo interpolation range.
constexpr int kMinTempo = 70;
constexpr int kMaxTempo = 160;

/// Depth -> octave rule.
constexpr int kBaseOctave = 4;
constexpr int kMaxOctaveShift = 2;
constexpr int kMinOctave = 1;
constexpr int kMaxOctave = 7;

/// Octave of the sustained variable bass note.
constexpr int kVariableOctave = 2;

/// Octave of string and comment tones.
constexpr int kPadOctave = 5;

/// Octave of the error cluster.
constexpr int kDissonanceOctave = 3;

/// Semitones above the style key forming the error cluster.
constexpr int kDissonanceIntervals[3] = {1, 6, 11};

/// Relative durations of one loop repetition.
constexpr NoteDuration kLoopPattern[5] = {NoteDuration::Eighth, NoteDuration::Eighth,
                                          NoteDuration::Sixteenth, NoteDuration::Sixteenth,
                                          NoteDuration::Eighth};

}  // namespace mapping

/// @brief Immutable inputs shared by every per-token rule of one mapping run.
struct MappingContext {
  const StylePreset* style = nullptr;
  double tempo_multiplier = 1.0;  ///< 120 / tempo; scales every duration-to-seconds step.
};

/// @brief Output of one per-token rule.
struct TokenEmission {
  std::vector<Note> notes;
  double advance = 0.0;  ///< Seconds the cursor moves past this token.
};

/// @brief Linear complexity -> BPM map.
///
/// round(min_bpm + complexity / 100 * (max_bpm - min_bpm)).
///
/// @param complexity Score in [0, 100].
/// @param min_bpm Tempo at complexity 0.
/// @param max_bpm Tempo at complexity 100.
/// @return Tempo in BPM.
int tempoFromComplexity(int complexity, int min_bpm = mapping::kMinTempo,
                        int max_bpm = mapping::kMaxTempo);

/// @brief clamp(1, 7, kBaseOctave + min(depth, kMaxOctaveShift)).
int octaveForDepth(int depth);

/// @brief Apply the generation rule of a token's kind.
///
/// Pure: the result depends only on the token, the cursor and the context.
/// Notes are stamped relative to `cursor`; the caller advances the cursor by
/// the returned amount.
///
/// @param token Token to sonify.
/// @param cursor Current time in seconds.
/// @param ctx Style and tempo scaling.
/// @return Emitted notes and cursor advance.
TokenEmission mapToken(const Token& token, double cursor, const MappingContext& ctx);

/// @brief Map a whole analysis to notes.
///
/// The tempo comes from tempoFromComplexity(metrics.complexity). Tokens are
/// folded in order over a cursor starting at zero.
///
/// @param analysis Result of analyze().
/// @param style Style preset to use.
/// @return Notes in emission order.
std::vector<Note> mapToNotes(const CodeAnalysis& analysis, MusicStyle style);

}  // namespace codesonify

#endif  // CODESONIFY_MAPPING_MUSIC_MAPPER_H
