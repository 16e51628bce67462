// Composition assembler: groups notes into instrument tracks and wraps them
// with header metadata.

#ifndef CODESONIFY_COMPOSE_COMPOSITION_ASSEMBLER_H
#define CODESONIFY_COMPOSE_COMPOSITION_ASSEMBLER_H

#include <string>
#include <vector>

#include "analysis/code_analysis.h"
#include "compose/composition.h"

namespace codesonify {

/// Duration reported for a composition without notes.
constexpr double kEmptyCompositionSeconds = 5.0;

/// @brief Fixed playback settings of one instrument.
struct InstrumentConfig {
  Waveform waveform = Waveform::Sine;
  float volume = 0.5f;
  std::vector<TrackEffect> effects;
};

/// @brief Look up the playback settings of an instrument.
const InstrumentConfig& getInstrumentConfig(Instrument instrument);

/// Which naming scheme track titles follow.
enum class TrackNaming : uint8_t {
  Code,  // "Melody (Functions & Logic)", ...
  Diff   // "Additions (Ascending Major)", ...
};

/// @brief Display name of an instrument's track.
const char* trackName(Instrument instrument, TrackNaming naming);

/// @brief Reported key and scale of a code composition by source language.
struct LanguageKey {
  int key = 0;
  ScaleType scale = ScaleType::Major;
};

/// @brief Look up the key/scale table entry of a language.
LanguageKey languageKey(Language language);

/// @brief Group notes into one track per instrument.
///
/// Tracks appear in order of each instrument's first note; notes keep their
/// insertion order within a track.
///
/// @param notes Notes in emission order.
/// @param naming Track naming scheme.
/// @return Tracks with configuration attached.
std::vector<Track> groupIntoTracks(const std::vector<Note>& notes, TrackNaming naming);

/// @brief max(start) + 1 second, or kEmptyCompositionSeconds without notes.
double totalDurationSeconds(const std::vector<Note>& notes);

/// @brief Human-readable description of a code composition.
/// @param analysis Analysis the notes were generated from.
/// @param style Style the notes were rendered in.
/// @return One sentence ending with '.'.
std::string buildInterpretation(const CodeAnalysis& analysis, MusicStyle style);

/// @brief Build the composition of a source text.
/// @param analysis Result of analyze() on `source`.
/// @param notes Notes produced by mapToNotes().
/// @param source Original text, hashed into the metadata.
/// @param style Style used for mapping.
/// @return Finished composition.
Composition assemble(const CodeAnalysis& analysis, const std::vector<Note>& notes,
                     const std::string& source, MusicStyle style);

}  // namespace codesonify

#endif  // CODESONIFY_COMPOSE_COMPOSITION_ASSEMBLER_H
