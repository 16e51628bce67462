// Composition model: notes, tracks, effects and the composition header.

#ifndef CODESONIFY_COMPOSE_COMPOSITION_H
#define CODESONIFY_COMPOSE_COMPOSITION_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "core/pitch_utils.h"

namespace codesonify {

/// @brief A single musical event in seconds-based time.
struct Note {
  Pitch pitch;
  NoteDuration duration = NoteDuration::Quarter;
  float velocity = 0.5f;       ///< Semantic loudness in (0, 1].
  double start_seconds = 0.0;  ///< Onset from the start of the piece.
  Instrument instrument = Instrument::Ambient;
};

/// @brief An effect slot with ordered numeric parameters.
struct TrackEffect {
  EffectKind kind = EffectKind::Reverb;
  std::vector<std::pair<std::string, double>> params;
};

/// @brief All notes of exactly one instrument plus its playback settings.
struct Track {
  std::string name;
  Instrument instrument = Instrument::Ambient;
  Waveform waveform = Waveform::Sine;
  float volume = 0.5f;
  std::vector<Note> notes;
  std::vector<TrackEffect> effects;
};

/// @brief Meter of the composition.
struct TimeSignature {
  uint8_t numerator = 4;
  uint8_t denominator = 4;
};

/// @brief Descriptive data attached to a composition.
struct CompositionMetadata {
  Language source_language = Language::Unknown;
  int lines_analyzed = 0;
  int complexity = 0;
  std::string content_hash;
  std::string interpretation;
  MusicStyle style = MusicStyle::Classical;
};

/// @brief The complete piece. Built once by the assembler, never mutated
///        afterwards, and the sole input of the MIDI encoder.
struct Composition {
  std::string title;
  int tempo_bpm = 120;
  TimeSignature time_signature;
  int key = 0;  ///< Tonic pitch class (0-11).
  ScaleType scale = ScaleType::Major;
  double total_duration_seconds = 0.0;
  std::vector<Track> tracks;
  CompositionMetadata metadata;

  /// @brief Total number of notes across all tracks.
  size_t noteCount() const {
    size_t count = 0;
    for (const auto& track : tracks) count += track.notes.size();
    return count;
  }
};

}  // namespace codesonify

#endif  // CODESONIFY_COMPOSE_COMPOSITION_H
