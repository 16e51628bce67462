// Pitch utilities for CodeSonify -- note names, scale tables, MIDI conversion.

#ifndef CODESONIFY_CORE_PITCH_UTILS_H
#define CODESONIFY_CORE_PITCH_UTILS_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace codesonify {

// ---------------------------------------------------------------------------
// Interval constants (semitones)
// ---------------------------------------------------------------------------

namespace interval {

constexpr int kUnison = 0;
constexpr int kMinor2nd = 1;
constexpr int kMajor3rd = 4;
constexpr int kTritone = 6;
constexpr int kPerfect5th = 7;
constexpr int kMajor7th = 11;
constexpr int kOctave = 12;

}  // namespace interval

/// Note names for pitch classes 0-11 (C=0).
constexpr const char* kNoteNames[] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"};

/// Pitch class constants used by preset tables.
namespace pitch_class {

constexpr int kC = 0;
constexpr int kD = 2;
constexpr int kE = 4;
constexpr int kF = 5;
constexpr int kG = 7;
constexpr int kA = 9;
constexpr int kB = 11;

}  // namespace pitch_class

constexpr uint8_t kMidiMaxPitch = 127;

/// @brief A named pitch: pitch class plus scientific octave (C4 = MIDI 60).
struct Pitch {
  int pitch_class = 0;  ///< 0-11, C=0.
  int octave = 4;

  /// @brief MIDI note number, (octave + 1) * 12 + pitch_class. May fall
  ///        outside [0, 127]; callers check before encoding.
  int toMidi() const { return (octave + 1) * 12 + pitch_class; }

  /// @brief Render as "C4", "D#5".
  std::string toString() const;

  bool operator==(const Pitch& other) const {
    return pitch_class == other.pitch_class && octave == other.octave;
  }
  bool operator!=(const Pitch& other) const { return !(*this == other); }
};

/// @brief Build a pitch from an unnormalized semitone offset above a root.
///
/// The semitone sum `root_pc + offset` wraps into the next octave(s) the way
/// a keyboard does: A (9) + 7 semitones in octave 4 is E5.
///
/// @param root_pc Root pitch class (0-11).
/// @param offset Semitones above the root (non-negative).
/// @param octave Octave of the root.
/// @return Normalized pitch.
Pitch pitchAbove(int root_pc, int offset, int octave);

/// @brief Parse "C4" / "D#5" style names.
/// @param name Pitch name.
/// @param out Receives the pitch on success.
/// @return False if the name is malformed.
bool parsePitchName(const std::string& name, Pitch& out);

/// @brief Semitone intervals from the root for a scale type.
/// @param scale Scale family.
/// @return Reference to a static interval table (5 to 12 entries).
const std::vector<int>& getScaleIntervals(ScaleType scale);

}  // namespace codesonify

#endif  // CODESONIFY_CORE_PITCH_UTILS_H
