// Basic types for CodeSonify: timing constants, token kinds, musical enums.

#ifndef CODESONIFY_CORE_BASIC_TYPES_H
#define CODESONIFY_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>

namespace codesonify {

/// Tick type for MIDI timing (absolute tick position).
using Tick = uint32_t;

/// Fundamental timing constants.
constexpr Tick kTicksPerBeat = 480;
constexpr uint8_t kBeatsPerBar = 4;
constexpr Tick kTicksPerBar = kTicksPerBeat * kBeatsPerBar;  // 1920

/// Reference tempo that symbolic durations are expressed against.
constexpr double kReferenceBpm = 120.0;

// ---------------------------------------------------------------------------
// Duration constants (based on kTicksPerBeat)
// ---------------------------------------------------------------------------

namespace duration {

constexpr Tick kWholeNote = kTicksPerBar;                            // 1920
constexpr Tick kDottedHalf = kTicksPerBeat * 3;                     // 1440
constexpr Tick kHalfNote = kTicksPerBeat * 2;                       // 960
constexpr Tick kDottedQuarter = kTicksPerBeat + kTicksPerBeat / 2;  // 720
constexpr Tick kQuarterNote = kTicksPerBeat;                        // 480
constexpr Tick kDottedEighth = kTicksPerBeat * 3 / 4;               // 360
constexpr Tick kEighthNote = kTicksPerBeat / 2;                     // 240
constexpr Tick kSixteenthNote = kTicksPerBeat / 4;                  // 120

}  // namespace duration

// ---------------------------------------------------------------------------
// Enums: code analysis
// ---------------------------------------------------------------------------

/// Lexical category of a scanned source fragment.
enum class TokenKind : uint8_t {
  Function,
  Loop,
  Conditional,
  Variable,
  Class,
  String,
  Number,
  Operator,
  Comment,
  Import,
  ReturnStmt,
  ErrorMarker,
  BracketOpen,
  BracketClose,
  Whitespace,
  Keyword,
  Unknown
};

/// Number of TokenKind values.
constexpr int kTokenKindCount = 17;

/// @brief Convert TokenKind to its stable lowercase name.
const char* tokenKindToString(TokenKind kind);

/// Source languages recognized by the detector. Declaration order is the
/// tie-break order used by detection.
enum class Language : uint8_t {
  TypeScript,
  JavaScript,
  Python,
  Java,
  CSharp,
  Go,
  Rust,
  Unknown
};

/// Number of concrete (detectable) languages, excluding Unknown.
constexpr int kDetectableLanguageCount = 7;

/// @brief Convert Language to its lowercase name ("typescript", "csharp", ...).
const char* languageToString(Language language);

/// @brief Parse a Language from string.
/// @param str Lowercase language name.
/// @return Parsed language. Defaults to Language::Unknown on unrecognized input.
Language languageFromString(const std::string& str);

/// @brief Strictly parse a Language.
/// @param str Lowercase language name.
/// @param out Receives the parsed language on success.
/// @return False if str names no language.
bool tryParseLanguage(const std::string& str, Language& out);

// ---------------------------------------------------------------------------
// Enums: music
// ---------------------------------------------------------------------------

/// Symbolic note duration (Tone.js-style notation).
enum class NoteDuration : uint8_t {
  Sixteenth,      // 16n
  Eighth,         // 8n
  DottedEighth,   // 8n.
  Quarter,        // 4n
  DottedQuarter,  // 4n.
  Half,           // 2n
  DottedHalf,     // 2n.
  Whole           // 1n
};

/// @brief Convert NoteDuration to its symbol ("16n", "8n.", ...).
const char* noteDurationToString(NoteDuration dur);

/// @brief Parse a duration symbol.
/// @param str Symbol such as "4n" or "8n.".
/// @return Parsed duration. Defaults to NoteDuration::Quarter on unrecognized input.
NoteDuration noteDurationFromString(const std::string& str);

/// @brief Length of a duration in seconds at kReferenceBpm.
double durationSeconds(NoteDuration dur);

/// @brief Length of a duration in ticks at kTicksPerBeat resolution.
Tick durationTicks(NoteDuration dur);

/// Scale families available to the mappers.
enum class ScaleType : uint8_t {
  Major,
  Minor,
  Pentatonic,
  Blues,
  Chromatic,
  Dorian,
  Mixolydian,
  Lydian
};

/// @brief Convert ScaleType to lowercase name.
const char* scaleTypeToString(ScaleType scale);

/// Logical instrument a note is routed to. One track per instrument.
enum class Instrument : uint8_t {
  Melody,      // functions, main logic
  Bass,        // variables, declarations
  Harmony,     // conditionals, branches
  Percussion,  // loops, repetition
  Ambient,     // comments, whitespace
  Dissonance   // errors, warnings
};

/// Number of Instrument values.
constexpr int kInstrumentCount = 6;

/// @brief Convert Instrument to lowercase name.
const char* instrumentToString(Instrument instrument);

/// Oscillator hint for presentation layers.
enum class Waveform : uint8_t {
  Sine,
  Square,
  Sawtooth,
  Triangle
};

/// @brief Convert Waveform to lowercase name.
const char* waveformToString(Waveform waveform);

/// Audio effect kinds attached to tracks.
enum class EffectKind : uint8_t {
  Reverb,
  Delay,
  Distortion,
  Chorus,
  Filter
};

/// @brief Convert EffectKind to lowercase name.
const char* effectKindToString(EffectKind kind);

/// Style presets selectable by callers.
enum class MusicStyle : uint8_t {
  Classical,
  Electronic,
  Ambient,
  Jazz,
  Rock
};

/// @brief Convert MusicStyle to lowercase name.
const char* musicStyleToString(MusicStyle style);

/// @brief Parse a MusicStyle from string.
/// @param str Style name such as "jazz".
/// @return Parsed style. Defaults to MusicStyle::Classical on unrecognized input.
MusicStyle musicStyleFromString(const std::string& str);

/// @brief Strictly parse a MusicStyle.
/// @param str Style name.
/// @param out Receives the parsed style on success.
/// @return False if str names no style.
bool tryParseMusicStyle(const std::string& str, MusicStyle& out);

}  // namespace codesonify

#endif  // CODESONIFY_CORE_BASIC_TYPES_H
