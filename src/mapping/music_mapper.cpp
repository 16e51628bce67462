/// @file
/// @brief Per-token-kind generation rules and the mapping fold.

#include "mapping/music_mapper.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <map>
#include <string>

#include "core/pitch_utils.h"

namespace codesonify {

namespace {

Note makeNote(Pitch pitch, NoteDuration dur, float velocity, double time, Instrument inst) {
  Note note;
  note.pitch = pitch;
  note.duration = dur;
  note.velocity = velocity;
  note.start_seconds = time;
  note.instrument = inst;
  return note;
}

Pitch pitchOf(int pitch_class, int octave) {
  Pitch pitch;
  pitch.pitch_class = pitch_class;
  pitch.octave = octave;
  return pitch;
}

/// Scaled length of a duration in seconds.
double step(NoteDuration dur, const MappingContext& ctx) {
  return durationSeconds(dur) * ctx.tempo_multiplier;
}

/// First byte of the text as an unsigned value, or `fallback` when empty.
int firstCharCode(const std::string& text, int fallback) {
  if (text.empty()) return fallback;
  return static_cast<int>(static_cast<unsigned char>(text[0]));
}

// ---------------------------------------------------------------------------
// Rules
// ---------------------------------------------------------------------------

/// Ascending 3-5 note phrase in the style scale.
TokenEmission mapFunction(const Token& token, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  const auto& scale = getScaleIntervals(ctx.style->scale);
  const int octave = octaveForDepth(token.depth);
  const int phrase_length = 3 + static_cast<int>(token.text.size() % 3);

  for (int idx = 0; idx < phrase_length; ++idx) {
    int degree = scale[static_cast<size_t>(idx) % scale.size()];
    out.notes.push_back(makeNote(pitchAbove(ctx.style->base_key, degree, octave),
                                 NoteDuration::Eighth, 0.7f + idx * 0.05f,
                                 cursor + out.advance, Instrument::Melody));
    out.advance += step(NoteDuration::Eighth, ctx);
  }
  return out;
}

/// Percussive pattern repeated 2x for "for", 3x for "while", once otherwise.
TokenEmission mapLoop(const Token& token, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  const int octave = octaveForDepth(token.depth);
  const int reps = token.text == "for" ? 2 : (token.text == "while" ? 3 : 1);

  for (int rep = 0; rep < reps; ++rep) {
    for (NoteDuration dur : mapping::kLoopPattern) {
      out.notes.push_back(makeNote(pitchOf(ctx.style->base_key, octave), dur,
                                   0.6f + rep * 0.1f, cursor + out.advance,
                                   Instrument::Percussion));
      out.advance += step(dur, ctx) * 0.5;
    }
  }
  return out;
}

/// Simultaneous triad: C-E-G for if-like tokens, A-C-E for else/elif.
TokenEmission mapConditional(const Token& token, double cursor, const MappingContext& ctx) {
  static constexpr int kIfChord[3] = {pitch_class::kC, pitch_class::kE, pitch_class::kG};
  static constexpr int kElseChord[3] = {pitch_class::kA, pitch_class::kC, pitch_class::kE};

  TokenEmission out;
  const int octave = octaveForDepth(token.depth);
  const bool is_else = token.text == "else" || token.text == "elif";
  const int* chord = is_else ? kElseChord : kIfChord;

  for (int idx = 0; idx < 3; ++idx) {
    out.notes.push_back(makeNote(pitchOf(chord[idx], octave), NoteDuration::Quarter, 0.5f,
                                 cursor, Instrument::Harmony));
  }
  out.advance = step(NoteDuration::Quarter, ctx);
  return out;
}

/// Sustained bass note named after the identifier's first character.
TokenEmission mapVariable(const Token& token, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  const int pitch_class = firstCharCode(token.text, 'C') % 12;
  out.notes.push_back(makeNote(pitchOf(pitch_class, mapping::kVariableOctave),
                               NoteDuration::Half, 0.4f, cursor, Instrument::Bass));
  out.advance = step(NoteDuration::Quarter, ctx);
  return out;
}

/// Power chord: root, fifth, octave.
TokenEmission mapClass(const Token& token, double cursor, const MappingContext& ctx) {
  static constexpr int kPowerChord[3] = {interval::kUnison, interval::kPerfect5th,
                                         interval::kOctave};
  TokenEmission out;
  const int octave = octaveForDepth(token.depth);
  for (int offset : kPowerChord) {
    out.notes.push_back(makeNote(pitchAbove(ctx.style->base_key, offset, octave),
                                 NoteDuration::Half, 0.65f, cursor, Instrument::Melody));
  }
  out.advance = step(NoteDuration::Half, ctx);
  return out;
}

/// Soft pentatonic tone indexed by the literal's length.
TokenEmission mapString(const Token& token, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  const auto& penta = getScaleIntervals(ScaleType::Pentatonic);
  int degree = penta[token.text.size() % penta.size()];
  int pitch_class = (ctx.style->base_key + degree) % 12;
  out.notes.push_back(makeNote(pitchOf(pitch_class, mapping::kPadOctave),
                               NoteDuration::Quarter, 0.35f, cursor, Instrument::Ambient));
  out.advance = step(NoteDuration::Eighth, ctx);
  return out;
}

/// Staccato note: value mod 12, octave grows with magnitude.
TokenEmission mapNumber(const Token& token, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  double value = std::strtod(token.text.c_str(), nullptr);
  if (!std::isfinite(value)) value = 0.0;

  int pitch_class = static_cast<int>(std::fmod(std::fabs(std::round(value)), 12.0));
  double octave_raw = 3.0 + std::floor(value / 100.0);
  int octave = static_cast<int>(std::clamp(octave_raw, 2.0, 7.0));

  out.notes.push_back(makeNote(pitchOf(pitch_class, octave), NoteDuration::Sixteenth, 0.5f,
                               cursor, Instrument::Melody));
  out.advance = step(NoteDuration::Sixteenth, ctx);
  return out;
}

/// Very short hit from the operator pitch table (C3 when unlisted).
TokenEmission mapOperator(const Token& token, double cursor, const MappingContext& ctx) {
  static const std::map<std::string, Pitch> kOperatorPitch = {
      {"=", {0, 3}},  {"+", {2, 3}}, {"-", {4, 3}}, {"*", {5, 3}},  {"/", {7, 3}},
      {"%", {9, 3}},  {"!", {11, 3}}, {"&", {0, 4}}, {"|", {2, 4}}, {"^", {4, 4}},
      {"<", {5, 4}},  {">", {7, 4}}, {"?", {9, 4}},
  };

  TokenEmission out;
  Pitch pitch = pitchOf(pitch_class::kC, 3);
  auto iter = kOperatorPitch.find(token.text);
  if (iter != kOperatorPitch.end()) pitch = iter->second;

  out.notes.push_back(makeNote(pitch, NoteDuration::Sixteenth, 0.3f, cursor,
                               Instrument::Percussion));
  out.advance = step(NoteDuration::Sixteenth, ctx) * 0.5;
  return out;
}

/// Quiet pad tone indexed by source line.
TokenEmission mapComment(const Token& token, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  const auto& penta = getScaleIntervals(ScaleType::Pentatonic);
  int degree = penta[static_cast<size_t>(std::abs(token.line)) % penta.size()];
  int pitch_class = (ctx.style->base_key + degree) % 12;
  out.notes.push_back(makeNote(pitchOf(pitch_class, mapping::kPadOctave), NoteDuration::Half,
                               0.15f, cursor, Instrument::Ambient));
  out.advance = step(NoteDuration::Quarter, ctx);
  return out;
}

/// Rising three-note arpeggio, one octave per note from octave 4.
TokenEmission mapImport(const Token& /*token*/, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  const auto& scale = getScaleIntervals(ctx.style->scale);
  for (int idx = 0; idx < 3; ++idx) {
    int pitch_class = (ctx.style->base_key + scale[static_cast<size_t>(idx) % scale.size()]) % 12;
    out.notes.push_back(makeNote(pitchOf(pitch_class, 4 + idx), NoteDuration::Sixteenth, 0.3f,
                                 cursor + out.advance, Instrument::Ambient));
    out.advance += step(NoteDuration::Sixteenth, ctx);
  }
  return out;
}

/// Major third falling to the root.
TokenEmission mapReturn(const Token& /*token*/, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  const int root = ctx.style->base_key;
  out.notes.push_back(makeNote(pitchOf((root + interval::kMajor3rd) % 12, 4),
                               NoteDuration::Eighth, 0.5f, cursor, Instrument::Melody));
  out.advance += step(NoteDuration::Eighth, ctx);
  out.notes.push_back(makeNote(pitchOf(root, 4), NoteDuration::Quarter, 0.6f,
                               cursor + out.advance, Instrument::Melody));
  out.advance += step(NoteDuration::Quarter, ctx);
  return out;
}

/// Dissonant cluster on its own instrument.
TokenEmission mapError(const Token& /*token*/, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  for (int offset : mapping::kDissonanceIntervals) {
    int pitch_class = (ctx.style->base_key + offset) % 12;
    out.notes.push_back(makeNote(pitchOf(pitch_class, mapping::kDissonanceOctave),
                                 NoteDuration::Eighth, 0.8f, cursor, Instrument::Dissonance));
  }
  out.advance = step(NoteDuration::Eighth, ctx);
  return out;
}

/// Grace note; does not move the cursor.
TokenEmission mapBracket(const Token& token, double cursor, const MappingContext& ctx,
                         bool opening) {
  TokenEmission out;
  int octave = octaveForDepth(token.depth);
  if (!opening) octave = std::max(2, octave - 1);
  out.notes.push_back(makeNote(pitchOf(ctx.style->base_key, octave), NoteDuration::Sixteenth,
                               0.2f, cursor, Instrument::Ambient));
  return out;
}

/// Background tone for keywords and unclassified fragments.
TokenEmission mapDefault(const Token& token, double cursor, const MappingContext& ctx) {
  TokenEmission out;
  int pitch_class = firstCharCode(token.text, 0) % 12;
  out.notes.push_back(makeNote(pitchOf(pitch_class, octaveForDepth(token.depth)),
                               NoteDuration::Sixteenth, 0.15f, cursor, Instrument::Ambient));
  out.advance = step(NoteDuration::Sixteenth, ctx) * 0.3;
  return out;
}

}  // namespace

int tempoFromComplexity(int complexity, int min_bpm, int max_bpm) {
  double bpm = min_bpm + (complexity / 100.0) * (max_bpm - min_bpm);
  return static_cast<int>(std::floor(bpm + 0.5));
}

int octaveForDepth(int depth) {
  int shift = std::min(depth, mapping::kMaxOctaveShift);
  return std::clamp(mapping::kBaseOctave + shift, mapping::kMinOctave, mapping::kMaxOctave);
}

TokenEmission mapToken(const Token& token, double cursor, const MappingContext& ctx) {
  switch (token.kind) {
    case TokenKind::Function:     return mapFunction(token, cursor, ctx);
    case TokenKind::Loop:         return mapLoop(token, cursor, ctx);
    case TokenKind::Conditional:  return mapConditional(token, cursor, ctx);
    case TokenKind::Variable:     return mapVariable(token, cursor, ctx);
    case TokenKind::Class:        return mapClass(token, cursor, ctx);
    case TokenKind::String:       return mapString(token, cursor, ctx);
    case TokenKind::Number:       return mapNumber(token, cursor, ctx);
    case TokenKind::Operator:     return mapOperator(token, cursor, ctx);
    case TokenKind::Comment:      return mapComment(token, cursor, ctx);
    case TokenKind::Import:       return mapImport(token, cursor, ctx);
    case TokenKind::ReturnStmt:   return mapReturn(token, cursor, ctx);
    case TokenKind::ErrorMarker:  return mapError(token, cursor, ctx);
    case TokenKind::BracketOpen:  return mapBracket(token, cursor, ctx, true);
    case TokenKind::BracketClose: return mapBracket(token, cursor, ctx, false);
    case TokenKind::Whitespace: {
      TokenEmission rest;
      rest.advance = step(NoteDuration::Eighth, ctx) * 0.3;
      return rest;
    }
    case TokenKind::Keyword:
    case TokenKind::Unknown:
      return mapDefault(token, cursor, ctx);
  }
  return mapDefault(token, cursor, ctx);
}

std::vector<Note> mapToNotes(const CodeAnalysis& analysis, MusicStyle style) {
  MappingContext ctx;
  ctx.style = &getStylePreset(style);
  const int tempo = tempoFromComplexity(analysis.metrics.complexity);
  ctx.tempo_multiplier = kReferenceBpm / tempo;

  std::vector<Note> notes;
  double cursor = 0.0;
  for (const auto& token : analysis.tokens) {
    TokenEmission emission = mapToken(token, cursor, ctx);
    notes.insert(notes.end(), emission.notes.begin(), emission.notes.end());
    cursor += emission.advance;
  }
  return notes;
}

}  // namespace codesonify
