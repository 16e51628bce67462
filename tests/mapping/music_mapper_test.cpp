// Tests for mapping/music_mapper.h -- per-token rules and the mapping fold.

#include "mapping/music_mapper.h"

#include <gtest/gtest.h>

#include <string>

#include "analysis/code_analyzer.h"

namespace codesonify {
namespace {

Token makeToken(TokenKind kind, const std::string& text, int depth = 0, int line = 1) {
  Token token;
  token.kind = kind;
  token.text = text;
  token.depth = depth;
  token.line = line;
  return token;
}

MappingContext classicalContext(double multiplier = 1.0) {
  MappingContext ctx;
  ctx.style = &getStylePreset(MusicStyle::Classical);
  ctx.tempo_multiplier = multiplier;
  return ctx;
}

// ---------------------------------------------------------------------------
// Tempo and octave helpers
// ---------------------------------------------------------------------------

TEST(MusicMapperTest, TempoFromComplexityEndpoints) {
  EXPECT_EQ(tempoFromComplexity(0), 70);
  EXPECT_EQ(tempoFromComplexity(100), 160);
  EXPECT_EQ(tempoFromComplexity(50), 115);
  EXPECT_EQ(tempoFromComplexity(15), 84);  // 70 + 13.5
}

TEST(MusicMapperTest, TempoFromComplexityCustomRange) {
  EXPECT_EQ(tempoFromComplexity(50, 80, 130), 105);
}

TEST(MusicMapperTest, OctaveForDepthClamps) {
  EXPECT_EQ(octaveForDepth(0), 4);
  EXPECT_EQ(octaveForDepth(1), 5);
  EXPECT_EQ(octaveForDepth(2), 6);
  EXPECT_EQ(octaveForDepth(9), 6);
  EXPECT_EQ(octaveForDepth(-10), 1);
}

// ---------------------------------------------------------------------------
// Per-kind rules
// ---------------------------------------------------------------------------

TEST(MusicMapperTest, FunctionPhraseLengthFollowsName) {
  auto ctx = classicalContext();
  // "add": 3 + 3 % 3 = 3 notes, "main": 4 notes, "go": 5 notes.
  EXPECT_EQ(mapToken(makeToken(TokenKind::Function, "add"), 0.0, ctx).notes.size(), 3u);
  EXPECT_EQ(mapToken(makeToken(TokenKind::Function, "main"), 0.0, ctx).notes.size(), 4u);
  EXPECT_EQ(mapToken(makeToken(TokenKind::Function, "go"), 0.0, ctx).notes.size(), 5u);
}

TEST(MusicMapperTest, FunctionPhraseAscendsInScale) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::Function, "add"), 2.0, ctx);
  ASSERT_EQ(out.notes.size(), 3u);
  EXPECT_EQ(out.notes[0].pitch.toString(), "C4");
  EXPECT_EQ(out.notes[1].pitch.toString(), "D4");
  EXPECT_EQ(out.notes[2].pitch.toString(), "E4");
  EXPECT_DOUBLE_EQ(out.notes[0].start_seconds, 2.0);
  EXPECT_DOUBLE_EQ(out.notes[1].start_seconds, 2.25);
  EXPECT_FLOAT_EQ(out.notes[2].velocity, 0.8f);
  EXPECT_EQ(out.notes[0].instrument, Instrument::Melody);
  EXPECT_DOUBLE_EQ(out.advance, 0.75);
}

TEST(MusicMapperTest, FunctionOctaveFollowsDepth) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::Function, "add", 5), 0.0, ctx);
  EXPECT_EQ(out.notes[0].pitch.octave, 6);
}

TEST(MusicMapperTest, LoopRepetitions) {
  auto ctx = classicalContext();
  EXPECT_EQ(mapToken(makeToken(TokenKind::Loop, "for"), 0.0, ctx).notes.size(), 10u);
  EXPECT_EQ(mapToken(makeToken(TokenKind::Loop, "while"), 0.0, ctx).notes.size(), 15u);
  EXPECT_EQ(mapToken(makeToken(TokenKind::Loop, "map"), 0.0, ctx).notes.size(), 5u);
}

TEST(MusicMapperTest, LoopIsPercussiveAndAccelerating) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::Loop, "for"), 0.0, ctx);
  for (const auto& note : out.notes) {
    EXPECT_EQ(note.instrument, Instrument::Percussion);
  }
  EXPECT_FLOAT_EQ(out.notes[0].velocity, 0.6f);
  EXPECT_FLOAT_EQ(out.notes[5].velocity, 0.7f);
  // One repetition: (0.25 + 0.25 + 0.125 + 0.125 + 0.25) * 0.5 = 0.5
  EXPECT_DOUBLE_EQ(out.advance, 1.0);
}

TEST(MusicMapperTest, ConditionalChords) {
  auto ctx = classicalContext();
  auto if_out = mapToken(makeToken(TokenKind::Conditional, "if"), 1.0, ctx);
  ASSERT_EQ(if_out.notes.size(), 3u);
  EXPECT_EQ(if_out.notes[0].pitch.toString(), "C4");
  EXPECT_EQ(if_out.notes[1].pitch.toString(), "E4");
  EXPECT_EQ(if_out.notes[2].pitch.toString(), "G4");
  for (const auto& note : if_out.notes) {
    EXPECT_DOUBLE_EQ(note.start_seconds, 1.0);
    EXPECT_EQ(note.instrument, Instrument::Harmony);
  }

  auto else_out = mapToken(makeToken(TokenKind::Conditional, "else"), 0.0, ctx);
  EXPECT_EQ(else_out.notes[0].pitch.toString(), "A4");
  EXPECT_DOUBLE_EQ(else_out.advance, 0.5);
}

TEST(MusicMapperTest, VariableBassNote) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::Variable, "let"), 0.0, ctx);
  ASSERT_EQ(out.notes.size(), 1u);
  // 'l' = 108, 108 % 12 = 0
  EXPECT_EQ(out.notes[0].pitch, (Pitch{0, 2}));
  EXPECT_EQ(out.notes[0].duration, NoteDuration::Half);
  EXPECT_EQ(out.notes[0].instrument, Instrument::Bass);
  EXPECT_DOUBLE_EQ(out.advance, 0.5);
}

TEST(MusicMapperTest, ClassPowerChord) {
  MappingContext ctx;
  ctx.style = &getStylePreset(MusicStyle::Electronic);  // A minor
  auto out = mapToken(makeToken(TokenKind::Class, "class"), 0.0, ctx);
  ASSERT_EQ(out.notes.size(), 3u);
  EXPECT_EQ(out.notes[0].pitch.toString(), "A4");
  EXPECT_EQ(out.notes[1].pitch.toString(), "E5");
  EXPECT_EQ(out.notes[2].pitch.toString(), "A5");
}

TEST(MusicMapperTest, NumberPitchAndOctave) {
  auto ctx = classicalContext();
  auto small = mapToken(makeToken(TokenKind::Number, "5"), 0.0, ctx);
  EXPECT_EQ(small.notes[0].pitch, (Pitch{5, 3}));

  auto large = mapToken(makeToken(TokenKind::Number, "250"), 0.0, ctx);
  // 250 % 12 = 10, octave 3 + 2 = 5
  EXPECT_EQ(large.notes[0].pitch, (Pitch{10, 5}));

  auto huge = mapToken(makeToken(TokenKind::Number, "99999"), 0.0, ctx);
  EXPECT_EQ(huge.notes[0].pitch.octave, 7);
  EXPECT_DOUBLE_EQ(huge.advance, 0.125);
}

TEST(MusicMapperTest, OperatorTable) {
  auto ctx = classicalContext();
  EXPECT_EQ(mapToken(makeToken(TokenKind::Operator, "+"), 0.0, ctx).notes[0].pitch,
            (Pitch{2, 3}));
  EXPECT_EQ(mapToken(makeToken(TokenKind::Operator, ">"), 0.0, ctx).notes[0].pitch,
            (Pitch{7, 4}));
  EXPECT_EQ(mapToken(makeToken(TokenKind::Operator, "=="), 0.0, ctx).notes[0].pitch,
            (Pitch{0, 3}));
}

TEST(MusicMapperTest, CommentPadIndexedByLine) {
  auto ctx = classicalContext();
  // Pentatonic {0,2,4,7,9}; line 3 -> 7 -> G5
  auto out = mapToken(makeToken(TokenKind::Comment, "// x", 0, 3), 0.0, ctx);
  EXPECT_EQ(out.notes[0].pitch.toString(), "G5");
  EXPECT_FLOAT_EQ(out.notes[0].velocity, 0.15f);
  EXPECT_EQ(out.notes[0].instrument, Instrument::Ambient);
}

TEST(MusicMapperTest, ImportArpeggioClimbsOctaves) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::Import, "import"), 0.0, ctx);
  ASSERT_EQ(out.notes.size(), 3u);
  EXPECT_EQ(out.notes[0].pitch.toString(), "C4");
  EXPECT_EQ(out.notes[1].pitch.toString(), "D5");
  EXPECT_EQ(out.notes[2].pitch.toString(), "E6");
  EXPECT_DOUBLE_EQ(out.advance, 0.375);
}

TEST(MusicMapperTest, ReturnResolvesToRoot) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::ReturnStmt, "return"), 0.0, ctx);
  ASSERT_EQ(out.notes.size(), 2u);
  EXPECT_EQ(out.notes[0].pitch.toString(), "E4");
  EXPECT_EQ(out.notes[1].pitch.toString(), "C4");
  EXPECT_DOUBLE_EQ(out.notes[1].start_seconds, 0.25);
  EXPECT_DOUBLE_EQ(out.advance, 0.75);
}

TEST(MusicMapperTest, ErrorCluster) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::ErrorMarker, "raise"), 0.0, ctx);
  ASSERT_EQ(out.notes.size(), 3u);
  EXPECT_EQ(out.notes[0].pitch.toString(), "C#3");
  EXPECT_EQ(out.notes[1].pitch.toString(), "F#3");
  EXPECT_EQ(out.notes[2].pitch.toString(), "B3");
  for (const auto& note : out.notes) {
    EXPECT_EQ(note.instrument, Instrument::Dissonance);
    EXPECT_FLOAT_EQ(note.velocity, 0.8f);
  }
}

TEST(MusicMapperTest, BracketsDoNotAdvance) {
  auto ctx = classicalContext();
  auto open = mapToken(makeToken(TokenKind::BracketOpen, "{", 1), 0.0, ctx);
  auto close = mapToken(makeToken(TokenKind::BracketClose, "}", 1), 0.0, ctx);
  EXPECT_DOUBLE_EQ(open.advance, 0.0);
  EXPECT_DOUBLE_EQ(close.advance, 0.0);
  EXPECT_EQ(open.notes[0].pitch.octave, 5);
  EXPECT_EQ(close.notes[0].pitch.octave, 4);
}

TEST(MusicMapperTest, WhitespaceIsRest) {
  auto ctx = classicalContext();
  auto out = mapToken(makeToken(TokenKind::Whitespace, ""), 0.0, ctx);
  EXPECT_TRUE(out.notes.empty());
  EXPECT_DOUBLE_EQ(out.advance, 0.075);
}

TEST(MusicMapperTest, TempoMultiplierScalesAdvance) {
  auto ctx = classicalContext(2.0);
  auto out = mapToken(makeToken(TokenKind::Variable, "x"), 0.0, ctx);
  EXPECT_DOUBLE_EQ(out.advance, 1.0);
}

// ---------------------------------------------------------------------------
// mapToNotes
// ---------------------------------------------------------------------------

TEST(MusicMapperTest, EmptyAnalysisHasNoNotes) {
  EXPECT_TRUE(mapToNotes(analyze(""), MusicStyle::Classical).empty());
}

TEST(MusicMapperTest, OnsetsNeverDecrease) {
  CodeAnalysis analysis = analyze(
      "import os\n\ndef main():\n    for x in range(3):\n        if x > 1:\n"
      "            print(\"big\")\n    return 0\n");
  auto notes = mapToNotes(analysis, MusicStyle::Jazz);
  ASSERT_FALSE(notes.empty());
  for (size_t idx = 1; idx < notes.size(); ++idx) {
    EXPECT_GE(notes[idx].start_seconds, notes[idx - 1].start_seconds);
  }
}

TEST(MusicMapperTest, Deterministic) {
  CodeAnalysis analysis = analyze("let total = 0;\nfor (const v of xs) { total += v; }\n");
  auto first = mapToNotes(analysis, MusicStyle::Rock);
  auto second = mapToNotes(analysis, MusicStyle::Rock);
  ASSERT_EQ(first.size(), second.size());
  for (size_t idx = 0; idx < first.size(); ++idx) {
    EXPECT_EQ(first[idx].pitch, second[idx].pitch);
    EXPECT_DOUBLE_EQ(first[idx].start_seconds, second[idx].start_seconds);
  }
}

}  // namespace
}  // namespace codesonify
