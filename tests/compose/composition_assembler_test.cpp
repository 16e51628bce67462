// Tests for compose/composition_assembler.h -- tracks, key table, metadata.

#include "compose/composition_assembler.h"

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "analysis/code_analyzer.h"
#include "mapping/music_mapper.h"

namespace codesonify {
namespace {

Note makeNote(Instrument inst, double time) {
  Note note;
  note.instrument = inst;
  note.start_seconds = time;
  return note;
}

// ---------------------------------------------------------------------------
// Instrument configuration
// ---------------------------------------------------------------------------

TEST(CompositionAssemblerTest, InstrumentConfigTable) {
  const InstrumentConfig& melody = getInstrumentConfig(Instrument::Melody);
  EXPECT_EQ(melody.waveform, Waveform::Triangle);
  EXPECT_FLOAT_EQ(melody.volume, 0.7f);
  ASSERT_EQ(melody.effects.size(), 1u);
  EXPECT_EQ(melody.effects[0].kind, EffectKind::Reverb);
  EXPECT_EQ(melody.effects[0].params[0].first, "decay");
  EXPECT_DOUBLE_EQ(melody.effects[0].params[0].second, 2.5);

  const InstrumentConfig& dissonance = getInstrumentConfig(Instrument::Dissonance);
  EXPECT_EQ(dissonance.waveform, Waveform::Sawtooth);
  ASSERT_EQ(dissonance.effects.size(), 2u);
  EXPECT_EQ(dissonance.effects[1].kind, EffectKind::Filter);

  EXPECT_EQ(getInstrumentConfig(Instrument::Percussion).effects[0].params.size(), 1u);
}

TEST(CompositionAssemblerTest, TrackNamesPerScheme) {
  EXPECT_STREQ(trackName(Instrument::Melody, TrackNaming::Code), "Melody (Functions & Logic)");
  EXPECT_STREQ(trackName(Instrument::Percussion, TrackNaming::Code),
               "Rhythm (Loops & Iterations)");
  EXPECT_STREQ(trackName(Instrument::Bass, TrackNaming::Diff), "Deletions (Descending Minor)");
  EXPECT_STREQ(trackName(Instrument::Ambient, TrackNaming::Diff), "Context & Headers");
}

TEST(CompositionAssemblerTest, LanguageKeyTable) {
  EXPECT_EQ(languageKey(Language::JavaScript).scale, ScaleType::Mixolydian);
  EXPECT_EQ(languageKey(Language::Python).key, 5);
  EXPECT_EQ(languageKey(Language::Python).scale, ScaleType::Pentatonic);
  EXPECT_EQ(languageKey(Language::Rust).key, 11);
  EXPECT_EQ(languageKey(Language::Rust).scale, ScaleType::Blues);
  EXPECT_EQ(languageKey(Language::Unknown).key, 0);
  EXPECT_EQ(languageKey(Language::Unknown).scale, ScaleType::Major);
}

// ---------------------------------------------------------------------------
// groupIntoTracks / totalDurationSeconds
// ---------------------------------------------------------------------------

TEST(CompositionAssemblerTest, TracksInFirstSeenOrder) {
  std::vector<Note> notes = {
      makeNote(Instrument::Bass, 0.0), makeNote(Instrument::Melody, 0.1),
      makeNote(Instrument::Bass, 0.2), makeNote(Instrument::Ambient, 0.3),
      makeNote(Instrument::Melody, 0.4),
  };
  auto tracks = groupIntoTracks(notes, TrackNaming::Code);
  ASSERT_EQ(tracks.size(), 3u);
  EXPECT_EQ(tracks[0].instrument, Instrument::Bass);
  EXPECT_EQ(tracks[1].instrument, Instrument::Melody);
  EXPECT_EQ(tracks[2].instrument, Instrument::Ambient);
  ASSERT_EQ(tracks[0].notes.size(), 2u);
  EXPECT_DOUBLE_EQ(tracks[0].notes[1].start_seconds, 0.2);
  EXPECT_EQ(tracks[0].name, "Bass (Variables & Data)");
  EXPECT_FLOAT_EQ(tracks[2].volume, 0.2f);
}

TEST(CompositionAssemblerTest, OneTrackPerInstrument) {
  CodeAnalysis analysis = analyze(
      "// sum\nfunction sum(xs) {\n  let t = 0;\n  for (x of xs) { if (x) t += x; }\n"
      "  return t;\n}\n");
  auto tracks = groupIntoTracks(mapToNotes(analysis, MusicStyle::Classical), TrackNaming::Code);
  std::set<Instrument> seen;
  for (const auto& track : tracks) {
    EXPECT_TRUE(seen.insert(track.instrument).second);
    EXPECT_FALSE(track.notes.empty());
    for (const auto& note : track.notes) EXPECT_EQ(note.instrument, track.instrument);
  }
}

TEST(CompositionAssemblerTest, DurationIsLastOnsetPlusOne) {
  std::vector<Note> notes = {makeNote(Instrument::Bass, 2.0), makeNote(Instrument::Bass, 1.0)};
  EXPECT_DOUBLE_EQ(totalDurationSeconds(notes), 3.0);
  EXPECT_DOUBLE_EQ(totalDurationSeconds({}), kEmptyCompositionSeconds);
}

// ---------------------------------------------------------------------------
// Interpretation and assembly
// ---------------------------------------------------------------------------

TEST(CompositionAssemblerTest, InterpretationForSimpleFunction) {
  CodeAnalysis analysis = analyze("function add(a, b) {\n  return a + b;\n}",
                                  Language::JavaScript);
  std::string text = buildInterpretation(analysis, MusicStyle::Classical);
  EXPECT_EQ(text,
            "A clean, minimalist arrangement reflecting simple, elegant code, "
            "featuring 1 melodic theme, Rendered in classical style, "
            "from javascript source code (3 lines).");
}

TEST(CompositionAssemblerTest, InterpretationPluralizesErrors) {
  CodeAnalysis analysis = analyze("raise err\npanic");
  std::string text = buildInterpretation(analysis, MusicStyle::Rock);
  EXPECT_NE(text.find("with 2 dissonant moments signaling potential issues"),
            std::string::npos);
}

TEST(CompositionAssemblerTest, AssembleFillsHeader) {
  const std::string source = "function add(a, b) {\n  return a + b;\n}";
  CodeAnalysis analysis = analyze(source, Language::Python);
  Composition comp =
      assemble(analysis, mapToNotes(analysis, MusicStyle::Jazz), source, MusicStyle::Jazz);
  EXPECT_EQ(comp.title, "CodeSonify: python composition");
  EXPECT_EQ(comp.tempo_bpm, 84);
  EXPECT_EQ(comp.key, 5);
  EXPECT_EQ(comp.scale, ScaleType::Pentatonic);
  EXPECT_EQ(comp.time_signature.numerator, 4);
  EXPECT_EQ(comp.time_signature.denominator, 4);
  EXPECT_EQ(comp.metadata.lines_analyzed, 3);
  EXPECT_EQ(comp.metadata.complexity, 15);
  EXPECT_EQ(comp.metadata.style, MusicStyle::Jazz);
  EXPECT_EQ(comp.metadata.content_hash.size(), 8u);
  EXPECT_GT(comp.noteCount(), 0u);
}

TEST(CompositionAssemblerTest, EmptySourceComposition) {
  CodeAnalysis analysis = analyze("");
  Composition comp = assemble(analysis, {}, "", MusicStyle::Classical);
  EXPECT_TRUE(comp.tracks.empty());
  EXPECT_EQ(comp.tempo_bpm, 70);
  EXPECT_DOUBLE_EQ(comp.total_duration_seconds, 5.0);
  EXPECT_EQ(comp.metadata.content_hash, "00000000");
}

}  // namespace
}  // namespace codesonify
