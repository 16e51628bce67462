// Tests for midi/midi_writer.h -- SMF Type 1 encoding of compositions.

#include "midi/midi_writer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "core/gm_program.h"
#include "midi/midi_stream.h"

namespace codesonify {
namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Note makeNote(Pitch pitch, double time, float velocity = 0.5f,
              NoteDuration dur = NoteDuration::Quarter) {
  Note note;
  note.pitch = pitch;
  note.start_seconds = time;
  note.velocity = velocity;
  note.duration = dur;
  note.instrument = Instrument::Melody;
  return note;
}

Composition makeComposition(std::vector<Note> notes, Instrument inst = Instrument::Melody,
                            const std::string& track_name = "Lead") {
  Composition comp;
  comp.title = "Test";
  comp.tempo_bpm = 120;
  if (!notes.empty()) {
    Track track;
    track.name = track_name;
    track.instrument = inst;
    for (auto& note : notes) note.instrument = inst;
    track.notes = std::move(notes);
    comp.tracks.push_back(track);
  }
  return comp;
}

/// Locate the Nth MTrk chunk and return its body.
std::vector<uint8_t> trackBody(const std::vector<uint8_t>& bytes, int index) {
  size_t offset = 8 + readBE32(bytes.data(), 4);
  for (int idx = 0; offset + 8 <= bytes.size(); ++idx) {
    uint32_t len = readBE32(bytes.data(), offset + 4);
    if (idx == index) {
      return std::vector<uint8_t>(bytes.begin() + static_cast<long>(offset + 8),
                                  bytes.begin() + static_cast<long>(offset + 8 + len));
    }
    offset += 8 + len;
  }
  return {};
}

bool containsSequence(const std::vector<uint8_t>& haystack, const std::vector<uint8_t>& needle) {
  return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) !=
         haystack.end();
}

// ---------------------------------------------------------------------------
// Free helpers
// ---------------------------------------------------------------------------

TEST(MidiWriterTest, ChannelAssignment) {
  EXPECT_EQ(instrumentChannel(Instrument::Melody), 0);
  EXPECT_EQ(instrumentChannel(Instrument::Bass), 1);
  EXPECT_EQ(instrumentChannel(Instrument::Harmony), 2);
  EXPECT_EQ(instrumentChannel(Instrument::Percussion), kPercussionChannel);
  EXPECT_EQ(instrumentChannel(Instrument::Ambient), 3);
  EXPECT_EQ(instrumentChannel(Instrument::Dissonance), 4);
}

TEST(MidiWriterTest, ProgramAssignment) {
  EXPECT_EQ(instrumentProgram(Instrument::Melody), GmProgram::kPiano);
  EXPECT_EQ(instrumentProgram(Instrument::Bass), 33);
  EXPECT_EQ(instrumentProgram(Instrument::Ambient), 88);
  EXPECT_EQ(instrumentProgram(Instrument::Dissonance), 30);
}

TEST(MidiWriterTest, SecondsToTicks) {
  EXPECT_EQ(secondsToTicks(0.0, 120), 0u);
  EXPECT_EQ(secondsToTicks(0.5, 120), 480u);
  EXPECT_EQ(secondsToTicks(1.0, 60), 480u);
  EXPECT_EQ(secondsToTicks(0.25, 90), 180u);
  EXPECT_EQ(secondsToTicks(-1.0, 120), 0u);
}

TEST(MidiWriterTest, VelocityMapping) {
  EXPECT_EQ(velocityToMidi(0.5f), 64);
  EXPECT_EQ(velocityToMidi(1.0f), 127);
  EXPECT_EQ(velocityToMidi(0.0f), 1);
  EXPECT_EQ(velocityToMidi(2.0f), 127);
  EXPECT_EQ(velocityToMidi(0.15f), 19);
}

TEST(MidiWriterTest, PrintableAsciiFilter) {
  EXPECT_EQ(printableAscii("Melody (Functions & Logic)"), "Melody (Functions & Logic)");
  EXPECT_EQ(printableAscii("a\tb\n\xC3\xA9" "c"), "abc");
}

TEST(MidiWriterTest, GeneratorText) {
  Composition comp;
  comp.metadata.source_language = Language::Python;
  comp.metadata.complexity = 42;
  EXPECT_EQ(generatorText(comp), "Generated by CodeSonify | python | Complexity: 42/100");
}

// ---------------------------------------------------------------------------
// File structure
// ---------------------------------------------------------------------------

TEST(MidiWriterTest, DefaultConstructionProducesEmptyData) {
  MidiWriter writer;
  EXPECT_TRUE(writer.toBytes().empty());
  EXPECT_EQ(writer.skippedNotes(), 0u);
}

TEST(MidiWriterTest, HeaderChunk) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 4}, 0.0)}));
  auto bytes = writer.toBytes();
  ASSERT_GE(bytes.size(), 14u);
  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "MThd");
  EXPECT_EQ(readBE32(bytes.data(), 4), 6u);
  EXPECT_EQ(readBE16(bytes.data(), 8), 1);     // format 1
  EXPECT_EQ(readBE16(bytes.data(), 10), 2);    // tempo track + one instrument
  EXPECT_EQ(readBE16(bytes.data(), 12), 480);  // division
}

TEST(MidiWriterTest, EmptyCompositionHasOnlyTempoTrack) {
  MidiWriter writer;
  writer.build(makeComposition({}));
  auto bytes = writer.toBytes();
  EXPECT_EQ(readBE16(bytes.data(), 10), 1);
  EXPECT_FALSE(trackBody(bytes, 0).empty());
  EXPECT_TRUE(trackBody(bytes, 1).empty());
}

TEST(MidiWriterTest, TempoTrackMetaEvents) {
  Composition comp = makeComposition({makeNote({0, 4}, 0.0)});
  comp.metadata.complexity = 7;
  MidiWriter writer;
  writer.build(comp);
  auto body = trackBody(writer.toBytes(), 0);

  EXPECT_TRUE(containsSequence(body, {0x00, 0xFF, 0x03, 0x04, 'T', 'e', 's', 't'}));
  // 500000 us per beat at 120 BPM.
  EXPECT_TRUE(containsSequence(body, {0x00, 0xFF, 0x51, 0x03, 0x07, 0xA1, 0x20}));
  EXPECT_TRUE(containsSequence(body, {0x00, 0xFF, 0x58, 0x04, 0x04, 0x02, 0x18, 0x08}));
  const std::string text = "Generated by CodeSonify | unknown | Complexity: 7/100";
  std::vector<uint8_t> text_event = {0x00, 0xFF, 0x01, static_cast<uint8_t>(text.size())};
  text_event.insert(text_event.end(), text.begin(), text.end());
  EXPECT_TRUE(containsSequence(body, text_event));

  std::vector<uint8_t> eot = {0x00, 0xFF, 0x2F, 0x00};
  ASSERT_GE(body.size(), eot.size());
  EXPECT_TRUE(std::equal(eot.begin(), eot.end(), body.end() - 4));
}

TEST(MidiWriterTest, TempoRoundsMicroseconds) {
  Composition comp = makeComposition({});
  comp.tempo_bpm = 84;  // 60000000 / 84 = 714285.7 -> 714286 = 0x0AE62E
  MidiWriter writer;
  writer.build(comp);
  EXPECT_TRUE(containsSequence(trackBody(writer.toBytes(), 0),
                               {0xFF, 0x51, 0x03, 0x0A, 0xE6, 0x2E}));
}

// ---------------------------------------------------------------------------
// Instrument tracks
// ---------------------------------------------------------------------------

TEST(MidiWriterTest, SingleNoteEncoding) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 4}, 0.0, 0.5f)}));
  auto body = trackBody(writer.toBytes(), 1);

  std::vector<uint8_t> expected = {
      0x00, 0xFF, 0x03, 0x04, 'L', 'e', 'a', 'd',  // track name
      0x00, 0xC0, 0x00,                            // program change: piano
      0x00, 0x90, 0x3C, 0x40,                      // note-on C4 velocity 64
      0x83, 0x60, 0x80, 0x3C, 0x00,                // note-off after 480 ticks
      0x00, 0xFF, 0x2F, 0x00,                      // end of track
  };
  EXPECT_EQ(body, expected);
}

TEST(MidiWriterTest, PercussionTrackHasNoProgramChange) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 3}, 0.0)}, Instrument::Percussion, "Drums"));
  auto body = trackBody(writer.toBytes(), 1);
  for (uint8_t byte : body) {
    EXPECT_NE(byte & 0xF0, 0xC0) << "Drum track must not change program";
  }
  EXPECT_TRUE(containsSequence(body, {0x00, 0x99, 0x30, 0x40}));
}

TEST(MidiWriterTest, BackToBackNotesShareTick) {
  // Second note starts exactly where the first ends.
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 4}, 0.0), makeNote({2, 4}, 0.5)}));
  auto body = trackBody(writer.toBytes(), 1);
  EXPECT_TRUE(containsSequence(body, {0x83, 0x60, 0x80, 0x3C, 0x00, 0x00, 0x90, 0x3E}));
}

TEST(MidiWriterTest, ChordNotesEmitOnOffPerNote) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 4}, 0.0), makeNote({4, 4}, 0.0)}));
  auto body = trackBody(writer.toBytes(), 1);
  std::vector<uint8_t> expected_tail = {
      0x00, 0xC0, 0x00,              // program change
      0x00, 0x90, 0x3C, 0x40,        // C4 on at 0
      0x83, 0x60, 0x80, 0x3C, 0x00,  // C4 off at 480
      0x00, 0x90, 0x40, 0x40,        // E4 on at 0, cursor went backward
      0x83, 0x60, 0x80, 0x40, 0x00,  // E4 off at 480
      0x00, 0xFF, 0x2F, 0x00,
  };
  ASSERT_GE(body.size(), expected_tail.size());
  EXPECT_TRUE(std::equal(expected_tail.begin(), expected_tail.end(),
                         body.end() - static_cast<long>(expected_tail.size())));
}

TEST(MidiWriterTest, OverlappingNoteDeltaMeasuredFromLastEvent) {
  // Long first note, short later note that ends earlier.
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 4}, 0.0, 0.5f, NoteDuration::Whole),
                                makeNote({4, 4}, 0.25, 0.5f, NoteDuration::Sixteenth)}));
  auto body = trackBody(writer.toBytes(), 1);
  std::vector<uint8_t> expected_tail = {
      0x00, 0x90, 0x3C, 0x40,        // C4 on at 0
      0x8F, 0x00, 0x80, 0x3C, 0x00,  // C4 off at 1920
      0x00, 0x90, 0x40, 0x40,        // E4 on at 240 (before cursor, delta 0)
      0x78, 0x80, 0x40, 0x00,        // E4 off at 360
      0x00, 0xFF, 0x2F, 0x00,
  };
  ASSERT_GE(body.size(), expected_tail.size());
  EXPECT_TRUE(std::equal(expected_tail.begin(), expected_tail.end(),
                         body.end() - static_cast<long>(expected_tail.size())));
}

TEST(MidiWriterTest, NotesWrittenInStartOrder) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({4, 4}, 0.5), makeNote({0, 4}, 0.0)}));
  auto body = trackBody(writer.toBytes(), 1);
  EXPECT_TRUE(containsSequence(body, {0x00, 0x90, 0x3C, 0x40, 0x83, 0x60, 0x80, 0x3C, 0x00,
                                      0x00, 0x90, 0x40, 0x40}));
}

TEST(MidiWriterTest, OutOfRangePitchSkipped) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({11, 9}, 0.0), makeNote({0, 4}, 0.0)}));
  EXPECT_EQ(writer.skippedNotes(), 1u);
  auto body = trackBody(writer.toBytes(), 1);
  EXPECT_TRUE(containsSequence(body, {0x90, 0x3C}));
  EXPECT_FALSE(containsSequence(body, {0x90, 0x83}));
}

TEST(MidiWriterTest, RebuildReplacesData) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 4}, 0.0), makeNote({11, 9}, 0.0)}));
  writer.build(makeComposition({makeNote({0, 4}, 0.0)}));
  EXPECT_EQ(writer.skippedNotes(), 0u);
  EXPECT_EQ(readBE16(writer.toBytes().data(), 10), 2);
}

TEST(MidiWriterTest, DeterministicOutput) {
  Composition comp = makeComposition({makeNote({0, 4}, 0.0), makeNote({7, 4}, 0.3)});
  MidiWriter first;
  MidiWriter second;
  first.build(comp);
  second.build(comp);
  EXPECT_EQ(first.toBytes(), second.toBytes());
}

TEST(MidiWriterTest, WriteToFile) {
  MidiWriter writer;
  writer.build(makeComposition({makeNote({0, 4}, 0.0)}));
  const std::string path = ::testing::TempDir() + "codesonify_writer_test.mid";
  ASSERT_TRUE(writer.writeToFile(path));

  FILE* file = std::fopen(path.c_str(), "rb");
  ASSERT_NE(file, nullptr);
  std::fseek(file, 0, SEEK_END);
  long size = std::ftell(file);
  std::fclose(file);
  std::remove(path.c_str());
  EXPECT_EQ(static_cast<size_t>(size), writer.toBytes().size());
}

TEST(MidiWriterTest, WriteToInvalidPathFails) {
  MidiWriter writer;
  writer.build(makeComposition({}));
  EXPECT_FALSE(writer.writeToFile("/nonexistent_dir_codesonify/out.mid"));
}

}  // namespace
}  // namespace codesonify
