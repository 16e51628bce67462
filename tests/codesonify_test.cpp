// Tests for codesonify.h -- end-to-end pipeline and the request boundary.

#include "codesonify.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "midi/midi_writer.h"
#include "midi/smf_decoder.h"

namespace codesonify {
namespace {

constexpr const char* kAddFunction = "function add(a, b) {\n  return a + b;\n}";

constexpr const char* kPythonSample =
    "import math\n"
    "\n"
    "# area of a circle\n"
    "def area(r):\n"
    "    if r < 0:\n"
    "        raise ValueError(\"negative\")\n"
    "    for i in range(3):\n"
    "        print(i)\n"
    "    return math.pi * r * r\n";

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

TEST(CodeSonifyTest, FunctionScenario) {
  CodeAnalysis analysis = analyzeCode(kAddFunction);
  EXPECT_EQ(analysis.metrics.function_count, 1);
  ASSERT_EQ(analysis.structures.size(), 1u);
  EXPECT_EQ(analysis.structures[0].name, "add");
}

TEST(CodeSonifyTest, SameInputSameBytes) {
  std::vector<uint8_t> first = encodeToBinary(sonifyCode(kPythonSample));
  std::vector<uint8_t> second = encodeToBinary(sonifyCode(kPythonSample));
  EXPECT_EQ(first, second);
  EXPECT_EQ(encodeToBase64(sonifyCode(kPythonSample)), encodeToBase64(sonifyCode(kPythonSample)));
}

TEST(CodeSonifyTest, StyleChangesPitchesButNotTiming) {
  Composition classical = sonifyCode(kPythonSample, std::nullopt, MusicStyle::Classical);
  Composition rock = sonifyCode(kPythonSample, std::nullopt, MusicStyle::Rock);
  EXPECT_EQ(classical.noteCount(), rock.noteCount());
  EXPECT_NE(encodeToBinary(classical), encodeToBinary(rock));
}

TEST(CodeSonifyTest, TrackOnsetsNeverDecrease) {
  Composition comp = sonifyCode(kPythonSample);
  for (const auto& track : comp.tracks) {
    for (size_t idx = 1; idx < track.notes.size(); ++idx) {
      EXPECT_GE(track.notes[idx].start_seconds, track.notes[idx - 1].start_seconds)
          << track.name;
    }
  }
}

TEST(CodeSonifyTest, ErrorsProduceDissonanceTrack) {
  Composition comp = sonifyCode(kPythonSample);
  bool found = false;
  for (const auto& track : comp.tracks) {
    if (track.instrument == Instrument::Dissonance) found = true;
  }
  EXPECT_TRUE(found);
  EXPECT_NE(comp.metadata.interpretation.find("dissonant moment"), std::string::npos);
}

TEST(CodeSonifyTest, EncodedTicksAreMonotonic) {
  DecodeResult decoded = decodeSmf(encodeToBinary(sonifyCode(kPythonSample)));
  ASSERT_TRUE(decoded.success) << decoded.error_message;
  EXPECT_EQ(decoded.smf.tracks.size(), sonifyCode(kPythonSample).tracks.size() + 1);
  for (const auto& track : decoded.smf.tracks) {
    for (size_t idx = 1; idx < track.notes.size(); ++idx) {
      EXPECT_GE(track.notes[idx].tick, track.notes[idx - 1].tick);
    }
  }
}

TEST(CodeSonifyTest, EncodedNoteCountMatchesComposition) {
  Composition comp = sonifyCode(kAddFunction);
  DecodeResult decoded = decodeSmf(encodeToBinary(comp));
  ASSERT_TRUE(decoded.success) << decoded.error_message;
  EXPECT_EQ(decoded.smf.noteCount(), comp.noteCount());
}

TEST(CodeSonifyTest, EmptySourceStillEncodes) {
  Composition comp = sonifyCode("");
  EXPECT_TRUE(comp.tracks.empty());
  std::vector<uint8_t> bytes = encodeToBinary(comp);
  DecodeResult decoded = decodeSmf(bytes);
  ASSERT_TRUE(decoded.success);
  EXPECT_EQ(decoded.smf.track_count, 1);
}

TEST(CodeSonifyTest, DiffScenario) {
  Composition comp = sonifyDiffText("--- a/f\n+++ b/f\n@@ -1 +1 @@\n-old\n+new");
  EXPECT_EQ(comp.key, 2);
  EXPECT_EQ(comp.scale, ScaleType::Dorian);
  EXPECT_EQ(comp.tempo_bpm, 84);
}

TEST(CodeSonifyTest, VersionPairMatchesPseudoDiff) {
  Composition pair = sonifyVersionPair("a\nb", "a\nc");
  Composition diff = sonifyDiffText(buildPseudoDiff("a\nb", "a\nc"));
  EXPECT_EQ(encodeToBinary(pair), encodeToBinary(diff));
}

TEST(CodeSonifyTest, OneNoteEncoding) {
  Composition comp;
  comp.title = "One";
  comp.tempo_bpm = 120;
  Track track;
  track.name = "Melody";
  track.instrument = Instrument::Melody;
  Note note;
  note.pitch = Pitch{0, 4};
  note.duration = NoteDuration::Quarter;
  note.velocity = 0.5f;
  note.start_seconds = 0.0;
  note.instrument = Instrument::Melody;
  track.notes.push_back(note);
  comp.tracks.push_back(track);

  DecodeResult decoded = decodeSmf(encodeToBinary(comp));
  ASSERT_TRUE(decoded.success);
  const DecodedTrack* parsed = decoded.smf.findTrack("Melody");
  ASSERT_NE(parsed, nullptr);
  ASSERT_EQ(parsed->notes.size(), 1u);
  EXPECT_EQ(parsed->notes[0].pitch, 60);
  EXPECT_EQ(parsed->notes[0].tick, 0u);
  EXPECT_EQ(parsed->notes[0].length, 480u);
  EXPECT_EQ(parsed->notes[0].velocity, 64);
}

TEST(CodeSonifyTest, Base64StartsWithHeader) {
  EXPECT_EQ(encodeToBase64(sonifyCode(kAddFunction)).rfind("TVRoZA", 0), 0u);
}

// ---------------------------------------------------------------------------
// Request boundary
// ---------------------------------------------------------------------------

TEST(CodeSonifyTest, CodeRequest) {
  SonifyResult result =
      sonifyFromJson(R"({"code":"def f(x):\n    return x","language":"python","style":"jazz"})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.error, SonifyError::Ok);
  ASSERT_TRUE(result.analysis.has_value());
  EXPECT_EQ(result.analysis->language, Language::Python);
  EXPECT_FALSE(result.diff_stats.has_value());
  EXPECT_EQ(result.composition.metadata.style, MusicStyle::Jazz);
  EXPECT_EQ(result.midi, encodeToBinary(result.composition));
}

TEST(CodeSonifyTest, DiffRequest) {
  SonifyResult result = sonifyFromJson(R"({"diff":"-a\n+b\n+c"})");
  ASSERT_TRUE(result.success) << result.error_message;
  ASSERT_TRUE(result.diff_stats.has_value());
  EXPECT_EQ(result.diff_stats->added_lines, 2);
  EXPECT_FALSE(result.summary.empty());
  EXPECT_FALSE(result.analysis.has_value());
}

TEST(CodeSonifyTest, VersionPairRequest) {
  SonifyResult result = sonifyFromJson(R"({"old":"x = 1","new":"x = 2"})");
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.diff_stats->removed_lines, 1);
  EXPECT_EQ(result.composition.title, "CodeSonify: Diff Composition (1+ / 1-)");
}

TEST(CodeSonifyTest, MalformedJson) {
  SonifyResult result = sonifyFromJson("{\"code\": ");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, SonifyError::InvalidJson);
  EXPECT_EQ(result.error_message.rfind("Invalid JSON: ", 0), 0u);
  EXPECT_TRUE(result.midi.empty());
}

TEST(CodeSonifyTest, WrongFieldType) {
  SonifyResult result = sonifyFromJson(R"({"code":42})");
  EXPECT_EQ(result.error, SonifyError::InvalidField);
  EXPECT_EQ(result.error_message, "Field 'code' must be a string, got number");
}

TEST(CodeSonifyTest, MissingInput) {
  EXPECT_EQ(sonifyFromJson(R"({"style":"rock"})").error, SonifyError::MissingInput);
  EXPECT_EQ(sonifyFromJson(R"({"old":"a"})").error, SonifyError::MissingInput);
}

TEST(CodeSonifyTest, ConflictingInput) {
  EXPECT_EQ(sonifyFromJson(R"({"code":"x","diff":"+y"})").error, SonifyError::ConflictingInput);
  EXPECT_EQ(sonifyFromJson(R"({"code":"x","old":"a","new":"b"})").error,
            SonifyError::ConflictingInput);
}

TEST(CodeSonifyTest, UnknownLanguageAndStyle) {
  SonifyResult bad_lang = sonifyFromJson(R"({"code":"x","language":"cobol"})");
  EXPECT_EQ(bad_lang.error, SonifyError::InvalidLanguage);
  EXPECT_EQ(bad_lang.error_message, "Unknown language: cobol");

  SonifyResult bad_style = sonifyFromJson(R"({"code":"x","style":"polka"})");
  EXPECT_EQ(bad_style.error, SonifyError::InvalidStyle);
}

TEST(CodeSonifyTest, RequestFromJsonLeavesOutputOnError) {
  JsonObject fields;
  fields["code"].type = JsonValue::Array;
  SonifyRequest request;
  request.code = "keep";
  std::string message;
  EXPECT_EQ(requestFromJson(fields, request, message), SonifyError::InvalidField);
  EXPECT_EQ(request.code, "keep");
  EXPECT_EQ(message, "Field 'code' must be a string, got array");
}

TEST(CodeSonifyTest, ErrorStrings) {
  EXPECT_STREQ(sonifyErrorString(SonifyError::Ok), "No error");
  EXPECT_STREQ(sonifyErrorString(SonifyError::ConflictingInput),
               "Request carries more than one input");
}

}  // namespace
}  // namespace codesonify
