/// @file
/// @brief Diff-line generation rules, diff composition assembly and reports.

#include "diff/diff_mapper.h"

#include <algorithm>
#include <cstdio>
#include <initializer_list>
#include <utility>

#include "analysis/code_analyzer.h"
#include "compose/composition_assembler.h"
#include "core/pitch_utils.h"
#include "core/text_utils.h"
#include "mapping/music_mapper.h"

namespace codesonify {

namespace {

Note makeNote(int pitch_class, int octave, NoteDuration dur, float velocity, double time,
              Instrument inst) {
  Note note;
  note.pitch.pitch_class = pitch_class;
  note.pitch.octave = octave;
  note.duration = dur;
  note.velocity = velocity;
  note.start_seconds = time;
  note.instrument = inst;
  return note;
}

/// Compose a diff's notes into a finished composition.
Composition assembleDiff(std::string_view diff_text, const std::vector<DiffLine>& lines,
                         const DiffStats& stats, MusicStyle style) {
  const DiffMusicParams params = diffMusicParams(stats);
  const std::vector<Note> notes = mapDiffToNotes(lines, params);

  Composition composition;
  composition.title = "CodeSonify: Diff Composition (" + std::to_string(stats.added_lines) +
                      "+ / " + std::to_string(stats.removed_lines) + "-)";
  composition.tempo_bpm = params.tempo_bpm;
  composition.key = params.key;
  composition.scale = params.scale;
  composition.total_duration_seconds = totalDurationSeconds(notes);
  composition.tracks = groupIntoTracks(notes, TrackNaming::Diff);

  CompositionMetadata& metadata = composition.metadata;
  metadata.source_language = Language::Unknown;
  metadata.lines_analyzed = static_cast<int>(lines.size());
  metadata.complexity = std::min(100, stats.total_changes * 3);
  metadata.content_hash = contentHash(diff_text);
  metadata.interpretation = buildDiffInterpretation(stats, style);
  metadata.style = style;
  return composition;
}

Composition sonifyText(const std::string& text, MusicStyle style) {
  CodeAnalysis analysis = analyze(text);
  return assemble(analysis, mapToNotes(analysis, style), text, style);
}

}  // namespace

DiffMusicParams diffMusicParams(const DiffStats& stats) {
  DiffMusicParams params;
  if (stats.change_ratio > 0.6) {
    params.key = pitch_class::kC;
    params.scale = ScaleType::Major;
  } else if (stats.change_ratio < 0.4) {
    params.key = pitch_class::kA;
    params.scale = ScaleType::Minor;
  } else {
    params.key = pitch_class::kD;
    params.scale = ScaleType::Dorian;
  }
  params.tempo_bpm = std::clamp(80 + stats.total_changes * 2, kDiffMinTempo, kDiffMaxTempo);
  return params;
}

std::vector<Note> mapDiffToNotes(const std::vector<DiffLine>& lines, const DiffMusicParams& params) {
  const auto& major = getScaleIntervals(ScaleType::Major);
  const auto& minor = getScaleIntervals(ScaleType::Minor);
  const auto& penta = getScaleIntervals(ScaleType::Pentatonic);
  const double mult = kReferenceBpm / params.tempo_bpm;
  const int key = params.key;

  std::vector<Note> notes;
  double cursor = 0.0;

  for (const auto& line : lines) {
    switch (line.type) {
      case DiffLineType::Header:
        notes.push_back(makeNote(key, 5, NoteDuration::Sixteenth, 0.2f, cursor,
                                 Instrument::Ambient));
        cursor += 0.1 * mult;
        break;

      case DiffLineType::Context: {
        int degree = penta[static_cast<size_t>(line.line_number) % penta.size()];
        notes.push_back(makeNote((key + degree) % 12, 3, NoteDuration::Quarter, 0.15f, cursor,
                                 Instrument::Ambient));
        cursor += 0.15 * mult;
        break;
      }

      case DiffLineType::Added: {
        // Rising phrase, longer for longer lines.
        const int length = static_cast<int>(trim(line.content).size());
        const int phrase = std::min(5, std::max(1, length / 10 + 1));
        for (int idx = 0; idx < phrase; ++idx) {
          int degree = major[static_cast<size_t>(idx) % major.size()];
          int octave = std::min(6, 4 + idx / static_cast<int>(major.size()));
          notes.push_back(makeNote((key + degree) % 12, octave, NoteDuration::Eighth,
                                   0.6f + idx * 0.05f, cursor, Instrument::Melody));
          cursor += 0.12 * mult;
        }
        if (length > 20) {
          for (int offset : {0, 4, 7}) {
            notes.push_back(makeNote((key + offset) % 12, 4, NoteDuration::Quarter, 0.35f,
                                     cursor, Instrument::Harmony));
          }
        }
        cursor += 0.1 * mult;
        break;
      }

      case DiffLineType::Removed: {
        // Falling phrase from the top of the minor scale.
        const int length = static_cast<int>(trim(line.content).size());
        const int phrase = std::min(4, std::max(1, length / 12 + 1));
        const int scale_size = static_cast<int>(minor.size());
        for (int idx = 0; idx < phrase; ++idx) {
          int degree = minor[static_cast<size_t>((scale_size - 1 - idx) % scale_size)];
          int octave = std::max(2, 4 - idx / scale_size);
          notes.push_back(makeNote((key + degree) % 12, octave, NoteDuration::Eighth,
                                   0.45f - idx * 0.05f, cursor, Instrument::Bass));
          cursor += 0.15 * mult;
        }
        notes.push_back(makeNote(key, 2, NoteDuration::Sixteenth, 0.3f, cursor,
                                 Instrument::Percussion));
        cursor += 0.08 * mult;
        break;
      }
    }
  }
  return notes;
}

std::string buildDiffInterpretation(const DiffStats& stats, MusicStyle style) {
  std::string text;
  if (stats.change_ratio > 0.8) {
    text = "A bright, optimistic composition reflecting significant new code additions";
  } else if (stats.change_ratio > 0.6) {
    text = "A mostly uplifting piece with new code dominating the melody";
  } else if (stats.change_ratio > 0.4) {
    text = "A balanced composition reflecting equal parts creation and removal, "
           "a refactoring journey";
  } else if (stats.change_ratio > 0.2) {
    text = "A contemplative piece where code cleanup dominates, simplification in progress";
  } else {
    text = "A minimalist, descending composition reflecting major code removal, a bold cleanup";
  }

  text += ", " + std::to_string(stats.added_lines) + " lines added, " +
          std::to_string(stats.removed_lines) + " lines removed";

  if (!stats.files.empty()) {
    text += ", across " + std::to_string(stats.files.size()) +
            (stats.files.size() > 1 ? " files" : " file");
  }

  text += std::string(", rendered in ") + musicStyleToString(style) + " style.";
  return text;
}

std::string buildDiffSummary(const DiffStats& stats, const Composition& composition) {
  const std::string add_bar(static_cast<size_t>(std::min(20, stats.added_lines)), '+');
  const std::string remove_bar(static_cast<size_t>(std::min(20, stats.removed_lines)), '-');

  char duration[32];
  std::snprintf(duration, sizeof(duration), "%.1f", composition.total_duration_seconds);

  std::string out;
  out += "Diff Sonification Complete\n";
  out += "\n";
  out += "Changes:\n";
  out += "+ " + std::to_string(stats.added_lines) + " lines added  " + add_bar + "\n";
  out += "- " + std::to_string(stats.removed_lines) + " lines removed  " + remove_bar + "\n";
  out += "\n";
  out += "Musical Interpretation:\n";
  out += std::string("- Key: ") + kNoteNames[composition.key % 12] + " " +
         scaleTypeToString(composition.scale) + " (" +
         (stats.change_ratio > 0.5 ? "bright, more additions" : "dark, more deletions") + ")\n";
  out += "- Tempo: " + std::to_string(composition.tempo_bpm) + " BPM (" +
         (stats.total_changes > 30 ? "intense" : "moderate") + " changes)\n";
  out += std::string("- Duration: ") + duration + "s\n";
  out += "- Tracks: " + std::to_string(composition.tracks.size()) + "\n";
  out += "\n";
  out += "How to read it:\n";
  out += "- Ascending bright melodies = added code\n";
  out += "- Descending dark bass = removed code\n";
  out += "- Chords = significant changes\n";
  out += "- Soft ambient = unchanged context\n";
  out += "\n";
  out += composition.metadata.interpretation;
  return out;
}

DiffSonification sonifyDiff(std::string_view diff_text, MusicStyle style) {
  const std::vector<DiffLine> lines = parseDiff(diff_text);

  DiffSonification result;
  result.stats = computeDiffStats(lines);
  result.composition = assembleDiff(diff_text, lines, result.stats, style);
  result.summary = buildDiffSummary(result.stats, result.composition);
  return result;
}

VersionPairSonification sonifyTwoVersions(const std::string& old_text,
                                          const std::string& new_text, MusicStyle style) {
  DiffSonification diff = sonifyDiff(buildPseudoDiff(old_text, new_text), style);

  VersionPairSonification result;
  result.composition = std::move(diff.composition);
  result.stats = std::move(diff.stats);
  result.summary = std::move(diff.summary);
  result.old_composition = sonifyText(old_text, style);
  result.new_composition = sonifyText(new_text, style);
  return result;
}

}  // namespace codesonify
