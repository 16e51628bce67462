/// @file
/// @brief Track grouping, instrument configuration and code interpretation text.

#include "compose/composition_assembler.h"

#include <algorithm>
#include <iterator>
#include <utility>

#include "core/pitch_utils.h"
#include "core/text_utils.h"
#include "mapping/music_mapper.h"

namespace codesonify {

namespace {

TrackEffect makeEffect(EffectKind kind, const char* first_name, double first_value,
                       const char* second_name, double second_value) {
  TrackEffect effect;
  effect.kind = kind;
  effect.params.emplace_back(first_name, first_value);
  if (second_name != nullptr) effect.params.emplace_back(second_name, second_value);
  return effect;
}

InstrumentConfig makeConfig(Waveform waveform, float volume, std::vector<TrackEffect> effects) {
  InstrumentConfig config;
  config.waveform = waveform;
  config.volume = volume;
  config.effects = std::move(effects);
  return config;
}

std::string plural(int count, const char* noun) {
  std::string text = std::to_string(count) + " " + noun;
  if (count > 1) text += "s";
  return text;
}

}  // namespace

const InstrumentConfig& getInstrumentConfig(Instrument instrument) {
  static const InstrumentConfig kMelody = makeConfig(
      Waveform::Triangle, 0.7f,
      {makeEffect(EffectKind::Reverb, "decay", 2.5, "wet", 0.3)});
  static const InstrumentConfig kBass = makeConfig(
      Waveform::Sine, 0.5f,
      {makeEffect(EffectKind::Filter, "frequency", 400, "type", 0)});
  static const InstrumentConfig kHarmony = makeConfig(
      Waveform::Sine, 0.4f,
      {makeEffect(EffectKind::Reverb, "decay", 4, "wet", 0.5),
       makeEffect(EffectKind::Chorus, "frequency", 1.5, "depth", 0.7)});
  static const InstrumentConfig kPercussion = makeConfig(
      Waveform::Square, 0.5f,
      {makeEffect(EffectKind::Distortion, "amount", 0.2, nullptr, 0)});
  static const InstrumentConfig kAmbient = makeConfig(
      Waveform::Sine, 0.2f,
      {makeEffect(EffectKind::Reverb, "decay", 6, "wet", 0.7),
       makeEffect(EffectKind::Delay, "time", 0.4, "feedback", 0.3)});
  static const InstrumentConfig kDissonance = makeConfig(
      Waveform::Sawtooth, 0.6f,
      {makeEffect(EffectKind::Distortion, "amount", 0.5, nullptr, 0),
       makeEffect(EffectKind::Filter, "frequency", 2000, "type", 1)});

  switch (instrument) {
    case Instrument::Melody:     return kMelody;
    case Instrument::Bass:       return kBass;
    case Instrument::Harmony:    return kHarmony;
    case Instrument::Percussion: return kPercussion;
    case Instrument::Ambient:    return kAmbient;
    case Instrument::Dissonance: return kDissonance;
  }
  return kAmbient;
}

const char* trackName(Instrument instrument, TrackNaming naming) {
  if (naming == TrackNaming::Diff) {
    switch (instrument) {
      case Instrument::Melody:     return "Additions (Ascending Major)";
      case Instrument::Bass:       return "Deletions (Descending Minor)";
      case Instrument::Harmony:    return "Significant Changes (Chords)";
      case Instrument::Percussion: return "Change Markers";
      case Instrument::Ambient:    return "Context & Headers";
      case Instrument::Dissonance: return "dissonance";
    }
    return instrumentToString(instrument);
  }

  switch (instrument) {
    case Instrument::Melody:     return "Melody (Functions & Logic)";
    case Instrument::Bass:       return "Bass (Variables & Data)";
    case Instrument::Harmony:    return "Harmony (Conditionals & Branches)";
    case Instrument::Percussion: return "Rhythm (Loops & Iterations)";
    case Instrument::Ambient:    return "Ambient (Comments & Structure)";
    case Instrument::Dissonance: return "Dissonance (Errors & Warnings)";
  }
  return instrumentToString(instrument);
}

LanguageKey languageKey(Language language) {
  switch (language) {
    case Language::JavaScript: return {pitch_class::kC, ScaleType::Mixolydian};
    case Language::TypeScript: return {pitch_class::kD, ScaleType::Major};
    case Language::Python:     return {pitch_class::kF, ScaleType::Pentatonic};
    case Language::Java:       return {pitch_class::kG, ScaleType::Minor};
    case Language::CSharp:     return {pitch_class::kE, ScaleType::Lydian};
    case Language::Go:         return {pitch_class::kA, ScaleType::Dorian};
    case Language::Rust:       return {pitch_class::kB, ScaleType::Blues};
    case Language::Unknown:    return {pitch_class::kC, ScaleType::Major};
  }
  return {pitch_class::kC, ScaleType::Major};
}

std::vector<Track> groupIntoTracks(const std::vector<Note>& notes, TrackNaming naming) {
  std::vector<Track> tracks;
  int track_index[kInstrumentCount];
  std::fill(std::begin(track_index), std::end(track_index), -1);

  for (const auto& note : notes) {
    int& slot = track_index[static_cast<int>(note.instrument)];
    if (slot < 0) {
      const InstrumentConfig& config = getInstrumentConfig(note.instrument);
      Track track;
      track.name = trackName(note.instrument, naming);
      track.instrument = note.instrument;
      track.waveform = config.waveform;
      track.volume = config.volume;
      track.effects = config.effects;
      slot = static_cast<int>(tracks.size());
      tracks.push_back(std::move(track));
    }
    tracks[static_cast<size_t>(slot)].notes.push_back(note);
  }
  return tracks;
}

double totalDurationSeconds(const std::vector<Note>& notes) {
  if (notes.empty()) return kEmptyCompositionSeconds;
  double latest = notes.front().start_seconds;
  for (const auto& note : notes) latest = std::max(latest, note.start_seconds);
  return latest + 1.0;
}

std::string buildInterpretation(const CodeAnalysis& analysis, MusicStyle style) {
  const CodeMetrics& metrics = analysis.metrics;
  std::vector<std::string> parts;

  if (metrics.complexity > 70) {
    parts.emplace_back("A complex, intense composition reflecting deeply nested logic");
  } else if (metrics.complexity > 40) {
    parts.emplace_back("A balanced piece with moderate complexity");
  } else {
    parts.emplace_back("A clean, minimalist arrangement reflecting simple, elegant code");
  }

  if (metrics.function_count > 5) {
    parts.push_back("with " + std::to_string(metrics.function_count) +
                    " melodic phrases representing well-organized functions");
  } else if (metrics.function_count > 0) {
    parts.push_back("featuring " + plural(metrics.function_count, "melodic theme"));
  }

  if (metrics.loop_count > 3) {
    parts.emplace_back("driven by strong, repetitive rhythmic patterns");
  } else if (metrics.loop_count > 0) {
    parts.emplace_back("with subtle rhythmic elements");
  }

  if (metrics.conditional_count > 5) {
    parts.emplace_back("rich harmonic changes reflecting branching logic");
  } else if (metrics.conditional_count > 0) {
    parts.emplace_back("and gentle harmonic shifts");
  }

  if (metrics.error_count > 0) {
    parts.push_back("with " + plural(metrics.error_count, "dissonant moment") +
                    " signaling potential issues");
  }

  parts.push_back(std::string("Rendered in ") + musicStyleToString(style) + " style");
  parts.push_back(std::string("from ") + languageToString(analysis.language) +
                  " source code (" + std::to_string(metrics.total_lines) + " lines)");

  std::string text;
  for (size_t idx = 0; idx < parts.size(); ++idx) {
    if (idx > 0) text += ", ";
    text += parts[idx];
  }
  return text + ".";
}

Composition assemble(const CodeAnalysis& analysis, const std::vector<Note>& notes,
                     const std::string& source, MusicStyle style) {
  const LanguageKey lang_key = languageKey(analysis.language);

  Composition composition;
  composition.title = std::string("CodeSonify: ") + languageToString(analysis.language) +
                      " composition";
  composition.tempo_bpm = tempoFromComplexity(analysis.metrics.complexity);
  composition.key = lang_key.key;
  composition.scale = lang_key.scale;
  composition.total_duration_seconds = totalDurationSeconds(notes);
  composition.tracks = groupIntoTracks(notes, TrackNaming::Code);

  CompositionMetadata& metadata = composition.metadata;
  metadata.source_language = analysis.language;
  metadata.lines_analyzed = analysis.metrics.total_lines;
  metadata.complexity = analysis.metrics.complexity;
  metadata.content_hash = contentHash(source);
  metadata.interpretation = buildInterpretation(analysis, style);
  metadata.style = style;
  return composition;
}

}  // namespace codesonify
