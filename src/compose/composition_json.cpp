/// @file
/// @brief JsonWriter-based export of the pipeline's data model.

#include "compose/composition_json.h"

#include "core/pitch_utils.h"

namespace codesonify {

namespace {

void writeNote(JsonWriter& writer, const Note& note) {
  writer.beginObject();
  writer.key("note");
  writer.value(note.pitch.toString());
  writer.key("duration");
  writer.value(noteDurationToString(note.duration));
  writer.key("velocity");
  writer.value(static_cast<double>(note.velocity));
  writer.key("time");
  writer.value(note.start_seconds);
  writer.key("instrument");
  writer.value(instrumentToString(note.instrument));
  writer.endObject();
}

void writeEffect(JsonWriter& writer, const TrackEffect& effect) {
  writer.beginObject();
  writer.key("type");
  writer.value(effectKindToString(effect.kind));
  writer.key("params");
  writer.beginObject();
  for (const auto& param : effect.params) {
    writer.key(param.first);
    writer.value(param.second);
  }
  writer.endObject();
  writer.endObject();
}

void writeTrack(JsonWriter& writer, const Track& track) {
  writer.beginObject();
  writer.key("name");
  writer.value(track.name);
  writer.key("instrument");
  writer.value(instrumentToString(track.instrument));
  writer.key("waveform");
  writer.value(waveformToString(track.waveform));
  writer.key("volume");
  writer.value(static_cast<double>(track.volume));
  writer.key("effects");
  writer.beginArray();
  for (const auto& effect : track.effects) writeEffect(writer, effect);
  writer.endArray();
  writer.key("notes");
  writer.beginArray();
  for (const auto& note : track.notes) writeNote(writer, note);
  writer.endArray();
  writer.endObject();
}

void writeStructure(JsonWriter& writer, const CodeStructure& structure) {
  writer.beginObject();
  writer.key("type");
  writer.value(tokenKindToString(structure.kind));
  writer.key("name");
  writer.value(structure.name);
  writer.key("startLine");
  writer.value(structure.start_line);
  writer.key("endLine");
  writer.value(structure.end_line);
  writer.key("depth");
  writer.value(structure.depth);
  writer.key("children");
  writer.beginArray();
  for (const auto& child : structure.children) writeStructure(writer, child);
  writer.endArray();
  writer.endObject();
}

void writeMetrics(JsonWriter& writer, const CodeMetrics& metrics) {
  writer.beginObject();
  writer.key("totalLines");
  writer.value(metrics.total_lines);
  writer.key("codeLines");
  writer.value(metrics.code_lines);
  writer.key("commentLines");
  writer.value(metrics.comment_lines);
  writer.key("emptyLines");
  writer.value(metrics.empty_lines);
  writer.key("functionCount");
  writer.value(metrics.function_count);
  writer.key("loopCount");
  writer.value(metrics.loop_count);
  writer.key("conditionalCount");
  writer.value(metrics.conditional_count);
  writer.key("variableCount");
  writer.value(metrics.variable_count);
  writer.key("classCount");
  writer.value(metrics.class_count);
  writer.key("importCount");
  writer.value(metrics.import_count);
  writer.key("errorCount");
  writer.value(metrics.error_count);
  writer.key("maxNestingDepth");
  writer.value(metrics.max_nesting_depth);
  writer.key("complexity");
  writer.value(metrics.complexity);
  writer.endObject();
}

}  // namespace

void writeCompositionJson(JsonWriter& writer, const Composition& composition) {
  writer.beginObject();
  writer.key("title");
  writer.value(composition.title);
  writer.key("tempo");
  writer.value(composition.tempo_bpm);
  writer.key("timeSignature");
  writer.beginArray();
  writer.value(static_cast<int>(composition.time_signature.numerator));
  writer.value(static_cast<int>(composition.time_signature.denominator));
  writer.endArray();
  writer.key("key");
  writer.value(kNoteNames[((composition.key % 12) + 12) % 12]);
  writer.key("scale");
  writer.value(scaleTypeToString(composition.scale));
  writer.key("duration");
  writer.value(composition.total_duration_seconds);

  writer.key("tracks");
  writer.beginArray();
  for (const auto& track : composition.tracks) writeTrack(writer, track);
  writer.endArray();

  const CompositionMetadata& metadata = composition.metadata;
  writer.key("metadata");
  writer.beginObject();
  writer.key("sourceLanguage");
  writer.value(languageToString(metadata.source_language));
  writer.key("linesAnalyzed");
  writer.value(metadata.lines_analyzed);
  writer.key("complexity");
  writer.value(metadata.complexity);
  writer.key("codeHash");
  writer.value(metadata.content_hash);
  writer.key("style");
  writer.value(musicStyleToString(metadata.style));
  writer.key("musicalInterpretation");
  writer.value(metadata.interpretation);
  writer.endObject();

  writer.endObject();
}

void writeAnalysisJson(JsonWriter& writer, const CodeAnalysis& analysis) {
  writer.beginObject();
  writer.key("language");
  writer.value(languageToString(analysis.language));
  writer.key("metrics");
  writeMetrics(writer, analysis.metrics);

  writer.key("structure");
  writer.beginArray();
  for (const auto& structure : analysis.structures) writeStructure(writer, structure);
  writer.endArray();

  writer.key("tokens");
  writer.beginArray();
  for (const auto& token : analysis.tokens) {
    writer.beginObject();
    writer.key("type");
    writer.value(tokenKindToString(token.kind));
    writer.key("value");
    writer.value(token.text);
    writer.key("line");
    writer.value(token.line);
    writer.key("column");
    writer.value(token.column);
    writer.key("depth");
    writer.value(token.depth);
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
}

void writeDiffStatsJson(JsonWriter& writer, const DiffStats& stats) {
  writer.beginObject();
  writer.key("addedLines");
  writer.value(stats.added_lines);
  writer.key("removedLines");
  writer.value(stats.removed_lines);
  writer.key("contextLines");
  writer.value(stats.context_lines);
  writer.key("totalChanges");
  writer.value(stats.total_changes);
  writer.key("changeRatio");
  writer.value(stats.change_ratio);
  writer.key("files");
  writer.beginArray();
  for (const auto& file : stats.files) writer.value(file);
  writer.endArray();
  writer.endObject();
}

std::string compositionToJson(const Composition& composition, bool pretty) {
  JsonWriter writer;
  writeCompositionJson(writer, composition);
  return pretty ? writer.toPrettyString() : writer.toString();
}

std::string analysisToJson(const CodeAnalysis& analysis, bool pretty) {
  JsonWriter writer;
  writeAnalysisJson(writer, analysis);
  return pretty ? writer.toPrettyString() : writer.toString();
}

}  // namespace codesonify
