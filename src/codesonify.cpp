/// @file
/// @brief Pipeline entry points and request validation.

#include "codesonify.h"

#include <utility>

#include "analysis/code_analyzer.h"
#include "compose/composition_assembler.h"
#include "core/text_utils.h"
#include "diff/diff_mapper.h"
#include "mapping/music_mapper.h"
#include "midi/midi_writer.h"

namespace codesonify {

namespace {

SonifyResult failure(SonifyError error, std::string message) {
  SonifyResult result;
  result.success = false;
  result.error = error;
  result.error_message = std::move(message);
  return result;
}

/// Fetch an optional string field; a present non-string value is an error.
bool stringField(const JsonObject& fields, const char* name, std::optional<std::string>& out,
                 std::string& message) {
  auto iter = fields.find(name);
  if (iter == fields.end()) return true;
  if (iter->second.type != JsonValue::String) {
    message = std::string("Field '") + name + "' must be a string, got " +
              iter->second.typeName();
    return false;
  }
  out = iter->second.string_val;
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

CodeAnalysis analyzeCode(const std::string& text, std::optional<Language> language_hint) {
  return analyze(text, language_hint);
}

Composition sonifyCode(const std::string& text, std::optional<Language> language_hint,
                       MusicStyle style) {
  CodeAnalysis analysis = analyze(text, language_hint);
  std::vector<Note> notes = mapToNotes(analysis, style);
  return assemble(analysis, notes, text, style);
}

Composition sonifyDiffText(const std::string& diff_text, MusicStyle style) {
  return sonifyDiff(diff_text, style).composition;
}

Composition sonifyVersionPair(const std::string& old_text, const std::string& new_text,
                              MusicStyle style) {
  return sonifyDiff(buildPseudoDiff(old_text, new_text), style).composition;
}

std::vector<uint8_t> encodeToBinary(const Composition& composition) {
  MidiWriter writer;
  writer.build(composition);
  return writer.toBytes();
}

std::string encodeToBase64(const Composition& composition) {
  return encodeBase64(encodeToBinary(composition));
}

// ---------------------------------------------------------------------------
// Request boundary
// ---------------------------------------------------------------------------

const char* sonifyErrorString(SonifyError error) {
  switch (error) {
    case SonifyError::Ok:               return "No error";
    case SonifyError::InvalidJson:      return "Malformed JSON request";
    case SonifyError::InvalidField:     return "Request field has the wrong type";
    case SonifyError::MissingInput:     return "Request carries no input";
    case SonifyError::ConflictingInput: return "Request carries more than one input";
    case SonifyError::InvalidLanguage:  return "Unknown language";
    case SonifyError::InvalidStyle:     return "Unknown style";
  }
  return "Unknown error";
}

SonifyError requestFromJson(const JsonObject& fields, SonifyRequest& out, std::string& message) {
  std::optional<std::string> code, diff, old_code, new_code, language, style;
  if (!stringField(fields, "code", code, message) ||
      !stringField(fields, "diff", diff, message) ||
      !stringField(fields, "old", old_code, message) ||
      !stringField(fields, "new", new_code, message) ||
      !stringField(fields, "language", language, message) ||
      !stringField(fields, "style", style, message)) {
    return SonifyError::InvalidField;
  }

  if (old_code.has_value() != new_code.has_value()) {
    message = "Fields 'old' and 'new' must be given together";
    return SonifyError::MissingInput;
  }

  int inputs = (code ? 1 : 0) + (diff ? 1 : 0) + (old_code ? 1 : 0);
  if (inputs == 0) {
    message = "Request needs 'code', 'diff', or 'old' and 'new'";
    return SonifyError::MissingInput;
  }
  if (inputs > 1) {
    message = "Request must carry exactly one of 'code', 'diff', or 'old'/'new'";
    return SonifyError::ConflictingInput;
  }

  SonifyRequest request;
  if (code) {
    request.mode = SonifyMode::Code;
    request.code = std::move(*code);
  } else if (diff) {
    request.mode = SonifyMode::Diff;
    request.diff = std::move(*diff);
  } else {
    request.mode = SonifyMode::VersionPair;
    request.old_code = std::move(*old_code);
    request.new_code = std::move(*new_code);
  }

  if (language) {
    Language parsed = Language::Unknown;
    if (!tryParseLanguage(*language, parsed)) {
      message = "Unknown language: " + *language;
      return SonifyError::InvalidLanguage;
    }
    request.language = parsed;
  }

  if (style) {
    MusicStyle parsed = MusicStyle::Classical;
    if (!tryParseMusicStyle(*style, parsed)) {
      message = "Unknown style: " + *style;
      return SonifyError::InvalidStyle;
    }
    request.style = parsed;
  }

  out = std::move(request);
  return SonifyError::Ok;
}

SonifyResult runRequest(const SonifyRequest& request) {
  SonifyResult result;

  switch (request.mode) {
    case SonifyMode::Code: {
      CodeAnalysis analysis = analyze(request.code, request.language);
      result.composition = assemble(analysis, mapToNotes(analysis, request.style), request.code,
                                    request.style);
      result.analysis = std::move(analysis);
      break;
    }
    case SonifyMode::Diff: {
      DiffSonification diff = sonifyDiff(request.diff, request.style);
      result.composition = std::move(diff.composition);
      result.diff_stats = std::move(diff.stats);
      result.summary = std::move(diff.summary);
      break;
    }
    case SonifyMode::VersionPair: {
      VersionPairSonification pair =
          sonifyTwoVersions(request.old_code, request.new_code, request.style);
      result.composition = std::move(pair.composition);
      result.diff_stats = std::move(pair.stats);
      result.summary = std::move(pair.summary);
      break;
    }
  }

  result.midi = encodeToBinary(result.composition);
  result.success = true;
  return result;
}

SonifyResult sonifyFromJson(const std::string& json) {
  JsonObject fields;
  std::string parse_error;
  if (!parseJsonObject(json.data(), json.size(), fields, parse_error)) {
    return failure(SonifyError::InvalidJson, "Invalid JSON: " + parse_error);
  }

  SonifyRequest request;
  std::string message;
  SonifyError error = requestFromJson(fields, request, message);
  if (error != SonifyError::Ok) {
    return failure(error, message);
  }
  return runRequest(request);
}

}  // namespace codesonify
