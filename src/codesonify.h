// Public entry points: analysis, sonification of code, diffs and version
// pairs, SMF encoding, and the validated request boundary.

#ifndef CODESONIFY_CODESONIFY_H
#define CODESONIFY_CODESONIFY_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "analysis/code_analysis.h"
#include "compose/composition.h"
#include "core/json_parser.h"
#include "diff/diff_parser.h"

namespace codesonify {

// ---------------------------------------------------------------------------
// Pipeline
// ---------------------------------------------------------------------------

/// @brief Analyze source text. Never fails.
CodeAnalysis analyzeCode(const std::string& text,
                         std::optional<Language> language_hint = std::nullopt);

/// @brief Analyze, map and assemble source text into a composition.
/// @param text Source text.
/// @param language_hint Reported language; detected when absent.
/// @param style Style preset for pitch generation.
Composition sonifyCode(const std::string& text,
                       std::optional<Language> language_hint = std::nullopt,
                       MusicStyle style = MusicStyle::Classical);

/// @brief Sonify a unified diff.
Composition sonifyDiffText(const std::string& diff_text, MusicStyle style = MusicStyle::Classical);

/// @brief Sonify the line-by-index difference between two versions.
Composition sonifyVersionPair(const std::string& old_text, const std::string& new_text,
                              MusicStyle style = MusicStyle::Classical);

/// @brief Encode a composition as a Standard MIDI File.
std::vector<uint8_t> encodeToBinary(const Composition& composition);

/// @brief Encode a composition as base64 SMF text.
std::string encodeToBase64(const Composition& composition);

// ---------------------------------------------------------------------------
// Request boundary
// ---------------------------------------------------------------------------

/// Kind of input a request carries.
enum class SonifyMode : uint8_t {
  Code,        // "code"
  Diff,        // "diff"
  VersionPair  // "old" + "new"
};

/// Error codes reported by the request boundary.
enum class SonifyError : uint8_t {
  Ok = 0,
  InvalidJson = 1,
  InvalidField = 2,
  MissingInput = 3,
  ConflictingInput = 4,
  InvalidLanguage = 5,
  InvalidStyle = 6,
};

/// @brief Static description of an error code.
const char* sonifyErrorString(SonifyError error);

/// @brief A validated sonification request.
struct SonifyRequest {
  SonifyMode mode = SonifyMode::Code;
  std::string code;      ///< Source text (Code mode).
  std::string diff;      ///< Unified diff (Diff mode).
  std::string old_code;  ///< Previous version (VersionPair mode).
  std::string new_code;  ///< Current version (VersionPair mode).
  std::optional<Language> language;  ///< Code mode only; detected when absent.
  MusicStyle style = MusicStyle::Classical;
};

/// @brief Outcome of running a request.
///
/// On failure only `success`, `error` and `error_message` are meaningful.
struct SonifyResult {
  bool success = false;
  SonifyError error = SonifyError::Ok;
  std::string error_message;

  Composition composition;
  std::optional<CodeAnalysis> analysis;  ///< Code mode.
  std::optional<DiffStats> diff_stats;   ///< Diff and VersionPair modes.
  std::string summary;                   ///< Diff and VersionPair modes.
  std::vector<uint8_t> midi;
};

/// @brief Build a request from parsed JSON fields.
///
/// Recognized keys: code, diff, old, new, language, style. Exactly one input
/// form must be present; every present field must be a string; language and
/// style must name known values.
///
/// @param fields Parsed top-level JSON object.
/// @param out Receives the request on success.
/// @param message Receives a description on failure.
/// @return SonifyError::Ok on success.
SonifyError requestFromJson(const JsonObject& fields, SonifyRequest& out, std::string& message);

/// @brief Run a request through the pipeline and encode the result.
SonifyResult runRequest(const SonifyRequest& request);

/// @brief Parse, validate and run a JSON request.
/// @param json Request text.
/// @return Result; no composition or MIDI is produced on failure.
SonifyResult sonifyFromJson(const std::string& json);

}  // namespace codesonify

#endif  // CODESONIFY_CODESONIFY_H
