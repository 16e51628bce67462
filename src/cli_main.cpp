/// @file
/// @brief CLI entry point for the CodeSonify MIDI generator.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "codesonify.h"
#include "compose/composition_json.h"
#include "core/basic_types.h"
#include "core/json_parser.h"
#include "core/pitch_utils.h"
#include "core/text_utils.h"
#include "midi/midi_writer.h"
#include "midi/smf_decoder.h"

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string input;
  std::string old_path;
  std::string new_path;
  std::string config_path;
  std::string inspect_path;
  std::string language;
  std::string style;
  std::string output = "output.mid";
  bool diff = false;
  bool json_output = false;
  bool base64 = false;
  bool analyze = false;
  std::string arg_error;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("codesonify_cli - source code to MIDI sonifier\n\n");
  std::printf("Usage: codesonify_cli [options] [FILE]\n\n");
  std::printf("Options:\n");
  std::printf("  --language LANG  Source language (detected when omitted)\n");
  std::printf("  --style STYLE    Style: classical, electronic, ambient, jazz, rock\n");
  std::printf("  --diff           Treat FILE as a unified diff\n");
  std::printf("  --old FILE       Previous version (with --new)\n");
  std::printf("  --new FILE       Current version (with --old)\n");
  std::printf("  --config FILE    JSON request (code | diff | old+new, language, style)\n");
  std::printf("  -o FILE          Output MIDI path (default output.mid)\n");
  std::printf("  --json           Write composition JSON beside the MIDI file\n");
  std::printf("  --base64         Print base64 MIDI to stdout\n");
  std::printf("  --analyze        Print analysis metrics\n");
  std::printf("  --inspect FILE   Decode a MIDI file and list its tracks\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nLanguages:\n");
  std::printf("  typescript, javascript, python, java, csharp, go, rust, unknown\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return False if --help was requested (caller should exit cleanly).
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 ||
        std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      return false;
    }
    if (std::strcmp(argv[idx], "--language") == 0 && idx + 1 < argc) {
      opts.language = argv[++idx];
    } else if (std::strcmp(argv[idx], "--style") == 0 && idx + 1 < argc) {
      opts.style = argv[++idx];
    } else if (std::strcmp(argv[idx], "--old") == 0 && idx + 1 < argc) {
      opts.old_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--new") == 0 && idx + 1 < argc) {
      opts.new_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--inspect") == 0 && idx + 1 < argc) {
      opts.inspect_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--diff") == 0) {
      opts.diff = true;
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--base64") == 0) {
      opts.base64 = true;
    } else if (std::strcmp(argv[idx], "--analyze") == 0) {
      opts.analyze = true;
    } else if (argv[idx][0] == '-' && argv[idx][1] != '\0') {
      opts.arg_error = std::string("unknown or incomplete option ") + argv[idx];
    } else {
      opts.input = argv[idx];
    }
  }
  return true;
}

/// @brief Read a whole file into a string.
bool readTextFile(const std::string& path, std::string& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return false;
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  out = contents.str();
  return true;
}

/// @brief Replace the extension of a path (or append one).
std::string replaceExtension(const std::string& path, const char* suffix) {
  auto dot_pos = path.rfind('.');
  if (dot_pos != std::string::npos && path.find('/', dot_pos) == std::string::npos) {
    return path.substr(0, dot_pos) + suffix;
  }
  return path + suffix;
}

/// @brief Build a request from CLI options.
/// @return False with `error` set when the options are invalid.
bool buildRequest(const CliOptions& opts, codesonify::SonifyRequest& request,
                  std::string& error) {
  if (!opts.config_path.empty()) {
    std::string json;
    if (!readTextFile(opts.config_path, json)) {
      error = "failed to read " + opts.config_path;
      return false;
    }
    codesonify::JsonObject fields;
    std::string parse_error;
    if (!codesonify::parseJsonObject(json.data(), json.size(), fields, parse_error)) {
      error = "invalid JSON in " + opts.config_path + ": " + parse_error;
      return false;
    }
    if (codesonify::requestFromJson(fields, request, error) != codesonify::SonifyError::Ok) {
      return false;
    }
  } else if (!opts.old_path.empty() || !opts.new_path.empty()) {
    if (opts.old_path.empty() || opts.new_path.empty()) {
      error = "--old and --new must be given together";
      return false;
    }
    request.mode = codesonify::SonifyMode::VersionPair;
    if (!readTextFile(opts.old_path, request.old_code)) {
      error = "failed to read " + opts.old_path;
      return false;
    }
    if (!readTextFile(opts.new_path, request.new_code)) {
      error = "failed to read " + opts.new_path;
      return false;
    }
  } else {
    if (opts.input.empty()) {
      error = "no input file (see --help)";
      return false;
    }
    std::string text;
    if (!readTextFile(opts.input, text)) {
      error = "failed to read " + opts.input;
      return false;
    }
    if (opts.diff) {
      request.mode = codesonify::SonifyMode::Diff;
      request.diff = std::move(text);
    } else {
      request.mode = codesonify::SonifyMode::Code;
      request.code = std::move(text);
    }
  }

  // Command-line flags override the config file.
  if (!opts.language.empty()) {
    codesonify::Language language = codesonify::Language::Unknown;
    if (!codesonify::tryParseLanguage(opts.language, language)) {
      error = "unknown language '" + opts.language + "'";
      return false;
    }
    request.language = language;
  }
  if (!opts.style.empty()) {
    codesonify::MusicStyle style = codesonify::MusicStyle::Classical;
    if (!codesonify::tryParseMusicStyle(opts.style, style)) {
      error = "unknown style '" + opts.style + "'";
      return false;
    }
    request.style = style;
  }
  return true;
}

/// @brief Print the header and track list of a MIDI file.
int inspectMidi(const std::string& path) {
  codesonify::DecodeResult decoded = codesonify::decodeSmfFile(path);
  if (!decoded.success) {
    std::fprintf(stderr, "Error: %s: %s\n", path.c_str(), decoded.error_message.c_str());
    return 1;
  }

  const codesonify::DecodedSmf& smf = decoded.smf;
  std::printf("File:      %s\n", path.c_str());
  std::printf("Format:    %u\n", smf.format);
  std::printf("Division:  %u\n", smf.division);
  std::printf("Tempo:     %d BPM\n", smf.bpm);
  std::printf("Meter:     %u/%u\n", smf.numerator, smf.denominator);
  if (!smf.text.empty()) {
    std::printf("Text:      %s\n", smf.text.c_str());
  }
  std::printf("Tracks:    %zu\n\n", smf.tracks.size());

  for (size_t idx = 0; idx < smf.tracks.size(); ++idx) {
    const auto& track = smf.tracks[idx];
    std::printf("  [%zu] %-36s ch=%-2u ", idx, track.name.c_str(), track.channel + 1u);
    if (track.program >= 0) {
      std::printf("program=%-3d ", track.program);
    } else {
      std::printf("program=-   ");
    }
    std::printf("notes=%zu end=%u\n", track.notes.size(), track.end_tick);
  }
  return 0;
}

/// @brief Print analysis metrics.
void printAnalysis(FILE* out, const codesonify::CodeAnalysis& analysis) {
  const codesonify::CodeMetrics& metrics = analysis.metrics;
  std::fprintf(out, "\nAnalysis:\n");
  std::fprintf(out, "  Lines:        %d (code %d, comment %d, empty %d)\n", metrics.total_lines,
              metrics.code_lines, metrics.comment_lines, metrics.empty_lines);
  std::fprintf(out, "  Functions:    %d\n", metrics.function_count);
  std::fprintf(out, "  Loops:        %d\n", metrics.loop_count);
  std::fprintf(out, "  Conditionals: %d\n", metrics.conditional_count);
  std::fprintf(out, "  Variables:    %d\n", metrics.variable_count);
  std::fprintf(out, "  Classes:      %d\n", metrics.class_count);
  std::fprintf(out, "  Imports:      %d\n", metrics.import_count);
  std::fprintf(out, "  Errors:       %d\n", metrics.error_count);
  std::fprintf(out, "  Max depth:    %d\n", metrics.max_nesting_depth);
  std::fprintf(out, "  Complexity:   %d/100\n", metrics.complexity);
  std::fprintf(out, "  Structures:   %zu\n", analysis.structures.size());
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return 0;
  }
  if (!opts.arg_error.empty()) {
    std::fprintf(stderr, "Error: %s\n", opts.arg_error.c_str());
    return 1;
  }

  if (!opts.inspect_path.empty()) {
    return inspectMidi(opts.inspect_path);
  }

  codesonify::SonifyRequest request;
  std::string error;
  if (!buildRequest(opts, request, error)) {
    std::fprintf(stderr, "Error: %s\n", error.c_str());
    return 1;
  }

  codesonify::SonifyResult result = codesonify::runRequest(request);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  // Keep stdout clean for piping when emitting base64.
  FILE* report = opts.base64 ? stderr : stdout;
  const codesonify::Composition& composition = result.composition;

  std::fprintf(report, "codesonify_cli v0.1.0\n");
  std::fprintf(report, "Title:      %s\n", composition.title.c_str());
  std::fprintf(report, "Style:      %s\n", codesonify::musicStyleToString(request.style));
  std::fprintf(report, "Tempo:      %d BPM\n", composition.tempo_bpm);
  std::fprintf(report, "Key:        %s %s\n", codesonify::kNoteNames[composition.key % 12],
               codesonify::scaleTypeToString(composition.scale));
  std::fprintf(report, "Duration:   %.1f s\n", composition.total_duration_seconds);
  std::fprintf(report, "Tracks:     %zu\n", composition.tracks.size());
  std::fprintf(report, "Notes:      %zu\n", composition.noteCount());
  std::fprintf(report, "Hash:       %s\n", composition.metadata.content_hash.c_str());
  std::fprintf(report, "\n%s\n", composition.metadata.interpretation.c_str());

  if (!result.summary.empty() && opts.analyze) {
    std::fprintf(report, "\n%s\n", result.summary.c_str());
  }
  if (opts.analyze && result.analysis) {
    printAnalysis(report, *result.analysis);
  }

  if (opts.base64) {
    std::printf("%s\n", codesonify::encodeBase64(result.midi).c_str());
    return 0;
  }

  std::ofstream midi_file(opts.output, std::ios::binary);
  if (!midi_file.is_open()) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  midi_file.write(reinterpret_cast<const char*>(result.midi.data()),
                  static_cast<std::streamsize>(result.midi.size()));
  midi_file.close();
  if (!midi_file) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  std::printf("\nOutput:     %s (%zu bytes)\n", opts.output.c_str(), result.midi.size());

  if (opts.json_output) {
    std::string json_path = replaceExtension(opts.output, ".json");
    std::ofstream json_file(json_path);
    if (json_file.is_open()) {
      json_file << codesonify::compositionToJson(composition);
      json_file.close();
      std::printf("JSON:       %s\n", json_path.c_str());
    } else {
      std::fprintf(stderr, "Warning: failed to write %s\n", json_path.c_str());
    }

    if (opts.analyze && result.analysis) {
      std::string analysis_path = replaceExtension(opts.output, "_analysis.json");
      std::ofstream analysis_file(analysis_path);
      if (analysis_file.is_open()) {
        analysis_file << codesonify::analysisToJson(*result.analysis);
        analysis_file.close();
        std::printf("Analysis:   %s\n", analysis_path.c_str());
      } else {
        std::fprintf(stderr, "Warning: failed to write %s\n", analysis_path.c_str());
      }
    }
  }

  return 0;
}
