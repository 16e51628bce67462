/// @file
/// @brief Unified-diff line classification, change statistics and pseudo-diff synthesis.

#include "diff/diff_parser.h"

#include <algorithm>
#include <utility>

#include "core/text_utils.h"

namespace codesonify {

namespace {

bool startsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool isHeaderLine(std::string_view line) {
  return startsWith(line, "+++") || startsWith(line, "---") || startsWith(line, "diff ") ||
         startsWith(line, "index ") || startsWith(line, "@@");
}

}  // namespace

const char* diffLineTypeToString(DiffLineType type) {
  switch (type) {
    case DiffLineType::Header:  return "header";
    case DiffLineType::Added:   return "added";
    case DiffLineType::Removed: return "removed";
    case DiffLineType::Context: return "context";
  }
  return "context";
}

std::vector<DiffLine> parseDiff(std::string_view diff_text) {
  std::vector<DiffLine> parsed;
  int line_number = 0;

  for (const auto& line : splitLines(diff_text)) {
    ++line_number;
    DiffLine entry;
    entry.line_number = line_number;

    if (isHeaderLine(line)) {
      entry.type = DiffLineType::Header;
      entry.content = line;
    } else if (startsWith(line, "+")) {
      entry.type = DiffLineType::Added;
      entry.content = line.substr(1);
    } else if (startsWith(line, "-")) {
      entry.type = DiffLineType::Removed;
      entry.content = line.substr(1);
    } else {
      entry.type = DiffLineType::Context;
      entry.content = line;
    }
    parsed.push_back(std::move(entry));
  }
  return parsed;
}

DiffStats computeDiffStats(const std::vector<DiffLine>& lines) {
  DiffStats stats;
  for (const auto& line : lines) {
    switch (line.type) {
      case DiffLineType::Added:   ++stats.added_lines; break;
      case DiffLineType::Removed: ++stats.removed_lines; break;
      case DiffLineType::Context: ++stats.context_lines; break;
      case DiffLineType::Header:  break;
    }

    if (line.type != DiffLineType::Header || !startsWith(line.content, "+++ ")) continue;
    std::string_view name = line.content;
    name.remove_prefix(4);
    if (startsWith(name, "b/")) name.remove_prefix(2);
    std::string file = trim(name);
    if (!file.empty() && file != "/dev/null") stats.files.push_back(file);
  }

  stats.total_changes = stats.added_lines + stats.removed_lines;
  stats.change_ratio = stats.total_changes > 0
                           ? static_cast<double>(stats.added_lines) / stats.total_changes
                           : 0.5;
  return stats;
}

std::string buildPseudoDiff(std::string_view old_text, std::string_view new_text) {
  const auto old_lines = splitLines(old_text);
  const auto new_lines = splitLines(new_text);

  std::string diff = "--- a/old.code\n+++ b/new.code\n@@ -1 +1 @@\n";
  const size_t max_len = std::max(old_lines.size(), new_lines.size());

  for (size_t idx = 0; idx < max_len; ++idx) {
    const bool has_old = idx < old_lines.size();
    const bool has_new = idx < new_lines.size();

    if (!has_old) {
      diff += "+" + new_lines[idx] + "\n";
    } else if (!has_new) {
      diff += "-" + old_lines[idx] + "\n";
    } else if (old_lines[idx] != new_lines[idx]) {
      diff += "-" + old_lines[idx] + "\n+" + new_lines[idx] + "\n";
    } else {
      diff += " " + old_lines[idx] + "\n";
    }
  }
  return diff;
}

}  // namespace codesonify
