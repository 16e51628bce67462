/// @file
/// @brief Pitch naming, pitch arithmetic and scale interval tables.

#include "core/pitch_utils.h"

#include <cctype>

namespace codesonify {

std::string Pitch::toString() const {
  int pc = ((pitch_class % 12) + 12) % 12;
  return std::string(kNoteNames[pc]) + std::to_string(octave);
}

Pitch pitchAbove(int root_pc, int offset, int octave) {
  int sum = root_pc + offset;
  Pitch pitch;
  pitch.pitch_class = sum % 12;
  pitch.octave = octave + sum / 12;
  return pitch;
}

bool parsePitchName(const std::string& name, Pitch& out) {
  if (name.empty()) return false;

  size_t pos = 0;
  int base = -1;
  switch (name[pos]) {
    case 'C': base = pitch_class::kC; break;
    case 'D': base = pitch_class::kD; break;
    case 'E': base = pitch_class::kE; break;
    case 'F': base = pitch_class::kF; break;
    case 'G': base = pitch_class::kG; break;
    case 'A': base = pitch_class::kA; break;
    case 'B': base = pitch_class::kB; break;
    default: return false;
  }
  ++pos;

  if (pos < name.size() && name[pos] == '#') {
    base = (base + 1) % 12;
    ++pos;
  }

  if (pos >= name.size()) return false;
  int octave = 0;
  for (; pos < name.size(); ++pos) {
    if (!std::isdigit(static_cast<unsigned char>(name[pos]))) return false;
    octave = octave * 10 + (name[pos] - '0');
  }

  out.pitch_class = base;
  out.octave = octave;
  return true;
}

const std::vector<int>& getScaleIntervals(ScaleType scale) {
  static const std::vector<int> kMajor = {0, 2, 4, 5, 7, 9, 11};
  static const std::vector<int> kMinor = {0, 2, 3, 5, 7, 8, 10};
  static const std::vector<int> kPentatonic = {0, 2, 4, 7, 9};
  static const std::vector<int> kBlues = {0, 3, 5, 6, 7, 10};
  static const std::vector<int> kChromatic = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};
  static const std::vector<int> kDorian = {0, 2, 3, 5, 7, 9, 10};
  static const std::vector<int> kMixolydian = {0, 2, 4, 5, 7, 9, 10};
  static const std::vector<int> kLydian = {0, 2, 4, 6, 7, 9, 11};

  switch (scale) {
    case ScaleType::Major:      return kMajor;
    case ScaleType::Minor:      return kMinor;
    case ScaleType::Pentatonic: return kPentatonic;
    case ScaleType::Blues:      return kBlues;
    case ScaleType::Chromatic:  return kChromatic;
    case ScaleType::Dorian:     return kDorian;
    case ScaleType::Mixolydian: return kMixolydian;
    case ScaleType::Lydian:     return kLydian;
  }
  return kMajor;
}

}  // namespace codesonify
