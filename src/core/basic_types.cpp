// Implementation of enum-to-string and string-to-enum conversions.

#include "core/basic_types.h"

namespace codesonify {

const char* tokenKindToString(TokenKind kind) {
  switch (kind) {
    case TokenKind::Function:     return "function";
    case TokenKind::Loop:         return "loop";
    case TokenKind::Conditional:  return "conditional";
    case TokenKind::Variable:     return "variable";
    case TokenKind::Class:        return "class";
    case TokenKind::String:       return "string";
    case TokenKind::Number:       return "number";
    case TokenKind::Operator:     return "operator";
    case TokenKind::Comment:      return "comment";
    case TokenKind::Import:       return "import";
    case TokenKind::ReturnStmt:   return "return";
    case TokenKind::ErrorMarker:  return "error";
    case TokenKind::BracketOpen:  return "bracket_open";
    case TokenKind::BracketClose: return "bracket_close";
    case TokenKind::Whitespace:   return "whitespace";
    case TokenKind::Keyword:      return "keyword";
    case TokenKind::Unknown:      return "unknown";
  }
  return "unknown";
}

const char* languageToString(Language language) {
  switch (language) {
    case Language::TypeScript: return "typescript";
    case Language::JavaScript: return "javascript";
    case Language::Python:     return "python";
    case Language::Java:       return "java";
    case Language::CSharp:     return "csharp";
    case Language::Go:         return "go";
    case Language::Rust:       return "rust";
    case Language::Unknown:    return "unknown";
  }
  return "unknown";
}

bool tryParseLanguage(const std::string& str, Language& out) {
  if (str == "typescript") { out = Language::TypeScript; return true; }
  if (str == "javascript") { out = Language::JavaScript; return true; }
  if (str == "python")     { out = Language::Python;     return true; }
  if (str == "java")       { out = Language::Java;       return true; }
  if (str == "csharp")     { out = Language::CSharp;     return true; }
  if (str == "go")         { out = Language::Go;         return true; }
  if (str == "rust")       { out = Language::Rust;       return true; }
  if (str == "unknown")    { out = Language::Unknown;    return true; }
  return false;
}

Language languageFromString(const std::string& str) {
  Language language = Language::Unknown;
  if (!tryParseLanguage(str, language)) {
    return Language::Unknown;  // Default
  }
  return language;
}

const char* noteDurationToString(NoteDuration dur) {
  switch (dur) {
    case NoteDuration::Sixteenth:     return "16n";
    case NoteDuration::Eighth:        return "8n";
    case NoteDuration::DottedEighth:  return "8n.";
    case NoteDuration::Quarter:       return "4n";
    case NoteDuration::DottedQuarter: return "4n.";
    case NoteDuration::Half:          return "2n";
    case NoteDuration::DottedHalf:    return "2n.";
    case NoteDuration::Whole:         return "1n";
  }
  return "4n";
}

NoteDuration noteDurationFromString(const std::string& str) {
  if (str == "16n") return NoteDuration::Sixteenth;
  if (str == "8n")  return NoteDuration::Eighth;
  if (str == "8n.") return NoteDuration::DottedEighth;
  if (str == "4n")  return NoteDuration::Quarter;
  if (str == "4n.") return NoteDuration::DottedQuarter;
  if (str == "2n")  return NoteDuration::Half;
  if (str == "2n.") return NoteDuration::DottedHalf;
  if (str == "1n")  return NoteDuration::Whole;
  return NoteDuration::Quarter;  // Default
}

double durationSeconds(NoteDuration dur) {
  switch (dur) {
    case NoteDuration::Sixteenth:     return 0.125;
    case NoteDuration::Eighth:        return 0.25;
    case NoteDuration::DottedEighth:  return 0.375;
    case NoteDuration::Quarter:       return 0.5;
    case NoteDuration::DottedQuarter: return 0.75;
    case NoteDuration::Half:          return 1.0;
    case NoteDuration::DottedHalf:    return 1.5;
    case NoteDuration::Whole:         return 2.0;
  }
  return 0.5;
}

Tick durationTicks(NoteDuration dur) {
  switch (dur) {
    case NoteDuration::Sixteenth:     return duration::kSixteenthNote;
    case NoteDuration::Eighth:        return duration::kEighthNote;
    case NoteDuration::DottedEighth:  return duration::kDottedEighth;
    case NoteDuration::Quarter:       return duration::kQuarterNote;
    case NoteDuration::DottedQuarter: return duration::kDottedQuarter;
    case NoteDuration::Half:          return duration::kHalfNote;
    case NoteDuration::DottedHalf:    return duration::kDottedHalf;
    case NoteDuration::Whole:         return duration::kWholeNote;
  }
  return duration::kQuarterNote;
}

const char* scaleTypeToString(ScaleType scale) {
  switch (scale) {
    case ScaleType::Major:      return "major";
    case ScaleType::Minor:      return "minor";
    case ScaleType::Pentatonic: return "pentatonic";
    case ScaleType::Blues:      return "blues";
    case ScaleType::Chromatic:  return "chromatic";
    case ScaleType::Dorian:     return "dorian";
    case ScaleType::Mixolydian: return "mixolydian";
    case ScaleType::Lydian:     return "lydian";
  }
  return "major";
}

const char* instrumentToString(Instrument instrument) {
  switch (instrument) {
    case Instrument::Melody:     return "melody";
    case Instrument::Bass:       return "bass";
    case Instrument::Harmony:    return "harmony";
    case Instrument::Percussion: return "percussion";
    case Instrument::Ambient:    return "ambient";
    case Instrument::Dissonance: return "dissonance";
  }
  return "ambient";
}

const char* waveformToString(Waveform waveform) {
  switch (waveform) {
    case Waveform::Sine:     return "sine";
    case Waveform::Square:   return "square";
    case Waveform::Sawtooth: return "sawtooth";
    case Waveform::Triangle: return "triangle";
  }
  return "sine";
}

const char* effectKindToString(EffectKind kind) {
  switch (kind) {
    case EffectKind::Reverb:     return "reverb";
    case EffectKind::Delay:      return "delay";
    case EffectKind::Distortion: return "distortion";
    case EffectKind::Chorus:     return "chorus";
    case EffectKind::Filter:     return "filter";
  }
  return "reverb";
}

const char* musicStyleToString(MusicStyle style) {
  switch (style) {
    case MusicStyle::Classical:  return "classical";
    case MusicStyle::Electronic: return "electronic";
    case MusicStyle::Ambient:    return "ambient";
    case MusicStyle::Jazz:       return "jazz";
    case MusicStyle::Rock:       return "rock";
  }
  return "classical";
}

bool tryParseMusicStyle(const std::string& str, MusicStyle& out) {
  if (str == "classical")  { out = MusicStyle::Classical;  return true; }
  if (str == "electronic") { out = MusicStyle::Electronic; return true; }
  if (str == "ambient")    { out = MusicStyle::Ambient;    return true; }
  if (str == "jazz")       { out = MusicStyle::Jazz;       return true; }
  if (str == "rock")       { out = MusicStyle::Rock;       return true; }
  return false;
}

MusicStyle musicStyleFromString(const std::string& str) {
  MusicStyle style = MusicStyle::Classical;
  if (!tryParseMusicStyle(str, style)) {
    return MusicStyle::Classical;  // Default
  }
  return style;
}

}  // namespace codesonify
