// Signature-based source language detection.

#ifndef CODESONIFY_ANALYSIS_LANGUAGE_DETECTOR_H
#define CODESONIFY_ANALYSIS_LANGUAGE_DETECTOR_H

#include <string>

#include "core/basic_types.h"

namespace codesonify {

/// @brief Count how many signatures of a language match anywhere in text.
/// @param text Full source text.
/// @param language Language whose signatures are tested.
/// @return Number of matching signatures (0 for Language::Unknown).
int languageSignatureScore(const std::string& text, Language language);

/// @brief Detect the language of a source text.
///
/// Every detectable language is scored by languageSignatureScore(). The
/// highest score wins; ties go to the language declared first in the
/// Language enum. A best score of zero yields Language::Unknown.
///
/// @param text Full source text.
/// @return Detected language.
Language detectLanguage(const std::string& text);

}  // namespace codesonify

#endif  // CODESONIFY_ANALYSIS_LANGUAGE_DETECTOR_H
