// Style presets: base key, scale, tempo range and cosmetic biases per style.

#ifndef CODESONIFY_MAPPING_STYLE_PRESET_H
#define CODESONIFY_MAPPING_STYLE_PRESET_H

#include <array>

#include "core/basic_types.h"

namespace codesonify {

/// @brief Fixed parameters of one musical style.
///
/// Only base_key and scale influence generated pitches. The tempo range,
/// waveforms, duration bias and reverb amount are descriptive and are
/// surfaced to presentation layers.
struct StylePreset {
  MusicStyle style = MusicStyle::Classical;
  int base_key = 0;  ///< Tonic pitch class.
  ScaleType scale = ScaleType::Major;
  int min_bpm = 80;
  int max_bpm = 130;
  std::array<Waveform, 2> preferred_waveforms = {Waveform::Sine, Waveform::Triangle};
  std::array<NoteDuration, 3> duration_bias = {NoteDuration::Quarter, NoteDuration::Half,
                                               NoteDuration::Eighth};
  float reverb_amount = 0.5f;
};

/// @brief Look up the preset of a style.
/// @param style Style identifier.
/// @return Reference to a static preset.
const StylePreset& getStylePreset(MusicStyle style);

}  // namespace codesonify

#endif  // CODESONIFY_MAPPING_STYLE_PRESET_H
