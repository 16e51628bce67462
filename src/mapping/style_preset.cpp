/// @file
/// @brief Static style preset table.

#include "mapping/style_preset.h"

#include "core/pitch_utils.h"

namespace codesonify {

namespace {

StylePreset makePreset(MusicStyle style, int base_key, ScaleType scale, int min_bpm,
                       int max_bpm, std::array<Waveform, 2> waveforms,
                       std::array<NoteDuration, 3> bias, float reverb) {
  StylePreset preset;
  preset.style = style;
  preset.base_key = base_key;
  preset.scale = scale;
  preset.min_bpm = min_bpm;
  preset.max_bpm = max_bpm;
  preset.preferred_waveforms = waveforms;
  preset.duration_bias = bias;
  preset.reverb_amount = reverb;
  return preset;
}

}  // namespace

const StylePreset& getStylePreset(MusicStyle style) {
  static const StylePreset kClassical = makePreset(
      MusicStyle::Classical, pitch_class::kC, ScaleType::Major, 80, 130,
      {Waveform::Sine, Waveform::Triangle},
      {NoteDuration::Quarter, NoteDuration::Half, NoteDuration::Eighth}, 0.5f);
  static const StylePreset kElectronic = makePreset(
      MusicStyle::Electronic, pitch_class::kA, ScaleType::Minor, 110, 150,
      {Waveform::Square, Waveform::Sawtooth},
      {NoteDuration::Eighth, NoteDuration::Sixteenth, NoteDuration::Quarter}, 0.3f);
  static const StylePreset kAmbient = makePreset(
      MusicStyle::Ambient, pitch_class::kD, ScaleType::Pentatonic, 60, 90,
      {Waveform::Sine, Waveform::Triangle},
      {NoteDuration::Half, NoteDuration::Whole, NoteDuration::DottedQuarter}, 0.8f);
  static const StylePreset kJazz = makePreset(
      MusicStyle::Jazz, pitch_class::kF, ScaleType::Dorian, 90, 140,
      {Waveform::Sine, Waveform::Triangle},
      {NoteDuration::DottedEighth, NoteDuration::Quarter, NoteDuration::Eighth}, 0.4f);
  static const StylePreset kRock = makePreset(
      MusicStyle::Rock, pitch_class::kE, ScaleType::Blues, 100, 150,
      {Waveform::Sawtooth, Waveform::Square},
      {NoteDuration::Eighth, NoteDuration::Quarter, NoteDuration::Sixteenth}, 0.2f);

  switch (style) {
    case MusicStyle::Classical:  return kClassical;
    case MusicStyle::Electronic: return kElectronic;
    case MusicStyle::Ambient:    return kAmbient;
    case MusicStyle::Jazz:       return kJazz;
    case MusicStyle::Rock:       return kRock;
  }
  return kClassical;
}

}  // namespace codesonify
