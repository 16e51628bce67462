// Decoder for the SMF files MidiWriter produces.

#ifndef CODESONIFY_MIDI_SMF_DECODER_H
#define CODESONIFY_MIDI_SMF_DECODER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace codesonify {

/// A note-on paired with the note-off that follows it.
struct DecodedNote {
  Tick tick = 0;    ///< Stream tick of the note-on (running sum of deltas).
  Tick length = 0;  ///< Ticks until the matching note-off, 0 if never closed.
  uint8_t pitch = 0;
  uint8_t velocity = 0;
};

/// One MTrk chunk.
struct DecodedTrack {
  std::string name;
  uint8_t channel = 0;
  int program = -1;  ///< -1 when the track has no program change (drums).
  Tick end_tick = 0;
  std::vector<DecodedNote> notes;  ///< In note-on order.
};

/// Header, tempo-track metadata and tracks of a decoded file.
struct DecodedSmf {
  uint16_t format = 0;
  uint16_t track_count = 0;
  uint16_t division = 0;
  uint32_t usec_per_beat = 500000;
  int bpm = 120;
  uint8_t numerator = 4;
  uint8_t denominator = 4;
  std::string text;
  std::vector<DecodedTrack> tracks;

  const DecodedTrack* findTrack(const std::string& name) const;
  size_t noteCount() const;
};

/// Decode outcome; `smf` is only meaningful when `success` is true.
struct DecodeResult {
  bool success = false;
  std::string error_message;
  DecodedSmf smf;
};

/// @brief Decode an in-memory SMF.
///
/// Accepts the event vocabulary the writer emits: meta events, note-on,
/// note-off and program change, each with an explicit status byte. A
/// note-off closes the most recent open note-on of the same pitch.
/// Anything else (running status, controllers, SysEx) is reported as an
/// error.
DecodeResult decodeSmf(const std::vector<uint8_t>& bytes);

/// @brief Read a file and decode it.
DecodeResult decodeSmfFile(const std::string& path);

}  // namespace codesonify

#endif  // CODESONIFY_MIDI_SMF_DECODER_H
