// SMF Type 1 encoder for compositions.

#ifndef CODESONIFY_MIDI_WRITER_H
#define CODESONIFY_MIDI_WRITER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "compose/composition.h"
#include "core/basic_types.h"
#include "midi/midi_stream.h"

namespace codesonify {

/// @brief MIDI channel an instrument is written on.
uint8_t instrumentChannel(Instrument instrument);

/// @brief General MIDI program of an instrument.
uint8_t instrumentProgram(Instrument instrument);

/// @brief round(seconds * (bpm / 60) * kTicksPerBeat), floored at zero.
Tick secondsToTicks(double seconds, int tempo_bpm);

/// @brief Map a semantic velocity in [0, 1] to a MIDI velocity in [1, 127].
uint8_t velocityToMidi(float velocity);

/// @brief Keep printable ASCII (0x20-0x7E) only.
std::string printableAscii(std::string_view text);

/// @brief Text written into the tempo track describing the source.
std::string generatorText(const Composition& composition);

/// @brief MIDI file writer that produces Standard MIDI File (SMF) Type 1 output.
///
/// The first track carries the title, tempo, time signature and generator
/// text. Every composition track follows as its own MTrk with a name, a
/// program change (except on the drum channel) and its notes in start order,
/// each note-on directly followed by its note-off. Deltas are measured from
/// the last written tick and floored at zero. Identical compositions give
/// byte-identical output.
class MidiWriter {
 public:
  MidiWriter();

  /// @brief Encode a composition, replacing any previously built data.
  /// @param composition Composition to encode.
  void build(const Composition& composition);

  /// @brief Get the binary MIDI data after build().
  /// @return Byte vector containing complete SMF Type 1 data.
  std::vector<uint8_t> toBytes() const;

  /// @brief Write built MIDI data to a file.
  /// @param path Output file path.
  /// @return True if the file was written successfully.
  bool writeToFile(const std::string& path) const;

  /// @brief Notes dropped during the last build() because their pitch fell
  ///        outside 0-127.
  size_t skippedNotes() const { return skipped_notes_; }

 private:
  std::vector<uint8_t> data_;
  size_t skipped_notes_ = 0;

  /// Write the MThd (file header) chunk.
  void writeHeader(uint16_t num_tracks, uint16_t division);

  /// Write the tempo track (title, tempo, meter, generator text).
  void writeTempoTrack(const Composition& composition);

  /// Write one composition track as an MTrk chunk.
  void writeTrack(const Track& track, int tempo_bpm);
};

}  // namespace codesonify

#endif  // CODESONIFY_MIDI_WRITER_H
