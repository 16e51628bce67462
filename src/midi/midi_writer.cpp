/// @file
/// @brief SMF Type 1 MIDI file writer implementation.

#include "midi/midi_writer.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "core/gm_program.h"

namespace codesonify {

namespace {

/// @brief Base-2 logarithm of a power-of-two denominator (4 -> 2).
uint8_t denominatorPower(uint8_t denominator) {
  uint8_t power = 0;
  while (denominator > 1) {
    denominator >>= 1;
    ++power;
  }
  return power;
}

}  // namespace

uint8_t instrumentChannel(Instrument instrument) {
  switch (instrument) {
    case Instrument::Melody:     return 0;
    case Instrument::Bass:       return 1;
    case Instrument::Harmony:    return 2;
    case Instrument::Percussion: return kPercussionChannel;
    case Instrument::Ambient:    return 3;
    case Instrument::Dissonance: return 4;
  }
  return 0;
}

uint8_t instrumentProgram(Instrument instrument) {
  switch (instrument) {
    case Instrument::Melody:     return GmProgram::kPiano;
    case Instrument::Bass:       return GmProgram::kFingerBass;
    case Instrument::Harmony:    return GmProgram::kStringEnsemble;
    case Instrument::Percussion: return GmProgram::kSteelDrums;
    case Instrument::Ambient:    return GmProgram::kNewAgePad;
    case Instrument::Dissonance: return GmProgram::kOverdrivenGuitar;
  }
  return GmProgram::kPiano;
}

Tick secondsToTicks(double seconds, int tempo_bpm) {
  double ticks = std::round(seconds * (tempo_bpm / 60.0) * kTicksPerBeat);
  if (!(ticks > 0.0)) return 0;
  if (ticks > kMaxVariableLength) return kMaxVariableLength;
  return static_cast<Tick>(ticks);
}

uint8_t velocityToMidi(float velocity) {
  long scaled = std::lround(static_cast<double>(velocity) * 127.0);
  return static_cast<uint8_t>(std::clamp(scaled, 1L, 127L));
}

std::string printableAscii(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char chr : text) {
    auto code = static_cast<unsigned char>(chr);
    if (code >= 0x20 && code <= 0x7E) out.push_back(chr);
  }
  return out;
}

std::string generatorText(const Composition& composition) {
  return std::string("Generated by CodeSonify | ") +
         languageToString(composition.metadata.source_language) +
         " | Complexity: " + std::to_string(composition.metadata.complexity) + "/100";
}

MidiWriter::MidiWriter() = default;

void MidiWriter::build(const Composition& composition) {
  data_.clear();
  skipped_notes_ = 0;

  auto total_tracks = static_cast<uint16_t>(composition.tracks.size() + 1);  // +1 tempo track
  writeHeader(total_tracks, kTicksPerBeat);
  writeTempoTrack(composition);

  for (const auto& track : composition.tracks) {
    writeTrack(track, composition.tempo_bpm);
  }

  if (skipped_notes_ > 0) {
    std::fprintf(stderr, "[MidiWriter] WARNING: %zu notes outside MIDI pitch range skipped\n",
                 skipped_notes_);
  }
}

std::vector<uint8_t> MidiWriter::toBytes() const {
  return data_;
}

bool MidiWriter::writeToFile(const std::string& path) const {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    return false;
  }
  size_t written = std::fwrite(data_.data(), 1, data_.size(), file);
  std::fclose(file);
  return written == data_.size();
}

void MidiWriter::writeHeader(uint16_t num_tracks, uint16_t division) {
  std::vector<uint8_t> body;
  writeBE16(body, 1);  // Format: 1 (multi-track)
  writeBE16(body, num_tracks);
  writeBE16(body, division);
  writeChunk(data_, "MThd", body);
}

void MidiWriter::writeTempoTrack(const Composition& composition) {
  std::vector<uint8_t> track_buf;

  writeMetaText(track_buf, 0, meta::kTrackName, printableAscii(composition.title));

  int bpm = composition.tempo_bpm > 0 ? composition.tempo_bpm : static_cast<int>(kReferenceBpm);
  auto usec_per_beat =
      static_cast<uint32_t>(std::lround(static_cast<double>(kMicrosecondsPerMinute) / bpm));
  writeMetaEvent(track_buf, 0, meta::kTempo,
                 {static_cast<uint8_t>((usec_per_beat >> 16) & 0xFF),
                  static_cast<uint8_t>((usec_per_beat >> 8) & 0xFF),
                  static_cast<uint8_t>(usec_per_beat & 0xFF)});

  // nn dd cc bb: numerator, log2(denominator), 24 MIDI clocks/click, 8 32nds/beat
  writeMetaEvent(track_buf, 0, meta::kTimeSignature,
                 {composition.time_signature.numerator,
                  denominatorPower(composition.time_signature.denominator), 0x18, 0x08});

  writeMetaText(track_buf, 0, meta::kText, printableAscii(generatorText(composition)));
  writeMetaEvent(track_buf, 0, meta::kEndOfTrack, {});

  writeChunk(data_, "MTrk", track_buf);
}

void MidiWriter::writeTrack(const Track& track, int tempo_bpm) {
  std::vector<uint8_t> track_buf;
  const uint8_t channel = instrumentChannel(track.instrument);

  writeMetaText(track_buf, 0, meta::kTrackName, printableAscii(track.name));

  if (channel != kPercussionChannel) {
    writeVariableLength(track_buf, 0);
    track_buf.push_back(static_cast<uint8_t>(0xC0 | (channel & 0x0F)));
    track_buf.push_back(instrumentProgram(track.instrument) & 0x7F);
  }

  // Notes go out in start order, each note-on immediately followed by its
  // note-off. The cursor follows the last absolute tick written, so an
  // overlapping note can move it backward; deltas are floored at zero.
  std::vector<const Note*> ordered;
  ordered.reserve(track.notes.size());
  for (const auto& note : track.notes) ordered.push_back(&note);
  std::stable_sort(ordered.begin(), ordered.end(), [](const Note* lhs, const Note* rhs) {
    return lhs->start_seconds < rhs->start_seconds;
  });

  Tick last_tick = 0;
  auto writeChannelEvent = [&](Tick tick, uint8_t status, uint8_t data1, uint8_t data2) {
    writeVariableLength(track_buf, tick > last_tick ? tick - last_tick : 0);
    track_buf.push_back(status);
    track_buf.push_back(data1 & 0x7F);
    track_buf.push_back(data2 & 0x7F);
    last_tick = tick;
  };

  for (const Note* note : ordered) {
    int midi_pitch = note->pitch.toMidi();
    if (midi_pitch < 0 || midi_pitch > 127) {
      ++skipped_notes_;
      continue;
    }
    auto out_pitch = static_cast<uint8_t>(midi_pitch);
    Tick start = secondsToTicks(note->start_seconds, tempo_bpm);

    writeChannelEvent(start, static_cast<uint8_t>(0x90 | (channel & 0x0F)), out_pitch,
                      velocityToMidi(note->velocity));
    writeChannelEvent(start + durationTicks(note->duration),
                      static_cast<uint8_t>(0x80 | (channel & 0x0F)), out_pitch, 0);
  }

  // End of Track directly after the last note-off.
  writeMetaEvent(track_buf, 0, meta::kEndOfTrack, {});

  writeChunk(data_, "MTrk", track_buf);
}

}  // namespace codesonify
