/// @file
/// @brief Chunk walker and event decoder for writer-produced SMF data.

#include "midi/smf_decoder.h"

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <utility>

#include "midi/midi_stream.h"

namespace codesonify {

namespace {

std::string hexByte(uint8_t value) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", value);
  return buf;
}

/// Decode one MTrk body [begin, end) into `track`, updating file-level meta
/// fields in `smf`. Returns an empty string on success.
std::string decodeTrackBody(const uint8_t* data, size_t begin, size_t end, DecodedSmf& smf,
                            DecodedTrack& track) {
  std::vector<size_t> open_notes;  // indices into track.notes
  Tick stream_tick = 0;
  size_t pos = begin;

  while (pos < end) {
    stream_tick += readVariableLength(data, pos, end);
    if (pos >= end) return "event missing after delta time";
    const uint8_t status = data[pos++];

    if (status == 0xFF) {
      if (pos >= end) return "truncated meta event";
      const uint8_t type = data[pos++];
      const uint32_t len = readVariableLength(data, pos, end);
      if (pos + len > end) return "meta event overruns track";
      const char* text = reinterpret_cast<const char*>(data + pos);

      if (type == meta::kTrackName) {
        track.name.assign(text, len);
      } else if (type == meta::kText && smf.text.empty()) {
        smf.text.assign(text, len);
      } else if (type == meta::kTempo && len == 3) {
        uint32_t usec = (static_cast<uint32_t>(data[pos]) << 16) |
                        (static_cast<uint32_t>(data[pos + 1]) << 8) | data[pos + 2];
        if (usec > 0) {
          smf.usec_per_beat = usec;
          smf.bpm = static_cast<int>((kMicrosecondsPerMinute + usec / 2) / usec);
        }
      } else if (type == meta::kTimeSignature && len == 4) {
        smf.numerator = data[pos];
        smf.denominator = static_cast<uint8_t>(1u << (data[pos + 1] & 0x07));
      } else if (type == meta::kEndOfTrack) {
        track.end_tick = stream_tick;
        return pos + len == end ? "" : "data after end of track";
      }
      pos += len;
      continue;
    }

    const uint8_t kind = status & 0xF0;
    const uint8_t channel = status & 0x0F;

    if (kind == 0xC0) {
      if (pos >= end) return "truncated program change";
      track.program = data[pos++];
      track.channel = channel;
    } else if (kind == 0x90 || kind == 0x80) {
      if (pos + 2 > end) return "truncated note event";
      const uint8_t pitch = data[pos];
      const uint8_t velocity = data[pos + 1];
      pos += 2;
      track.channel = channel;

      if (kind == 0x90 && velocity > 0) {
        DecodedNote note;
        note.tick = stream_tick;
        note.pitch = pitch;
        note.velocity = velocity;
        open_notes.push_back(track.notes.size());
        track.notes.push_back(note);
        continue;
      }
      for (auto iter = open_notes.rbegin(); iter != open_notes.rend(); ++iter) {
        DecodedNote& note = track.notes[*iter];
        if (note.pitch == pitch) {
          note.length = stream_tick - note.tick;
          open_notes.erase(std::next(iter).base());
          break;
        }
      }
    } else {
      return "unsupported status byte " + hexByte(status);
    }
  }
  return "missing end of track";
}

}  // namespace

const DecodedTrack* DecodedSmf::findTrack(const std::string& name) const {
  for (const auto& track : tracks) {
    if (track.name == name) return &track;
  }
  return nullptr;
}

size_t DecodedSmf::noteCount() const {
  size_t count = 0;
  for (const auto& track : tracks) count += track.notes.size();
  return count;
}

DecodeResult decodeSmf(const std::vector<uint8_t>& bytes) {
  DecodeResult result;
  const uint8_t* data = bytes.data();
  const size_t size = bytes.size();

  if (size < 14 || std::memcmp(data, "MThd", 4) != 0 || readBE32(data, 4) != 6) {
    result.error_message = "not a Standard MIDI File (bad MThd chunk)";
    return result;
  }
  DecodedSmf& smf = result.smf;
  smf.format = readBE16(data, 8);
  smf.track_count = readBE16(data, 10);
  smf.division = readBE16(data, 12);

  size_t pos = 14;
  for (uint16_t idx = 0; idx < smf.track_count; ++idx) {
    const std::string where = "track " + std::to_string(idx) + ": ";
    if (pos + 8 > size || std::memcmp(data + pos, "MTrk", 4) != 0) {
      result.error_message = where + "missing MTrk chunk";
      return result;
    }
    const uint32_t len = readBE32(data, pos + 4);
    pos += 8;
    if (pos + len > size) {
      result.error_message = where + "chunk length exceeds data";
      return result;
    }

    DecodedTrack track;
    std::string error = decodeTrackBody(data, pos, pos + len, smf, track);
    if (!error.empty()) {
      result.error_message = where + error;
      return result;
    }
    smf.tracks.push_back(std::move(track));
    pos += len;
  }

  result.success = true;
  return result;
}

DecodeResult decodeSmfFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    DecodeResult result;
    result.error_message = "failed to open " + path;
    return result;
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  return decodeSmf(bytes);
}

}  // namespace codesonify
