/// @file
/// @brief Binary MIDI stream helper implementations (VLQ, big-endian I/O, chunks).

#include "midi/midi_stream.h"

namespace codesonify {

void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value) {
  if (value > kMaxVariableLength) {
    value = kMaxVariableLength;
  }

  // Collect 7-bit groups least significant first, then emit in reverse.
  uint8_t encoded[4];
  int num_bytes = 0;

  encoded[num_bytes++] = static_cast<uint8_t>(value & 0x7F);
  value >>= 7;

  while (value > 0) {
    encoded[num_bytes++] = static_cast<uint8_t>((value & 0x7F) | 0x80);
    value >>= 7;
  }

  for (int idx = num_bytes - 1; idx >= 0; --idx) {
    buf.push_back(encoded[idx]);
  }
}

std::vector<uint8_t> encodeVariableLength(uint32_t value) {
  std::vector<uint8_t> buf;
  writeVariableLength(buf, value);
  return buf;
}

uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size) {
  uint32_t result = 0;
  int bytes_read = 0;
  constexpr int kMaxVlqBytes = 4;

  while (offset < max_size && bytes_read < kMaxVlqBytes) {
    uint8_t byte = data[offset++];
    ++bytes_read;
    result = (result << 7) | static_cast<uint32_t>(byte & 0x7F);
    if ((byte & 0x80) == 0) {
      return result;
    }
  }
  return result;
}

void writeBE16(std::vector<uint8_t>& buf, uint16_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

void writeBE32(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint16_t readBE16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>(
      (static_cast<uint16_t>(data[offset]) << 8) |
       static_cast<uint16_t>(data[offset + 1]));
}

uint32_t readBE32(const uint8_t* data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
          static_cast<uint32_t>(data[offset + 3]);
}

void writeMetaEvent(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type,
                    const std::vector<uint8_t>& payload) {
  writeVariableLength(buf, delta);
  buf.push_back(0xFF);
  buf.push_back(type);
  writeVariableLength(buf, static_cast<uint32_t>(payload.size()));
  buf.insert(buf.end(), payload.begin(), payload.end());
}

void writeMetaText(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type,
                   std::string_view text) {
  std::vector<uint8_t> payload(text.begin(), text.end());
  writeMetaEvent(buf, delta, type, payload);
}

void writeChunk(std::vector<uint8_t>& out, const char tag[4],
                const std::vector<uint8_t>& payload) {
  out.insert(out.end(), tag, tag + 4);
  writeBE32(out, static_cast<uint32_t>(payload.size()));
  out.insert(out.end(), payload.begin(), payload.end());
}

}  // namespace codesonify
