// Binary helpers for Standard MIDI File data: variable-length quantities,
// big-endian integers, chunks and meta events.

#ifndef CODESONIFY_MIDI_STREAM_H
#define CODESONIFY_MIDI_STREAM_H

#include <cstdint>
#include <string_view>
#include <vector>

namespace codesonify {

/// Microseconds per minute constant for MIDI tempo meta-events.
constexpr uint32_t kMicrosecondsPerMinute = 60000000;

/// Largest value representable in a 4-byte VLQ.
constexpr uint32_t kMaxVariableLength = 0x0FFFFFFF;

/// Meta event type bytes (FF <type> <len> <data>).
namespace meta {

constexpr uint8_t kText = 0x01;
constexpr uint8_t kTrackName = 0x03;
constexpr uint8_t kEndOfTrack = 0x2F;
constexpr uint8_t kTempo = 0x51;
constexpr uint8_t kTimeSignature = 0x58;

}  // namespace meta

/// @brief Write a variable-length quantity (VLQ) to a byte buffer.
///
/// Seven bits per byte, most significant group first, continuation bit set
/// on every byte but the last. 0 -> 00, 127 -> 7F, 128 -> 81 00.
///
/// @param buf Destination buffer (bytes are appended).
/// @param value The unsigned value to encode (clamped to kMaxVariableLength).
void writeVariableLength(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Encode a VLQ into a fresh buffer.
std::vector<uint8_t> encodeVariableLength(uint32_t value);

/// @brief Read a variable-length quantity from raw MIDI data.
/// @param data Pointer to the raw byte stream.
/// @param offset Current read position; advanced past the VLQ on return.
/// @param max_size Total size of the data buffer (bounds check).
/// @return Decoded unsigned value; a truncated VLQ returns the bits read so far.
uint32_t readVariableLength(const uint8_t* data, size_t& offset, size_t max_size);

/// @brief Write a big-endian uint16 to a byte buffer.
void writeBE16(std::vector<uint8_t>& buf, uint16_t value);

/// @brief Write a big-endian uint32 to a byte buffer.
void writeBE32(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Read a big-endian uint16 from raw data at a given offset.
uint16_t readBE16(const uint8_t* data, size_t offset);

/// @brief Read a big-endian uint32 from raw data at a given offset.
uint32_t readBE32(const uint8_t* data, size_t offset);

/// @brief Append a meta event: delta, FF, type, VLQ length, payload.
/// @param buf Track event buffer.
/// @param delta Delta time in ticks.
/// @param type Meta event type byte.
/// @param payload Event data.
void writeMetaEvent(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type,
                    const std::vector<uint8_t>& payload);

/// @brief Append a text-like meta event whose payload is the raw string bytes.
void writeMetaText(std::vector<uint8_t>& buf, uint32_t delta, uint8_t type,
                   std::string_view text);

/// @brief Append a chunk: 4-byte tag, big-endian 32-bit length, payload.
/// @param out File buffer.
/// @param tag Four ASCII characters ("MThd", "MTrk").
/// @param payload Chunk body.
void writeChunk(std::vector<uint8_t>& out, const char tag[4], const std::vector<uint8_t>& payload);

}  // namespace codesonify

#endif  // CODESONIFY_MIDI_STREAM_H
