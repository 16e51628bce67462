// General MIDI program and channel numbers used by the SMF encoder.

#ifndef CODESONIFY_CORE_GM_PROGRAM_H
#define CODESONIFY_CORE_GM_PROGRAM_H

#include <cstdint>

namespace codesonify {

/// General MIDI program numbers (0-indexed as per MIDI specification).
/// Only the programs the instruments are rendered with are defined here.
namespace GmProgram {

constexpr uint8_t kPiano = 0;             // Acoustic Grand Piano
constexpr uint8_t kOverdrivenGuitar = 30;  // Overdriven Guitar
constexpr uint8_t kFingerBass = 33;        // Electric Bass (finger)
constexpr uint8_t kStringEnsemble = 48;    // String Ensemble 1
constexpr uint8_t kNewAgePad = 88;         // Pad 1 (new age)
constexpr uint8_t kSteelDrums = 115;       // Steel Drums

}  // namespace GmProgram

/// Channel 10 (0-indexed 9) is reserved for drums; no program change is sent.
constexpr uint8_t kPercussionChannel = 9;

}  // namespace codesonify

#endif  // CODESONIFY_CORE_GM_PROGRAM_H
