#pragma once

#include <stddef.h>
#include <stdint.h>

#include "tuner_state.h"

namespace fmtuner {

inline constexpr size_t kRegisterFrameSize = 5;

// Byte order on the wire, MSB first.
struct RegisterFrame {
  uint8_t bytes[kRegisterFrameSize];
};

struct RegisterFields {
  uint16_t frequency10Khz;
  bool muted;
  bool searchEnabled;
  bool searchUp;
  SearchStopLevel stopLevel;
  bool japanBand;
  bool softMute;

  // Decode-only status, always written as zero.
  bool ready;
  bool stereo;
  bool bandLimit;
  uint8_t signalLevel;
};

namespace registers {

inline constexpr uint8_t kMuteBit = 0x80;
inline constexpr uint8_t kSearchBit = 0x40;
inline constexpr uint8_t kPllHighMask = 0x3F;
inline constexpr uint8_t kStopLevelShift = 6;
inline constexpr uint8_t kStopLevelMask = 0xC0;
inline constexpr uint8_t kSearchUpBit = 0x20;
inline constexpr uint8_t kBandSelectBit = 0x10;
inline constexpr uint8_t kXtalBit = 0x10;
inline constexpr uint8_t kSoftMuteBit = 0x08;
inline constexpr uint8_t kReadyBit = 0x80;
inline constexpr uint8_t kStereoBit = 0x40;
inline constexpr uint8_t kBandLimitBit = 0x20;
inline constexpr uint8_t kSignalLevelMask = 0x0F;

inline constexpr uint16_t kPllWordMax = 0x3FFF;
inline constexpr uint32_t kIntermediateHz = 225000;
inline constexpr uint32_t kReferenceHz = 32768;

// High-side injection: word = 4 * (f + IF) / fref, rounded.
uint32_t pllWordFor(uint16_t frequency10Khz);

// Inverse transform, rounded to 10 kHz.
uint16_t frequencyForPllWord(uint16_t word);

TunerError encode(const RegisterFields& fields, RegisterFrame& frame);

RegisterFields decode(const RegisterFrame& frame);

}  // namespace registers

inline RegisterFields makeTuneFields(uint16_t frequency10Khz, const TunerConfig& config, bool muted) {
  RegisterFields fields{};
  fields.frequency10Khz = frequency10Khz;
  fields.muted = muted;
  fields.searchEnabled = false;
  fields.searchUp = true;
  fields.stopLevel = config.stopLevel;
  fields.japanBand = bandDef(config.band).japanSelect;
  fields.softMute = config.softMute;
  return fields;
}

inline RegisterFields makeSearchFields(uint16_t frequency10Khz,
                                       SeekDirection direction,
                                       const TunerConfig& config,
                                       bool muted) {
  RegisterFields fields = makeTuneFields(frequency10Khz, config, muted);
  fields.searchEnabled = true;
  fields.searchUp = direction == SeekDirection::Up;
  return fields;
}

}  // namespace fmtuner
