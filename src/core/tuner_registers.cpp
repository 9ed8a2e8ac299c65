#include "../../include/tuner_registers.h"

namespace fmtuner::registers {
namespace {

SearchStopLevel stopLevelFromBits(uint8_t bits) {
  switch (bits) {
    case 1:
      return SearchStopLevel::Low;
    case 3:
      return SearchStopLevel::High;
    case 2:
    default:
      return SearchStopLevel::Mid;
  }
}

}  // namespace

uint32_t pllWordFor(uint16_t frequency10Khz) {
  const uint64_t hz = static_cast<uint64_t>(frequency10Khz) * 10000ULL + kIntermediateHz;
  return static_cast<uint32_t>((4ULL * hz + kReferenceHz / 2) / kReferenceHz);
}

uint16_t frequencyForPllWord(uint16_t word) {
  const int64_t hz = static_cast<int64_t>(word) * kReferenceHz / 4 - kIntermediateHz;
  if (hz <= 0) {
    return 0;
  }
  return static_cast<uint16_t>((hz + 5000) / 10000);
}

TunerError encode(const RegisterFields& fields, RegisterFrame& frame) {
  const uint32_t word = pllWordFor(fields.frequency10Khz);
  if (word > kPllWordMax) {
    return TunerError::EncodeOutOfRange;
  }

  uint8_t level = static_cast<uint8_t>(fields.stopLevel);
  if (level < 1 || level > 3) {
    level = static_cast<uint8_t>(SearchStopLevel::Mid);
  }

  RegisterFrame out{};
  out.bytes[0] = static_cast<uint8_t>((word >> 8) & kPllHighMask);
  if (fields.muted) {
    out.bytes[0] |= kMuteBit;
  }
  if (fields.searchEnabled) {
    out.bytes[0] |= kSearchBit;
  }
  out.bytes[1] = static_cast<uint8_t>(word & 0xFF);

  out.bytes[2] = static_cast<uint8_t>(level << kStopLevelShift);
  if (fields.searchUp) {
    out.bytes[2] |= kSearchUpBit;
  }
  if (fields.japanBand) {
    out.bytes[2] |= kBandSelectBit;
  }

  out.bytes[3] = kXtalBit;
  if (fields.softMute) {
    out.bytes[3] |= kSoftMuteBit;
  }

  out.bytes[4] = 0;

  frame = out;
  return TunerError::None;
}

RegisterFields decode(const RegisterFrame& frame) {
  RegisterFields fields{};

  const uint16_t word =
      static_cast<uint16_t>((static_cast<uint16_t>(frame.bytes[0] & kPllHighMask) << 8) | frame.bytes[1]);
  fields.frequency10Khz = frequencyForPllWord(word);
  fields.muted = (frame.bytes[0] & kMuteBit) != 0;
  fields.searchEnabled = (frame.bytes[0] & kSearchBit) != 0;

  fields.stopLevel = stopLevelFromBits(static_cast<uint8_t>((frame.bytes[2] & kStopLevelMask) >> kStopLevelShift));
  fields.searchUp = (frame.bytes[2] & kSearchUpBit) != 0;
  fields.japanBand = (frame.bytes[2] & kBandSelectBit) != 0;

  fields.softMute = (frame.bytes[3] & kSoftMuteBit) != 0;

  fields.ready = (frame.bytes[4] & kReadyBit) != 0;
  fields.stereo = (frame.bytes[4] & kStereoBit) != 0;
  fields.bandLimit = (frame.bytes[4] & kBandLimitBit) != 0;
  fields.signalLevel = static_cast<uint8_t>(frame.bytes[4] & kSignalLevelMask);
  return fields;
}

}  // namespace fmtuner::registers
