#pragma once

#include <stddef.h>
#include <stdint.h>

namespace fmtuner {

enum class FmBand : uint8_t {
  EuropeUs = 0,
  Japan = 1,
};

// Frequencies are in 10 kHz units: 8750 = 87.50 MHz.
struct FmBandDef {
  FmBand id;
  const char* name;
  uint16_t min10Khz;
  uint16_t max10Khz;
  uint16_t default10Khz;
  bool japanSelect;
};

inline constexpr uint16_t kChannelSpacing10Khz = 10;
inline constexpr uint16_t kFineStep10Khz = 10;
inline constexpr uint16_t kCoarseStep10Khz = 100;

inline constexpr FmBandDef kFmBands[] = {
    {FmBand::EuropeUs, "EU/US", 8750, 10800, 8750, false},
    {FmBand::Japan, "JP", 7600, 9100, 7600, true},
};

inline constexpr size_t kFmBandCount = sizeof(kFmBands) / sizeof(kFmBands[0]);

inline constexpr const FmBandDef& bandDef(FmBand band) {
  return kFmBands[static_cast<uint8_t>(band) < kFmBandCount ? static_cast<uint8_t>(band) : 0];
}

inline constexpr FmBand sanitizeBand(uint8_t raw) {
  return raw < kFmBandCount ? static_cast<FmBand>(raw) : FmBand::EuropeUs;
}

inline constexpr bool isWithinBand(const FmBandDef& band, uint16_t frequency10Khz) {
  return frequency10Khz >= band.min10Khz && frequency10Khz <= band.max10Khz;
}

inline constexpr uint16_t clampToBand(const FmBandDef& band, int32_t frequency10Khz) {
  if (frequency10Khz < band.min10Khz) {
    return band.min10Khz;
  }
  if (frequency10Khz > band.max10Khz) {
    return band.max10Khz;
  }
  return static_cast<uint16_t>(frequency10Khz);
}

// Nearest 100 kHz channel, anchored on the band minimum, kept inside the band.
inline constexpr uint16_t snapToChannel(const FmBandDef& band, uint16_t frequency10Khz) {
  const int32_t offset = static_cast<int32_t>(frequency10Khz) - band.min10Khz;
  const int32_t half = kChannelSpacing10Khz / 2;
  int32_t channels = offset >= 0 ? (offset + half) / kChannelSpacing10Khz : -((-offset + half) / kChannelSpacing10Khz);
  return clampToBand(band, band.min10Khz + channels * kChannelSpacing10Khz);
}

}  // namespace fmtuner
