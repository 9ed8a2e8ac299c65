#pragma once

#include <stdint.h>

namespace fmtuner {
inline constexpr const char* kFirmwareName = "fmtuner";
inline constexpr const char* kFirmwareVersion = "0.3.0";
inline constexpr uint32_t kSerialBaud = 115200;
inline constexpr uint32_t kInputDebounceMs = 30;
inline constexpr uint32_t kMultiClickWindowMs = 450;
inline constexpr uint32_t kLongPressMs = 700;
inline constexpr uint32_t kVeryLongPressMs = 1800;
inline constexpr uint32_t kTunerPowerSettleMs = 100;

inline constexpr uint8_t kTunerI2cAddress = 0x60;
inline constexpr uint32_t kTunerI2cClockHz = 400000;
inline constexpr uint16_t kI2cTimeoutMs = 50;

// TEA5767 completes a full-band search in well under a second.
inline constexpr uint16_t kSeekPollIntervalMs = 20;
inline constexpr uint8_t kSeekMaxPolls = 50;
inline constexpr bool kSeekWrapOnEdge = true;

inline constexpr uint8_t kEventQueueCapacity = 8;
inline constexpr uint8_t kFavoriteCount = 8;

inline constexpr const char* kDefaultStationId = "france_info";
inline constexpr uint16_t kFallbackDefaultFrequency10Khz = 10550;

inline constexpr const char* kPrefsNamespace = "fmtuner";
inline constexpr const char* kPrefsLastKey = "last";
inline constexpr const char* kPrefsFavoritesKey = "favorites";
inline constexpr const char* kPrefsBandKey = "band";
inline constexpr const char* kPrefsWrapKey = "wrap";
}  // namespace fmtuner
