#pragma once

#include <stdint.h>

namespace hw {
inline constexpr uint8_t kPinTunerPower = 0;
inline constexpr uint8_t kPinI2cSda = 6;
inline constexpr uint8_t kPinI2cScl = 7;
inline constexpr uint8_t kPinEncoderA = 2;
inline constexpr uint8_t kPinEncoderB = 3;
inline constexpr uint8_t kPinEncoderButton = 4;
}  // namespace hw
